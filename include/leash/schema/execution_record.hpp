#pragma once

#include <leash/schema/execution_outcome.hpp>
#include <leash/schema/primitives.hpp>
#include <leash/schema/wallet_action.hpp>

#include <optional>
#include <string>

// Schema type: execution record.
// Audit: append-only ledger entry. Summing admitted minus reversed amounts
// reconstructs spending_used independently of the session counter.
namespace leash::schema {

template <uint16_t Version>
struct execution_record;

template <>
struct execution_record<1> final {
  uint16_t version{1};
  identifier_t record_id;
  identifier_t session_key_id;
  std::optional<wallet_action_t> action;
  amount_t amount{};
  timestamp_seconds_t timestamp{};
  // Assigned by the store on append; orders records sharing a timestamp.
  uint64_t sequence{};
  execution_outcome_t outcome{execution_outcome_t::admitted};
  // session_error_code of a rejected decision.
  std::optional<uint32_t> rejection_code;
  std::string note;
};

using execution_record_t = execution_record<1>;

}  // namespace leash::schema
