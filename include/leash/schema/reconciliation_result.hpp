#pragma once

#include <leash/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace leash::schema {

template <uint16_t Version>
struct reconciliation_result;

template <>
struct reconciliation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  amount_t ledger_spent{};
  amount_t counter_spent{};
  bool consistent{};
  uint64_t admitted_count{};
  uint64_t reversed_count{};
  uint64_t rejected_count{};
};

using reconciliation_result_t = reconciliation_result<1>;

}  // namespace leash::schema
