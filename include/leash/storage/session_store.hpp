#pragma once

#include <leash/schema/delegation_challenge.hpp>
#include <leash/schema/encoding/scale/encoder.hpp>
#include <leash/schema/execution_record.hpp>
#include <leash/schema/session_key_state.hpp>
#include <leash/storage/rocksdb/storage.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace leash::storage {

using encoder_t = leash::schema::encoding::encoder<
    leash::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t = storage<rocksdb_storage_tag>;

/// A decoded record together with the exact bytes it was decoded from. The
/// bytes are the compare-and-swap expectation for a later write.
template <typename T>
struct versioned final {
  T value;
  leash::schema::bytes_t raw;
};

/// Typed access to sessions, challenges, secondary indexes and the execution
/// ledger.
///
/// Reads are plain point lookups or prefix scans. Every state transition goes
/// through a `transaction`, which is committed with a single conditional
/// write: either all staged records and index entries land, or nothing does
/// and the caller re-reads and retries.
class session_store final {
 public:
  class transaction;

  session_store(encoder_t& encoder, rocksdb_storage_t& storage);

  std::optional<versioned<leash::schema::session_key_state_t>> load_session(
      std::string_view session_key_id) const;
  std::optional<versioned<leash::schema::delegation_challenge_t>>
  load_challenge(std::string_view challenge_id) const;

  /// Session currently holding the wallet's single live slot.
  std::optional<leash::schema::identifier_t> wallet_holder(
      std::string_view wallet_id) const;

  std::vector<leash::schema::identifier_t> wallet_session_ids(
      std::string_view wallet_id) const;
  std::vector<leash::schema::identifier_t> live_session_ids() const;
  std::vector<leash::schema::identifier_t> open_challenge_ids() const;

  /// Ledger of one session in (timestamp, write order) order.
  std::vector<leash::schema::execution_record_t> history(
      std::string_view session_key_id) const;

  /// Unconditional append, used for records that do not move a counter.
  void append_record(const leash::schema::execution_record_t& record) const;

  transaction begin();

 private:
  friend class transaction;

  leash::schema::bytes_t encode(const auto& value) const {
    return encoder_.encode(value);
  }

  encoder_t& encoder_;
  rocksdb_storage_t& storage_;
};

class session_store::transaction final {
 public:
  explicit transaction(session_store& store);

  /// Require the session to be unchanged since `current` was loaded.
  transaction& expect(
      const versioned<leash::schema::session_key_state_t>& current);
  transaction& expect(
      const versioned<leash::schema::delegation_challenge_t>& current);
  transaction& expect_absent_session(std::string_view session_key_id);
  transaction& expect_absent_challenge(std::string_view challenge_id);
  /// Require the wallet's live slot to be held by `holder` (or be empty).
  transaction& expect_wallet_holder(
      std::string_view wallet_id,
      const std::optional<leash::schema::identifier_t>& holder);

  /// Stage the session record together with its wallet and live indexes.
  transaction& put(const leash::schema::session_key_state_t& session);
  /// Stage the challenge record together with the open-challenge index.
  transaction& put(const leash::schema::delegation_challenge_t& challenge);
  transaction& append(const leash::schema::execution_record_t& record);
  transaction& set_wallet_holder(
      std::string_view wallet_id,
      const std::optional<leash::schema::identifier_t>& holder);

  /// False when any expectation no longer holds; nothing is written then.
  [[nodiscard]] bool commit();

 private:
  session_store& store_;
  std::vector<precondition> preconditions_;
  std::vector<mutation> mutations_;
};

}  // namespace leash::storage
