#include <leash/schema/key/engine_keys.hpp>
#include <leash/storage/session_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>

namespace leash::storage {

namespace {

namespace key = leash::schema::key;
using leash::schema::bytes_t;
using leash::schema::identifier_t;
using leash::schema::make_bytes;
using leash::schema::make_bytes_view;

template <typename T>
std::optional<versioned<T>> load_versioned(encoder_t& encoder,
                                           const rocksdb_storage_t& storage,
                                           const bytes_t& key) {
  auto raw = storage.get_raw(make_bytes_view(key));
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder.try_decode<T>(make_bytes_view(*raw));
  if (!decoded) {
    leash::common::critical("corrupt record at key {}",
                            leash::schema::to_hex(make_bytes_view(key)));
  }
  return versioned<T>{std::move(decoded.value()), std::move(raw.value())};
}

// Strictly increasing within the process, and across restarts while the wall
// clock does not step back.
uint64_t next_ledger_sequence() {
  static auto last = std::atomic<uint64_t>{0};
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  auto previous = last.load(std::memory_order_relaxed);
  auto next = uint64_t{};
  do {
    next = std::max(now, previous + 1);
  } while (!last.compare_exchange_weak(previous, next,
                                       std::memory_order_relaxed));
  return next;
}

leash::schema::execution_record_t with_sequence(
    leash::schema::execution_record_t record) {
  record.sequence = next_ledger_sequence();
  return record;
}

bytes_t ledger_key_of(const leash::schema::execution_record_t& record) {
  return key::make_ledger_key(record.session_key_id, record.timestamp,
                              record.sequence, record.record_id);
}

std::vector<identifier_t> list_ids(const rocksdb_storage_t& storage,
                                   const bytes_t& prefix) {
  auto ids = std::vector<identifier_t>{};
  for (const auto& [_, value] : storage.list_by_prefix(make_bytes_view(prefix))) {
    ids.push_back(leash::schema::make_string(value));
  }
  return ids;
}

}  // namespace

session_store::session_store(encoder_t& encoder, rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<versioned<leash::schema::session_key_state_t>>
session_store::load_session(std::string_view session_key_id) const {
  return load_versioned<leash::schema::session_key_state_t>(
      encoder_, storage_, key::make_session_key(session_key_id));
}

std::optional<versioned<leash::schema::delegation_challenge_t>>
session_store::load_challenge(std::string_view challenge_id) const {
  return load_versioned<leash::schema::delegation_challenge_t>(
      encoder_, storage_, key::make_challenge_key(challenge_id));
}

std::optional<identifier_t> session_store::wallet_holder(
    std::string_view wallet_id) const {
  auto raw = storage_.get_raw(
      make_bytes_view(key::make_wallet_active_key(wallet_id)));
  if (!raw) {
    return std::nullopt;
  }
  return leash::schema::make_string(*raw);
}

std::vector<identifier_t> session_store::wallet_session_ids(
    std::string_view wallet_id) const {
  return list_ids(storage_, key::make_wallet_session_index_prefix(wallet_id));
}

std::vector<identifier_t> session_store::live_session_ids() const {
  return list_ids(storage_, make_bytes(key::kLiveSessionIndexPrefix));
}

std::vector<identifier_t> session_store::open_challenge_ids() const {
  return list_ids(storage_, make_bytes(key::kOpenChallengeIndexPrefix));
}

std::vector<leash::schema::execution_record_t> session_store::history(
    std::string_view session_key_id) const {
  auto records = std::vector<leash::schema::execution_record_t>{};
  auto prefix = key::make_ledger_prefix(session_key_id);
  for (const auto& [record_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto decoded = encoder_.try_decode<leash::schema::execution_record_t>(
        make_bytes_view(value));
    if (!decoded) {
      leash::common::critical(
          "corrupt ledger record at key {}",
          leash::schema::to_hex(make_bytes_view(record_key)));
    }
    records.push_back(std::move(decoded.value()));
  }
  return records;
}

void session_store::append_record(
    const leash::schema::execution_record_t& record) const {
  auto stamped = with_sequence(record);
  auto record_key = ledger_key_of(stamped);
  storage_.put(encoder_, make_bytes_view(record_key), stamped);
}

session_store::transaction session_store::begin() {
  return transaction{*this};
}

session_store::transaction::transaction(session_store& store)
    : store_{store} {}

session_store::transaction& session_store::transaction::expect(
    const versioned<leash::schema::session_key_state_t>& current) {
  preconditions_.push_back(precondition{
      key::make_session_key(current.value.session_key_id), current.raw});
  return *this;
}

session_store::transaction& session_store::transaction::expect(
    const versioned<leash::schema::delegation_challenge_t>& current) {
  preconditions_.push_back(precondition{
      key::make_challenge_key(current.value.challenge_id), current.raw});
  return *this;
}

session_store::transaction&
session_store::transaction::expect_absent_session(
    std::string_view session_key_id) {
  preconditions_.push_back(
      precondition{key::make_session_key(session_key_id), std::nullopt});
  return *this;
}

session_store::transaction&
session_store::transaction::expect_absent_challenge(
    std::string_view challenge_id) {
  preconditions_.push_back(
      precondition{key::make_challenge_key(challenge_id), std::nullopt});
  return *this;
}

session_store::transaction& session_store::transaction::expect_wallet_holder(
    std::string_view wallet_id,
    const std::optional<identifier_t>& holder) {
  auto expected = std::optional<bytes_t>{};
  if (holder) {
    expected = make_bytes(*holder);
  }
  preconditions_.push_back(
      precondition{key::make_wallet_active_key(wallet_id), expected});
  return *this;
}

session_store::transaction& session_store::transaction::put(
    const leash::schema::session_key_state_t& session) {
  auto id_bytes = make_bytes(session.session_key_id);
  mutations_.push_back(mutation{key::make_session_key(session.session_key_id),
                                store_.encode(session)});
  mutations_.push_back(mutation{
      key::make_wallet_session_index_key(session.wallet_id,
                                         session.session_key_id),
      id_bytes});
  auto live = std::optional<bytes_t>{};
  if (!leash::schema::is_terminal(session.status)) {
    live = id_bytes;
  }
  mutations_.push_back(mutation{
      key::make_live_session_index_key(session.session_key_id), live});
  return *this;
}

session_store::transaction& session_store::transaction::put(
    const leash::schema::delegation_challenge_t& challenge) {
  mutations_.push_back(mutation{key::make_challenge_key(challenge.challenge_id),
                                store_.encode(challenge)});
  auto open = std::optional<bytes_t>{};
  if (challenge.status ==
      leash::schema::challenge_status_t::awaiting_confirmation) {
    open = make_bytes(challenge.challenge_id);
  }
  mutations_.push_back(mutation{
      key::make_open_challenge_index_key(challenge.challenge_id), open});
  return *this;
}

session_store::transaction& session_store::transaction::append(
    const leash::schema::execution_record_t& record) {
  auto stamped = with_sequence(record);
  mutations_.push_back(mutation{ledger_key_of(stamped), store_.encode(stamped)});
  return *this;
}

session_store::transaction& session_store::transaction::set_wallet_holder(
    std::string_view wallet_id,
    const std::optional<identifier_t>& holder) {
  auto value = std::optional<bytes_t>{};
  if (holder) {
    value = make_bytes(*holder);
  }
  mutations_.push_back(
      mutation{key::make_wallet_active_key(wallet_id), value});
  return *this;
}

bool session_store::transaction::commit() {
  auto committed = store_.storage_.conditional_write(preconditions_, mutations_);
  if (!committed) {
    spdlog::debug("conditional write lost a race ({} preconditions)",
                  preconditions_.size());
  }
  return committed;
}

}  // namespace leash::storage
