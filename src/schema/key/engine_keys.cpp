#include <leash/schema/key/builder.hpp>
#include <leash/schema/key/engine_keys.hpp>

namespace leash::schema::key {

namespace {

leash::schema::bytes_t make_id_key(std::string_view prefix,
                                   std::string_view id) {
  auto key = builder{};
  key.write(prefix).write_identifier(id);
  return std::move(key.data);
}

}  // namespace

leash::schema::bytes_t make_session_key(std::string_view session_key_id) {
  return make_id_key(kSessionKeyPrefix, session_key_id);
}

leash::schema::bytes_t make_challenge_key(std::string_view challenge_id) {
  return make_id_key(kChallengeKeyPrefix, challenge_id);
}

leash::schema::bytes_t make_wallet_active_key(std::string_view wallet_id) {
  return make_id_key(kWalletActiveKeyPrefix, wallet_id);
}

leash::schema::bytes_t make_wallet_session_index_prefix(
    std::string_view wallet_id) {
  return make_id_key(kWalletSessionIndexPrefix, wallet_id);
}

leash::schema::bytes_t make_wallet_session_index_key(
    std::string_view wallet_id,
    std::string_view session_key_id) {
  auto key = builder{};
  key.write(kWalletSessionIndexPrefix)
      .write_identifier(wallet_id)
      .write_identifier(session_key_id);
  return std::move(key.data);
}

leash::schema::bytes_t make_live_session_index_key(
    std::string_view session_key_id) {
  return make_id_key(kLiveSessionIndexPrefix, session_key_id);
}

leash::schema::bytes_t make_open_challenge_index_key(
    std::string_view challenge_id) {
  return make_id_key(kOpenChallengeIndexPrefix, challenge_id);
}

leash::schema::bytes_t make_ledger_prefix(std::string_view session_key_id) {
  return make_id_key(kLedgerPrefix, session_key_id);
}

leash::schema::bytes_t make_ledger_key(std::string_view session_key_id,
                                       timestamp_seconds_t timestamp,
                                       uint64_t sequence,
                                       std::string_view record_id) {
  auto key = builder{};
  key.write(kLedgerPrefix)
      .write_identifier(session_key_id)
      .write_big_endian(timestamp)
      .write_big_endian(sequence)
      .write_identifier(record_id);
  return std::move(key.data);
}

}  // namespace leash::schema::key
