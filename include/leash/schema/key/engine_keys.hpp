#pragma once

#include <leash/schema/primitives.hpp>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key constructors for session state, challenge
// state, secondary indexes and the execution ledger.
namespace leash::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kSessionKeyPrefix{"SYS|STATE|SESSION|"};
inline constexpr std::string_view kChallengeKeyPrefix{"SYS|STATE|CHALLENGE|"};
// Holder of the single live (active or renewing) session of a wallet.
inline constexpr std::string_view kWalletActiveKeyPrefix{
    "SYS|STATE|WALLET_ACTIVE|"};
inline constexpr std::string_view kIndexPrefix{"SYS|INDEX|"};
inline constexpr std::string_view kWalletSessionIndexPrefix{
    "SYS|INDEX|WALLET_SESSION|"};
// Non-terminal sessions; the renewal scheduler scans only this keyspace.
inline constexpr std::string_view kLiveSessionIndexPrefix{
    "SYS|INDEX|LIVE_SESSION|"};
inline constexpr std::string_view kOpenChallengeIndexPrefix{
    "SYS|INDEX|OPEN_CHALLENGE|"};
inline constexpr std::string_view kLedgerPrefix{"SYS|LEDGER|"};

leash::schema::bytes_t make_session_key(std::string_view session_key_id);
leash::schema::bytes_t make_challenge_key(std::string_view challenge_id);
leash::schema::bytes_t make_wallet_active_key(std::string_view wallet_id);
leash::schema::bytes_t make_wallet_session_index_prefix(
    std::string_view wallet_id);
leash::schema::bytes_t make_wallet_session_index_key(
    std::string_view wallet_id,
    std::string_view session_key_id);
leash::schema::bytes_t make_live_session_index_key(
    std::string_view session_key_id);
leash::schema::bytes_t make_open_challenge_index_key(
    std::string_view challenge_id);
leash::schema::bytes_t make_ledger_prefix(std::string_view session_key_id);
/// Ledger keys sort by (session, timestamp, sequence), so records written
/// within one second keep their write order.
leash::schema::bytes_t make_ledger_key(std::string_view session_key_id,
                                       timestamp_seconds_t timestamp,
                                       uint64_t sequence,
                                       std::string_view record_id);

}  // namespace leash::schema::key
