#include <leash/execution/challenge_dispatcher.hpp>

#include <spdlog/spdlog.h>

namespace leash::execution {

challenge_dispatcher_t make_logging_dispatcher() {
  return [](const leash::schema::delegation_request_t& request) {
    spdlog::info(
        "delegation challenge {} ({}) for session {} wallet {} agent {} "
        "limit {} duration {}s",
        request.challenge_id, leash::schema::to_string(request.kind),
        request.session_key_id, request.wallet_id, request.agent_type,
        leash::schema::to_string(request.spending_limit),
        request.duration_seconds);
  };
}

}  // namespace leash::execution
