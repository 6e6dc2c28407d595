#pragma once

#include <leash/schema/delegation_request.hpp>
#include <functional>

namespace leash::execution {

/// Hands a persisted challenge to the custody provider. Invoked after the
/// challenge is durable and never while a storage stripe is held; the
/// provider answers later through complete_challenge.
using challenge_dispatcher_t =
    std::function<void(const leash::schema::delegation_request_t& request)>;

challenge_dispatcher_t make_logging_dispatcher();

}  // namespace leash::execution
