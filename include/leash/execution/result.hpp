#pragma once

#include <leash/schema/session_error_code.hpp>

#include <string>
#include <utility>

namespace leash::execution {

/// Fill code/log of any result struct. The log defaults to the code's name.
template <typename Result>
Result make_error(leash::schema::session_error_code code,
                  std::string log = {}) {
  auto result = Result{};
  result.code = leash::schema::to_code(code);
  result.log =
      log.empty() ? std::string{leash::schema::to_string(code)} : std::move(log);
  return result;
}

}  // namespace leash::execution
