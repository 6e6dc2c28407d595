#pragma once

#include <leash/schema/primitives.hpp>
#include <functional>

namespace leash::execution {

/// Current time in Unix seconds.
using time_source_t = std::function<leash::schema::timestamp_seconds_t()>;

time_source_t make_system_time_source();

}  // namespace leash::execution
