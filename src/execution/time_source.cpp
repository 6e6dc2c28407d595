#include <leash/execution/time_source.hpp>

#include <chrono>

namespace leash::execution {

time_source_t make_system_time_source() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<leash::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now).count());
  };
}

}  // namespace leash::execution
