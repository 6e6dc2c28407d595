#pragma once

#include <leash/execution/challenge_dispatcher.hpp>
#include <leash/execution/time_source.hpp>
#include <leash/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace leash::testing {

inline constexpr leash::schema::timestamp_seconds_t kEpoch = 1'700'000'000;

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline leash::schema::amount_t make_amount(uint64_t value) {
  return leash::schema::amount_t{value};
}

/// Clock that only moves when told to. Copies share the same time.
class manual_clock final {
 public:
  explicit manual_clock(leash::schema::timestamp_seconds_t start = kEpoch)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  leash::schema::timestamp_seconds_t now() const { return now_->load(); }
  void set(leash::schema::timestamp_seconds_t value) { now_->store(value); }
  void advance(leash::schema::duration_seconds_t seconds) {
    now_->fetch_add(seconds);
  }

  leash::execution::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

/// Dispatcher that remembers every delegation request it was handed.
class recording_dispatcher final {
 public:
  recording_dispatcher() : state_{std::make_shared<state>()} {}

  leash::execution::challenge_dispatcher_t dispatcher() const {
    return [state = state_](const leash::schema::delegation_request_t& request) {
      auto lock = std::scoped_lock{state->mutex};
      state->requests.push_back(request);
    };
  }

  std::vector<leash::schema::delegation_request_t> requests() const {
    auto lock = std::scoped_lock{state_->mutex};
    return state_->requests;
  }

 private:
  struct state {
    std::mutex mutex;
    std::vector<leash::schema::delegation_request_t> requests;
  };
  std::shared_ptr<state> state_;
};

}  // namespace leash::testing
