#pragma once

#include <leash/execution/challenge_coordinator.hpp>
#include <leash/execution/engine_options.hpp>
#include <leash/execution/time_source.hpp>
#include <leash/schema/renewal_pass_report.hpp>
#include <leash/storage/session_store.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace leash::execution {

/// Recurring, stateless pass over the live-session index.
///
/// A pass expires lapsed sessions, opens renewal challenges for auto-renewing
/// sessions inside their look-ahead window and expires stale challenges.
/// Every transition is a guarded conditional write, so overlapping passes
/// (from this process or another instance on the same store) cannot both
/// start a renewal for one session.
class renewal_scheduler final {
 public:
  renewal_scheduler(leash::storage::session_store& store,
                    challenge_coordinator& coordinator,
                    const engine_options& options,
                    time_source_t clock);
  ~renewal_scheduler();

  renewal_scheduler(const renewal_scheduler&) = delete;
  renewal_scheduler& operator=(const renewal_scheduler&) = delete;

  leash::schema::renewal_pass_report_t run_once();

  /// Run passes every renewal_interval_seconds on a background thread.
  void start();
  /// Wake and join the background thread. Safe to call when not started.
  void stop();

 private:
  void run();

  leash::storage::session_store& store_;
  challenge_coordinator& coordinator_;
  const engine_options& options_;
  time_source_t clock_;

  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{};
  std::thread worker_;
};

}  // namespace leash::execution
