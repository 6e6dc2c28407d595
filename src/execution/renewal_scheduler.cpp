#include <leash/execution/renewal_scheduler.hpp>

#include <spdlog/spdlog.h>

#include <chrono>

namespace leash::execution {

using leash::schema::session_status_t;

renewal_scheduler::renewal_scheduler(leash::storage::session_store& store,
                                     challenge_coordinator& coordinator,
                                     const engine_options& options,
                                     time_source_t clock)
    : store_{store},
      coordinator_{coordinator},
      options_{options},
      clock_{std::move(clock)} {}

renewal_scheduler::~renewal_scheduler() {
  stop();
}

leash::schema::renewal_pass_report_t renewal_scheduler::run_once() {
  auto report = leash::schema::renewal_pass_report_t{};
  auto now = clock_();

  for (const auto& session_key_id : store_.live_session_ids()) {
    ++report.scanned;
    auto current = store_.load_session(session_key_id);
    if (!current) {
      continue;
    }

    if (is_lapsed(current->value, now)) {
      auto outcome = terminate_session(store_, session_key_id,
                                       session_status_t::expired,
                                       std::nullopt, now);
      if (outcome.changed) {
        ++report.sessions_expired;
      }
      continue;
    }

    if (renewal_due(current->value, now, options_)) {
      // A lost race means another pass or writer moved the session; it is
      // reconsidered on the next pass.
      if (coordinator_.try_begin_renew(*current)) {
        ++report.renewals_started;
      }
    }
  }

  report.challenges_expired = coordinator_.expire_stale_challenges();

  if (report.renewals_started != 0 || report.sessions_expired != 0 ||
      report.challenges_expired != 0) {
    spdlog::info(
        "renewal pass: scanned {}, renewals started {}, sessions expired {}, "
        "challenges expired {}",
        report.scanned, report.renewals_started, report.sessions_expired,
        report.challenges_expired);
  } else {
    spdlog::debug("renewal pass: scanned {}, nothing due", report.scanned);
  }
  return report;
}

void renewal_scheduler::start() {
  auto lock = std::scoped_lock{mutex_};
  if (worker_.joinable()) {
    return;
  }
  stopping_ = false;
  worker_ = std::thread{[this] { run(); }};
  spdlog::info("renewal scheduler started (every {}s)",
               options_.renewal_interval_seconds);
}

void renewal_scheduler::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (!worker_.joinable()) {
      return;
    }
    stopping_ = true;
  }
  wake_.notify_all();
  worker_.join();
  spdlog::info("renewal scheduler stopped");
}

void renewal_scheduler::run() {
  auto interval = std::chrono::seconds{
      static_cast<std::chrono::seconds::rep>(options_.renewal_interval_seconds)};
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    lock.unlock();
    run_once();
    lock.lock();
    wake_.wait_for(lock, interval, [this] { return stopping_; });
  }
}

}  // namespace leash::execution
