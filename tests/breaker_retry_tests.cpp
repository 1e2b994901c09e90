#include "asynckit/breaker/circuit_breaker.hpp"
#include "asynckit/observe/memory_event_recorder.hpp"
#include "asynckit/retry/retry_policy.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

asynckit::breaker::BreakerOptions Options(std::uint32_t threshold, int recovery_ms) {
  asynckit::breaker::BreakerOptions opt;
  opt.failure_threshold = threshold;
  opt.recovery_timeout = std::chrono::milliseconds(recovery_ms);
  return opt;
}

asynckit::api::Status Fail() {
  return asynckit::api::Status(asynckit::api::StatusCode::kTransportError, "reset");
}

asynckit::api::Status Succeed() { return asynckit::api::Status::Ok(); }

}  // namespace

bool TestBreakerOpensAtThreshold() {
  asynckit::breaker::CircuitBreaker breaker("db", Options(3, 60000));
  std::atomic<int> invoked(0);
  const std::function<asynckit::api::Status()> failing = [&invoked]() -> asynckit::api::Status {
    invoked.fetch_add(1);
    return Fail();
  };
  for (int i = 0; i < 2; ++i) {
    if (breaker.Call(failing).code() != asynckit::api::StatusCode::kTransportError) return false;
    if (breaker.State() != asynckit::breaker::BreakerState::kClosed) return false;
  }
  if (breaker.Call(failing).code() != asynckit::api::StatusCode::kTransportError) return false;
  if (breaker.State() != asynckit::breaker::BreakerState::kOpen) return false;

  const asynckit::api::Status rejected = breaker.Call(failing);
  if (rejected.code() != asynckit::api::StatusCode::kCircuitOpen) return false;
  if (rejected.hex_code() != 0x50900001u) return false;
  return invoked.load() == 3 && breaker.Stats().rejected == 1;
}

bool TestSuccessResetsFailureCount() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(3, 60000));
  breaker.Call(Fail);
  breaker.Call(Fail);
  if (breaker.FailureCount() != 2) return false;
  breaker.Call(Succeed);
  if (breaker.FailureCount() != 0) return false;
  breaker.Call(Fail);
  breaker.Call(Fail);
  return breaker.State() == asynckit::breaker::BreakerState::kClosed;
}

bool TestHalfOpenAdmitsSingleTrial() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(1, 30));
  breaker.Call(Fail);
  if (breaker.State() != asynckit::breaker::BreakerState::kOpen) return false;
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  if (breaker.State() != asynckit::breaker::BreakerState::kHalfOpen) return false;

  asynckit::breaker::BreakerTicket trial;
  if (!breaker.Acquire(&trial).ok() || !trial.trial) return false;

  asynckit::breaker::BreakerTicket second;
  const asynckit::api::Status busy = breaker.Acquire(&second);
  if (busy.code() != asynckit::api::StatusCode::kCircuitOpen) return false;
  if (busy.hex_code() != 0x50900002u || second.admitted) return false;

  breaker.Report(trial, true);
  return breaker.State() == asynckit::breaker::BreakerState::kClosed &&
         breaker.FailureCount() == 0;
}

bool TestHalfOpenTrialUnderContention() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(1, 30));
  breaker.Call(Fail);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const int kCallers = 16;
  std::vector<asynckit::breaker::BreakerTicket> tickets(kCallers);
  std::vector<asynckit::api::Status> statuses(kCallers);
  std::atomic<bool> go(false);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; ++i) {
    threads.push_back(std::thread([&breaker, &tickets, &statuses, &go, i]() {
      while (!go.load()) std::this_thread::yield();
      statuses[i] = breaker.Acquire(&tickets[i]);
    }));
  }
  go.store(true);
  for (std::size_t i = 0; i < threads.size(); ++i) threads[i].join();

  int trials = 0;
  int busy = 0;
  int winner = -1;
  for (int i = 0; i < kCallers; ++i) {
    if (tickets[i].admitted && tickets[i].trial && statuses[i].ok()) {
      ++trials;
      winner = i;
    } else if (!tickets[i].admitted && statuses[i].hex_code() == 0x50900002u) {
      ++busy;
    }
  }
  if (trials != 1 || busy != kCallers - 1) return false;
  breaker.Report(tickets[winner], true);
  return breaker.State() == asynckit::breaker::BreakerState::kClosed;
}

bool TestZeroThresholdTreatedAsOne() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(0, 60000));
  if (breaker.options().failure_threshold != 1) return false;
  if (!breaker.Call(Succeed).ok()) return false;
  if (breaker.State() != asynckit::breaker::BreakerState::kClosed) return false;
  breaker.Call(Fail);
  return breaker.State() == asynckit::breaker::BreakerState::kOpen;
}

bool TestFailedTrialReopens() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(2, 30));
  breaker.Call(Fail);
  breaker.Call(Fail);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  if (breaker.Call(Fail).code() != asynckit::api::StatusCode::kTransportError) return false;
  if (breaker.State() != asynckit::breaker::BreakerState::kOpen) return false;
  // The recovery window restarts from the failed trial.
  return breaker.Call(Succeed).code() == asynckit::api::StatusCode::kCircuitOpen;
}

bool TestAbandonedTrialFreesSlot() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(1, 20));
  breaker.Call(Fail);
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  asynckit::breaker::BreakerTicket trial;
  if (!breaker.Acquire(&trial).ok()) return false;
  breaker.Abandon(trial);
  if (breaker.State() != asynckit::breaker::BreakerState::kHalfOpen) return false;
  asynckit::breaker::BreakerTicket next;
  return breaker.Acquire(&next).ok() && next.trial;
}

bool TestStaleReportIgnored() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(2, 60000));
  asynckit::breaker::BreakerTicket slow;
  if (!breaker.Acquire(&slow).ok()) return false;
  breaker.Call(Fail);
  breaker.Call(Fail);
  if (breaker.State() != asynckit::breaker::BreakerState::kOpen) return false;
  // A success admitted before the breaker opened must not close it.
  breaker.Report(slow, true);
  return breaker.State() == asynckit::breaker::BreakerState::kOpen;
}

bool TestConcurrentFailuresOpenOnce() {
  asynckit::observe::MemoryEventRecorder recorder;
  asynckit::breaker::CircuitBreaker breaker("hot", Options(5, 60000), &recorder);
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.push_back(std::thread([&breaker]() {
      for (int i = 0; i < 10; ++i) breaker.Call(Fail);
    }));
  }
  for (std::size_t i = 0; i < threads.size(); ++i) threads[i].join();

  asynckit::breaker::BreakerStats stats = breaker.Stats();
  if (stats.state != asynckit::breaker::BreakerState::kOpen) return false;
  if (stats.transitions != 1) return false;
  if (stats.admitted + stats.rejected != 80) return false;

  const std::vector<asynckit::observe::RecordedEvent> events = recorder.Drain();
  int opened = 0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (events[i].name == "breaker.transition" && events[i].Attribute("to") == "open") ++opened;
  }
  return opened == 1;
}

bool TestCallReportsThrowAsFailure() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(1, 60000));
  bool caught = false;
  try {
    breaker.Call([]() -> asynckit::api::Status { throw std::runtime_error("crash"); });
  } catch (const std::runtime_error&) {
    caught = true;
  }
  return caught && breaker.State() == asynckit::breaker::BreakerState::kOpen;
}

bool TestResetCloses() {
  asynckit::breaker::CircuitBreaker breaker("svc", Options(1, 60000));
  breaker.Call(Fail);
  breaker.Reset();
  return breaker.State() == asynckit::breaker::BreakerState::kClosed &&
         breaker.Call(Succeed).ok() &&
         std::string(asynckit::breaker::BreakerStateName(
             asynckit::breaker::BreakerState::kHalfOpen)) == "half_open";
}

bool TestRetryDelaysGrow() {
  asynckit::retry::RetryOptions opt;
  opt.max_retries = 4;
  opt.backoff_base = std::chrono::milliseconds(100);
  opt.backoff_factor = 2.0;
  asynckit::retry::RetryPolicy policy(opt);

  std::chrono::milliseconds prev(0);
  for (std::uint32_t attempt = 0; attempt <= 4; ++attempt) {
    std::chrono::milliseconds delay(0);
    if (!policy.NextDelay(attempt, asynckit::retry::ErrorKind::kServerError, &delay)) return false;
    if (delay < prev) return false;
    prev = delay;
  }
  std::chrono::milliseconds delay(0);
  policy.NextDelay(3, asynckit::retry::ErrorKind::kTransport, &delay);
  if (delay.count() != 800) return false;
  return !policy.NextDelay(5, asynckit::retry::ErrorKind::kServerError, &delay);
}

bool TestRetryRefusesNonRetryable() {
  asynckit::retry::RetryPolicy policy;
  std::chrono::milliseconds delay(0);
  if (policy.NextDelay(1, asynckit::retry::ErrorKind::kClientError, &delay)) return false;
  if (policy.NextDelay(1, asynckit::retry::ErrorKind::kValidation, &delay)) return false;
  if (policy.NextDelay(1, asynckit::retry::ErrorKind::kCancelled, &delay)) return false;
  if (policy.NextDelay(1, asynckit::retry::ErrorKind::kOther, &delay)) return false;
  return policy.NextDelay(1, asynckit::retry::ErrorKind::kRateLimited, &delay) &&
         policy.NextDelay(1, asynckit::retry::ErrorKind::kTimeout, NULL);
}

bool TestRetryMaxBackoffCaps() {
  asynckit::retry::RetryOptions opt;
  opt.max_retries = 40;
  opt.backoff_base = std::chrono::milliseconds(1000);
  opt.backoff_factor = 10.0;
  opt.max_backoff = std::chrono::milliseconds(5000);
  asynckit::retry::RetryPolicy capped(opt);
  if (capped.BaseDelay(30).count() != 5000) return false;

  opt.max_backoff = std::chrono::milliseconds(0);
  asynckit::retry::RetryPolicy uncapped(opt);
  // Huge exponents saturate instead of overflowing.
  return uncapped.BaseDelay(40).count() == 2147483647LL;
}

bool TestRetryJitterBounds() {
  asynckit::retry::RetryOptions opt;
  opt.max_retries = 10;
  opt.backoff_base = std::chrono::milliseconds(1000);
  opt.backoff_factor = 1.0;
  opt.jitter = 0.25;
  asynckit::retry::RetryPolicy policy(opt);
  bool varied = false;
  std::chrono::milliseconds first(-1);
  for (int i = 0; i < 200; ++i) {
    std::chrono::milliseconds delay(0);
    if (!policy.NextDelay(1, asynckit::retry::ErrorKind::kTransport, &delay)) return false;
    if (delay.count() < 750 || delay.count() > 1250) return false;
    if (first.count() < 0) {
      first = delay;
    } else if (delay != first) {
      varied = true;
    }
  }
  return varied;
}

bool TestRetryValidateOptions() {
  asynckit::retry::RetryOptions opt;
  if (!asynckit::retry::RetryPolicy::ValidateOptions(opt).ok()) return false;
  opt.backoff_factor = 0.5;
  if (asynckit::retry::RetryPolicy::ValidateOptions(opt).code() !=
      asynckit::api::StatusCode::kInvalidArgument) {
    return false;
  }
  opt.backoff_factor = 2.0;
  opt.jitter = 1.5;
  return !asynckit::retry::RetryPolicy::ValidateOptions(opt).ok();
}

bool TestErrorClassification() {
  using asynckit::retry::ClassifyHttpStatus;
  using asynckit::retry::ClassifyStatus;
  using asynckit::retry::ErrorKind;
  if (ClassifyHttpStatus(429) != ErrorKind::kRateLimited) return false;
  if (ClassifyHttpStatus(503) != ErrorKind::kServerError) return false;
  if (ClassifyHttpStatus(408) != ErrorKind::kTimeout) return false;
  if (ClassifyHttpStatus(404) != ErrorKind::kClientError) return false;
  if (ClassifyHttpStatus(501) != ErrorKind::kOther) return false;

  const asynckit::api::Status app(asynckit::api::StatusCode::kApplicationError, "http");
  if (ClassifyStatus(app, 500) != ErrorKind::kServerError) return false;
  if (ClassifyStatus(app, 400) != ErrorKind::kClientError) return false;
  if (ClassifyStatus(asynckit::api::Status(asynckit::api::StatusCode::kTransportError, "x")) !=
      ErrorKind::kTransport) {
    return false;
  }
  if (ClassifyStatus(asynckit::api::Status(asynckit::api::StatusCode::kInvalidArgument, "x")) !=
      ErrorKind::kValidation) {
    return false;
  }
  return std::string(asynckit::retry::ErrorKindName(ErrorKind::kRateLimited)) == "rate_limited" &&
         !asynckit::retry::IsRetryable(ErrorKind::kClientError);
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"breaker_opens_at_threshold", TestBreakerOpensAtThreshold},
      {"success_resets_failure_count", TestSuccessResetsFailureCount},
      {"half_open_admits_single_trial", TestHalfOpenAdmitsSingleTrial},
      {"half_open_trial_under_contention", TestHalfOpenTrialUnderContention},
      {"zero_threshold_treated_as_one", TestZeroThresholdTreatedAsOne},
      {"failed_trial_reopens", TestFailedTrialReopens},
      {"abandoned_trial_frees_slot", TestAbandonedTrialFreesSlot},
      {"stale_report_ignored", TestStaleReportIgnored},
      {"concurrent_failures_open_once", TestConcurrentFailuresOpenOnce},
      {"call_reports_throw_as_failure", TestCallReportsThrowAsFailure},
      {"reset_closes", TestResetCloses},
      {"retry_delays_grow", TestRetryDelaysGrow},
      {"retry_refuses_non_retryable", TestRetryRefusesNonRetryable},
      {"retry_max_backoff_caps", TestRetryMaxBackoffCaps},
      {"retry_jitter_bounds", TestRetryJitterBounds},
      {"retry_validate_options", TestRetryValidateOptions},
      {"error_classification", TestErrorClassification},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
