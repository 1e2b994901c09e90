#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "asynckit/api/export.hpp"
#include "asynckit/api/status.hpp"
#include "asynckit/observe/i_event_recorder.hpp"

namespace asynckit {
namespace breaker {

enum class BreakerState { kClosed, kOpen, kHalfOpen };

ASYNCKIT_API const char* BreakerStateName(BreakerState state);

struct BreakerOptions {
  std::uint32_t failure_threshold = 5;
  std::chrono::milliseconds recovery_timeout = std::chrono::milliseconds(60000);
};

struct BreakerStats {
  BreakerState state = BreakerState::kClosed;
  std::uint32_t failure_count = 0;
  std::uint64_t admitted = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t failed = 0;
  std::uint64_t rejected = 0;
  std::uint64_t transitions = 0;
};

// Admission record handed out by Acquire and resolved by exactly one Report or Abandon.
struct BreakerTicket {
  std::uint64_t epoch = 0;
  bool trial = false;
  bool admitted = false;
};

// Per-endpoint failure tracker: Closed -> Open after failure_threshold consecutive failures,
// Open -> HalfOpen once recovery_timeout has elapsed, HalfOpen admits a single trial whose outcome
// closes or re-opens the circuit.
//
// Every transition starts a new epoch. Reports carrying a ticket from an older epoch are ignored, so
// a slow call admitted before the circuit opened cannot close or re-open it later.
class ASYNCKIT_API CircuitBreaker {
 public:
  // failure_threshold 0 is treated as 1.
  CircuitBreaker(const std::string& name, const BreakerOptions& options,
                 observe::IEventRecorder* recorder = NULL);

  // 申请一次调用许可。
  // 参数：
  // - ticket: 输出许可凭据，不可为 NULL。
  // 返回：
  // - kOk：已放行，调用方必须以 Report 或 Abandon 结束该凭据。
  // - kCircuitOpen：熔断打开（detail 0x1），或半开状态下已有试探调用在途（detail 0x2）。
  // - kInvalidArgument：ticket 为 NULL。
  // 线程安全：线程安全。
  api::Status Acquire(BreakerTicket* ticket);

  // Resolves an admitted ticket with the call outcome.
  void Report(const BreakerTicket& ticket, bool success);

  // Resolves an admitted ticket without counting it (e.g. the call never reached the endpoint).
  // An abandoned trial lets the next caller run the trial instead.
  void Abandon(const BreakerTicket& ticket);

  // Acquire, run `fn`, report fn's outcome. Returns the rejection or fn's status.
  api::Status Call(const std::function<api::Status()>& fn);

  // Current state, applying a due Open -> HalfOpen transition first.
  BreakerState State();
  std::uint32_t FailureCount() const;
  BreakerStats Stats();

  // Forces Closed with a zero failure count.
  void Reset();

  const std::string& name() const { return name_; }
  const BreakerOptions& options() const { return options_; }

 private:
  typedef std::chrono::steady_clock Clock;

  struct Transition {
    BreakerState from;
    BreakerState to;
    std::uint32_t failures;
  };

  CircuitBreaker(const CircuitBreaker&);
  CircuitBreaker& operator=(const CircuitBreaker&);

  void MaybeHalfOpenLocked(std::vector<Transition>* out);
  void TransitionLocked(BreakerState to, std::vector<Transition>* out);
  void Publish(const std::vector<Transition>& transitions);

  const std::string name_;
  const BreakerOptions options_;
  observe::IEventRecorder* recorder_;

  mutable std::mutex mu_;
  BreakerState state_;
  std::uint32_t failures_;
  Clock::time_point opened_at_;
  bool trial_in_flight_;
  std::uint64_t epoch_;
  BreakerStats stats_;
};

}  // namespace breaker
}  // namespace asynckit
