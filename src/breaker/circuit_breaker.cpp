#include "asynckit/breaker/circuit_breaker.hpp"

#include <glog/logging.h>

#include <sstream>
#include <utility>

namespace asynckit {
namespace breaker {

#define ASYNCKIT_BREAKER_STATUS(message, detail)                                         \
  api::Status::FromModule(api::StatusCode::kCircuitOpen, (message), api::ErrorModule::kBreaker, \
                          (detail))

const char* BreakerStateName(BreakerState state) {
  switch (state) {
    case BreakerState::kClosed:
      return "closed";
    case BreakerState::kOpen:
      return "open";
    case BreakerState::kHalfOpen:
      return "half_open";
    default:
      return "unknown";
  }
}

namespace {

BreakerOptions Normalized(BreakerOptions options) {
  if (options.failure_threshold == 0) options.failure_threshold = 1;
  return options;
}

}  // namespace

CircuitBreaker::CircuitBreaker(const std::string& name, const BreakerOptions& options,
                               observe::IEventRecorder* recorder)
    : name_(name),
      options_(Normalized(options)),
      recorder_(observe::RecorderOrNull(recorder)),
      state_(BreakerState::kClosed),
      failures_(0),
      trial_in_flight_(false),
      epoch_(1) {}

void CircuitBreaker::TransitionLocked(BreakerState to, std::vector<Transition>* out) {
  Transition t;
  t.from = state_;
  t.to = to;
  t.failures = failures_;
  state_ = to;
  ++epoch_;
  ++stats_.transitions;
  trial_in_flight_ = false;
  if (to == BreakerState::kOpen) {
    opened_at_ = Clock::now();
  } else if (to == BreakerState::kClosed) {
    failures_ = 0;
  }
  out->push_back(t);
}

void CircuitBreaker::MaybeHalfOpenLocked(std::vector<Transition>* out) {
  if (state_ == BreakerState::kOpen && Clock::now() - opened_at_ >= options_.recovery_timeout) {
    TransitionLocked(BreakerState::kHalfOpen, out);
  }
}

void CircuitBreaker::Publish(const std::vector<Transition>& transitions) {
  for (std::size_t i = 0; i < transitions.size(); ++i) {
    const Transition& t = transitions[i];
    LOG(INFO) << "circuit breaker '" << name_ << "' " << BreakerStateName(t.from) << " -> "
              << BreakerStateName(t.to) << " (failures=" << t.failures << ")";
    std::ostringstream failures;
    failures << t.failures;
    observe::EventAttributes attrs;
    attrs.push_back(std::make_pair(std::string("breaker"), name_));
    attrs.push_back(std::make_pair(std::string("from"), std::string(BreakerStateName(t.from))));
    attrs.push_back(std::make_pair(std::string("to"), std::string(BreakerStateName(t.to))));
    attrs.push_back(std::make_pair(std::string("failures"), failures.str()));
    recorder_->RecordEvent("breaker.transition", attrs);
  }
}

api::Status CircuitBreaker::Acquire(BreakerTicket* ticket) {
  if (ticket == NULL) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "ticket is null",
                                   api::ErrorModule::kBreaker);
  }
  *ticket = BreakerTicket();

  std::vector<Transition> transitions;
  api::Status st;
  {
    std::lock_guard<std::mutex> lock(mu_);
    MaybeHalfOpenLocked(&transitions);
    if (state_ == BreakerState::kOpen) {
      st = ASYNCKIT_BREAKER_STATUS("circuit '" + name_ + "' is open", 0x0001);
    } else if (state_ == BreakerState::kHalfOpen && trial_in_flight_) {
      st = ASYNCKIT_BREAKER_STATUS("circuit '" + name_ + "' is half-open with a trial in flight",
                                   0x0002);
    } else {
      ticket->epoch = epoch_;
      ticket->admitted = true;
      if (state_ == BreakerState::kHalfOpen) {
        ticket->trial = true;
        trial_in_flight_ = true;
      }
      ++stats_.admitted;
    }
    if (!st.ok()) ++stats_.rejected;
  }
  Publish(transitions);

  if (!st.ok()) {
    observe::EventAttributes attrs;
    attrs.push_back(std::make_pair(std::string("breaker"), name_));
    recorder_->RecordEvent("breaker.rejected", attrs);
  }
  return st;
}

void CircuitBreaker::Report(const BreakerTicket& ticket, bool success) {
  if (!ticket.admitted) return;
  std::vector<Transition> transitions;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (success) {
      ++stats_.succeeded;
    } else {
      ++stats_.failed;
    }
    if (ticket.epoch != epoch_) {
      VLOG(1) << "circuit breaker '" << name_ << "' ignored a report from epoch " << ticket.epoch;
    } else if (state_ == BreakerState::kHalfOpen) {
      if (ticket.trial) {
        TransitionLocked(success ? BreakerState::kClosed : BreakerState::kOpen, &transitions);
      }
    } else if (state_ == BreakerState::kClosed) {
      if (success) {
        failures_ = 0;
      } else if (++failures_ >= options_.failure_threshold) {
        TransitionLocked(BreakerState::kOpen, &transitions);
      }
    }
  }
  Publish(transitions);
}

void CircuitBreaker::Abandon(const BreakerTicket& ticket) {
  if (!ticket.admitted || !ticket.trial) return;
  std::lock_guard<std::mutex> lock(mu_);
  if (ticket.epoch == epoch_ && state_ == BreakerState::kHalfOpen) trial_in_flight_ = false;
}

api::Status CircuitBreaker::Call(const std::function<api::Status()>& fn) {
  if (!fn) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "fn is empty",
                                   api::ErrorModule::kBreaker);
  }
  BreakerTicket ticket;
  api::Status st = Acquire(&ticket);
  if (!st.ok()) return st;
  try {
    st = fn();
  } catch (...) {
    Report(ticket, false);
    throw;
  }
  Report(ticket, st.ok());
  return st;
}

BreakerState CircuitBreaker::State() {
  std::vector<Transition> transitions;
  BreakerState out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    MaybeHalfOpenLocked(&transitions);
    out = state_;
  }
  Publish(transitions);
  return out;
}

std::uint32_t CircuitBreaker::FailureCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failures_;
}

BreakerStats CircuitBreaker::Stats() {
  std::vector<Transition> transitions;
  BreakerStats out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    MaybeHalfOpenLocked(&transitions);
    out = stats_;
    out.state = state_;
    out.failure_count = failures_;
  }
  Publish(transitions);
  return out;
}

void CircuitBreaker::Reset() {
  std::vector<Transition> transitions;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != BreakerState::kClosed) {
      TransitionLocked(BreakerState::kClosed, &transitions);
    }
    failures_ = 0;
  }
  Publish(transitions);
}

#undef ASYNCKIT_BREAKER_STATUS

}  // namespace breaker
}  // namespace asynckit
