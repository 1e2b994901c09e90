#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "asynckit/api/export.hpp"

namespace asynckit {
namespace concurrent {

class CancellationState;

// Read side of a one-way cancellation signal. A default-constructed token is never cancelled.
class ASYNCKIT_API CancellationToken {
 public:
  CancellationToken() {}

  bool IsCancelled() const;
  bool CanBeCancelled() const { return static_cast<bool>(state_); }

  // Blocks up to `timeout`. Returns true when cancelled (immediately if already cancelled).
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Runs `callback` once on cancellation, on the cancelling thread. When the token is already
  // cancelled the callback runs inline and 0 is returned; 0 is also returned for a token that
  // can never be cancelled. Callbacks must not call back into Register/Unregister.
  std::uint64_t Register(const std::function<void()>& callback) const;

  // After return the callback is neither running (on another thread) nor scheduled.
  void Unregister(std::uint64_t id) const;

 private:
  friend class CancellationSource;
  explicit CancellationToken(const std::shared_ptr<CancellationState>& state) : state_(state) {}

  std::shared_ptr<CancellationState> state_;
};

class ASYNCKIT_API CancellationSource {
 public:
  CancellationSource();

  // Idempotent. Registered callbacks run on the calling thread.
  void Cancel();
  bool IsCancelled() const;
  CancellationToken Token() const { return CancellationToken(state_); }

 private:
  std::shared_ptr<CancellationState> state_;
};

// Scoped Register/Unregister pair.
class ASYNCKIT_API CancellationRegistration {
 public:
  CancellationRegistration(const CancellationToken& token, const std::function<void()>& callback)
      : token_(token), id_(token.Register(callback)) {}
  ~CancellationRegistration() {
    if (id_ != 0) token_.Unregister(id_);
  }

 private:
  CancellationRegistration(const CancellationRegistration&);
  CancellationRegistration& operator=(const CancellationRegistration&);

  CancellationToken token_;
  std::uint64_t id_;
};

}  // namespace concurrent
}  // namespace asynckit
