#include "asynckit/concurrent/cancellation.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace asynckit {
namespace concurrent {

class CancellationState {
 public:
  CancellationState() : cancelled_(false), next_id_(1), running_id_(0) {}

  bool IsCancelled() {
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
  }

  bool WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
  }

  std::uint64_t Register(const std::function<void()>& callback) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!cancelled_) {
        const std::uint64_t id = next_id_++;
        callbacks_[id] = callback;
        return id;
      }
    }
    callback();
    return 0;
  }

  void Unregister(std::uint64_t id) {
    std::unique_lock<std::mutex> lock(mu_);
    callbacks_.erase(id);
    if (running_thread_ == std::this_thread::get_id()) return;
    cv_.wait(lock, [this, id]() { return running_id_ != id; });
  }

  void Cancel() {
    std::unique_lock<std::mutex> lock(mu_);
    if (cancelled_) return;
    cancelled_ = true;
    cv_.notify_all();
    running_thread_ = std::this_thread::get_id();
    // One at a time so Unregister can wait for exactly the callback it owns.
    while (!callbacks_.empty()) {
      std::map<std::uint64_t, std::function<void()> >::iterator it = callbacks_.begin();
      const std::function<void()> callback = it->second;
      running_id_ = it->first;
      callbacks_.erase(it);
      lock.unlock();
      callback();
      lock.lock();
      running_id_ = 0;
      cv_.notify_all();
    }
    running_thread_ = std::thread::id();
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_;
  std::uint64_t next_id_;
  std::uint64_t running_id_;
  std::thread::id running_thread_;
  std::map<std::uint64_t, std::function<void()> > callbacks_;
};

bool CancellationToken::IsCancelled() const { return state_ && state_->IsCancelled(); }

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  if (!state_) {
    std::this_thread::sleep_for(timeout);
    return false;
  }
  return state_->WaitFor(timeout);
}

std::uint64_t CancellationToken::Register(const std::function<void()>& callback) const {
  if (!state_) return 0;
  return state_->Register(callback);
}

void CancellationToken::Unregister(std::uint64_t id) const {
  if (state_ && id != 0) state_->Unregister(id);
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationState>()) {}

void CancellationSource::Cancel() { state_->Cancel(); }

bool CancellationSource::IsCancelled() const { return state_->IsCancelled(); }

}  // namespace concurrent
}  // namespace asynckit
