#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include "asynckit/api/status.hpp"
#include "asynckit/concurrent/cancellation.hpp"

namespace asynckit {
namespace concurrent {

#define ASYNCKIT_CHANNEL_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kConcurrent, (detail))

// Status Pop reports once a closed channel has handed out every buffered item.
inline api::Status ChannelClosedStatus() {
  return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kNotFound, "channel closed", 0x0003);
}

inline bool IsChannelClosed(const api::Status& status) {
  return status.hex_code() == ChannelClosedStatus().hex_code();
}

// Bounded multi-producer multi-consumer ring buffer with blocking hand-off.
//
// Push blocks while the buffer is full and Pop blocks while it is empty. Close() lets consumers
// drain what is buffered and then report ChannelClosedStatus() (or the error passed to
// CloseWithError). Cancel() drops buffered items and fails every current and future call with
// kCancelled.
template <typename T>
class BoundedChannel {
 public:
  static_assert(std::is_default_constructible<T>::value,
                "BoundedChannel<T> requires T to be default-constructible");

  explicit BoundedChannel(std::size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity),
        data_(capacity_),
        head_(0),
        tail_(0),
        size_(0),
        closed_(false),
        cancelled_(false) {}

  // timeout_ms = 0 waits without limit. Returns kOk, kTimeout, kCancelled or the close status.
  api::Status Push(T value, const CancellationToken& cancel = CancellationToken(),
                   std::uint32_t timeout_ms = 0) {
    CancellationRegistration wake(cancel, [this]() { WakeAll(); });
    std::unique_lock<std::mutex> lock(mu_);
    const bool ready = WaitLocked(&lock, &not_full_, cancel, timeout_ms, [this]() {
      return cancelled_ || closed_ || size_ < capacity_;
    });
    if (cancelled_ || cancel.IsCancelled()) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kCancelled, "channel push cancelled", 0);
    }
    if (closed_) return close_status_;
    if (!ready) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kTimeout, "channel push timed out", 0);
    }
    PushLocked(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return api::Status::Ok();
  }

  api::Status TryPush(T value) {
    std::unique_lock<std::mutex> lock(mu_);
    if (cancelled_) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kCancelled, "channel cancelled", 0);
    }
    if (closed_) return close_status_;
    if (size_ >= capacity_) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kWouldBlock, "channel is full", 0x0001);
    }
    PushLocked(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return api::Status::Ok();
  }

  // Buffered items are still handed out after Close.
  api::Status Pop(T* out, const CancellationToken& cancel = CancellationToken(),
                  std::uint32_t timeout_ms = 0) {
    if (out == NULL) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kInvalidArgument, "out is null", 0);
    }
    CancellationRegistration wake(cancel, [this]() { WakeAll(); });
    std::unique_lock<std::mutex> lock(mu_);
    const bool ready = WaitLocked(&lock, &not_empty_, cancel, timeout_ms, [this]() {
      return cancelled_ || closed_ || size_ > 0;
    });
    if (cancelled_ || cancel.IsCancelled()) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kCancelled, "channel pop cancelled", 0);
    }
    if (size_ > 0) {
      PopLocked(out);
      lock.unlock();
      not_full_.notify_one();
      return api::Status::Ok();
    }
    if (!ready) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kTimeout, "channel pop timed out", 0);
    }
    return close_status_;
  }

  api::Status TryPop(T* out) {
    if (out == NULL) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kInvalidArgument, "out is null", 0);
    }
    std::unique_lock<std::mutex> lock(mu_);
    if (cancelled_) {
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kCancelled, "channel cancelled", 0);
    }
    if (size_ == 0) {
      if (closed_) return close_status_;
      return ASYNCKIT_CHANNEL_STATUS(api::StatusCode::kWouldBlock, "channel is empty", 0x0002);
    }
    PopLocked(out);
    lock.unlock();
    not_full_.notify_one();
    return api::Status::Ok();
  }

  void Close() { CloseWithError(ChannelClosedStatus()); }

  // Consumers see `status` after draining. First close wins.
  void CloseWithError(const api::Status& status) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_ || cancelled_) return;
      closed_ = true;
      close_status_ = status.ok() ? ChannelClosedStatus() : status;
    }
    WakeAll();
  }

  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (cancelled_) return;
      cancelled_ = true;
      for (std::size_t i = 0; i < data_.size(); ++i) data_[i] = T();
      head_ = 0;
      tail_ = 0;
      size_ = 0;
    }
    WakeAll();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_ || cancelled_;
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return size_;
  }

  std::size_t Capacity() const { return capacity_; }

  bool IsEmpty() const { return Size() == 0; }

  bool IsFull() const {
    std::lock_guard<std::mutex> lock(mu_);
    return size_ >= capacity_;
  }

 private:
  BoundedChannel(const BoundedChannel&);
  BoundedChannel& operator=(const BoundedChannel&);

  template <typename Pred>
  bool WaitLocked(std::unique_lock<std::mutex>* lock, std::condition_variable* cv,
                  const CancellationToken& cancel, std::uint32_t timeout_ms, Pred pred) {
    if (timeout_ms == 0) {
      cv->wait(*lock, [&]() { return pred() || cancel.IsCancelled(); });
      return true;
    }
    return cv->wait_for(*lock, std::chrono::milliseconds(timeout_ms),
                        [&]() { return pred() || cancel.IsCancelled(); });
  }

  void WakeAll() {
    // Taking the lock orders the wake-up after the waiter's predicate check.
    { std::lock_guard<std::mutex> lock(mu_); }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void PushLocked(T&& value) {
    data_[tail_] = std::move(value);
    tail_ = (tail_ + 1) % capacity_;
    ++size_;
  }

  void PopLocked(T* out) {
    *out = std::move(data_[head_]);
    data_[head_] = T();
    head_ = (head_ + 1) % capacity_;
    --size_;
  }

  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::vector<T> data_;
  std::size_t head_;
  std::size_t tail_;
  std::size_t size_;
  bool closed_;
  bool cancelled_;
  api::Status close_status_;
};

#undef ASYNCKIT_CHANNEL_STATUS

}  // namespace concurrent
}  // namespace asynckit
