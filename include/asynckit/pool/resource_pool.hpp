#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "asynckit/api/status.hpp"
#include "asynckit/concurrent/cancellation.hpp"
#include "asynckit/log/log_manager.hpp"
#include "asynckit/observe/i_event_recorder.hpp"

namespace asynckit {
namespace pool {

#define ASYNCKIT_POOL_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kPool, (detail))

struct PoolOptions {
  std::size_t max_resources = 100;
  // How long Acquire() waits for a checked-out resource to come back; 0 fails at once.
  std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(30000);
};

struct PoolStats {
  std::size_t live = 0;
  std::size_t idle = 0;
  std::size_t in_use = 0;
  std::uint64_t created = 0;
  std::uint64_t destroyed = 0;
  std::uint64_t waits = 0;
  std::uint64_t exhausted = 0;
};

template <typename T>
class ResourceLease;

namespace detail {

template <typename T>
class PoolCore {
 public:
  typedef std::function<api::Result<T*>()> Factory;
  typedef std::function<void(T*)> Closer;

  PoolCore(const std::string& name, const PoolOptions& options, const Factory& factory,
           const Closer& closer, observe::IEventRecorder* recorder)
      : name_(name),
        options_(options),
        factory_(factory),
        closer_(closer),
        recorder_(observe::RecorderOrNull(recorder)),
        in_use_(0),
        creating_(0),
        closed_(false) {}

  ~PoolCore() {
    for (std::size_t i = 0; i < idle_.size(); ++i) closer_(idle_[i]);
  }

  api::Result<T*> Acquire(std::chrono::milliseconds timeout,
                          const concurrent::CancellationToken& cancel) {
    typedef std::chrono::steady_clock Clock;
    const Clock::time_point deadline = Clock::now() + timeout;
    concurrent::CancellationRegistration wake(cancel, [this]() {
      std::lock_guard<std::mutex> lock(mu_);
      cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mu_);
    bool waited = false;
    for (;;) {
      if (closed_) {
        return api::Result<T*>(ASYNCKIT_POOL_STATUS(
            api::StatusCode::kPoolClosed, "pool '" + name_ + "' is closed", 0x0001));
      }
      if (cancel.IsCancelled()) {
        return api::Result<T*>(
            ASYNCKIT_POOL_STATUS(api::StatusCode::kCancelled, "acquire cancelled", 0));
      }
      if (!idle_.empty()) {
        T* resource = idle_.back();
        idle_.pop_back();
        ++in_use_;
        return api::Result<T*>(resource);
      }
      if (LiveLocked() < options_.max_resources) {
        ++creating_;
        lock.unlock();
        api::Result<T*> created = CreateOne();
        lock.lock();
        --creating_;
        if (!created.ok()) {
          // The reserved slot is free again.
          cv_.notify_one();
          return created;
        }
        ++stats_.created;
        if (closed_) {
          ++stats_.destroyed;
          lock.unlock();
          closer_(created.value());
          return api::Result<T*>(ASYNCKIT_POOL_STATUS(
              api::StatusCode::kPoolClosed, "pool '" + name_ + "' is closed", 0x0001));
        }
        ++in_use_;
        return created;
      }
      if (timeout.count() <= 0 || Clock::now() >= deadline) {
        ++stats_.exhausted;
        const std::size_t in_use = in_use_;
        lock.unlock();
        std::ostringstream msg;
        msg << "pool '" << name_ << "' exhausted: " << in_use << "/" << options_.max_resources
            << " resources checked out after " << timeout.count() << " ms";
        observe::EventAttributes attrs;
        attrs.push_back(std::make_pair(std::string("pool"), name_));
        recorder_->RecordEvent("pool.exhausted", attrs);
        return api::Result<T*>(
            ASYNCKIT_POOL_STATUS(api::StatusCode::kPoolExhausted, msg.str(), 0x0001));
      }
      if (!waited) {
        ++stats_.waits;
        waited = true;
      }
      cv_.wait_until(lock, deadline);
    }
  }

  void Return(T* resource, bool invalid) {
    bool keep = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      --in_use_;
      keep = !invalid && !closed_;
      if (keep) {
        idle_.push_back(resource);
      } else {
        ++stats_.destroyed;
      }
    }
    if (!keep) closer_(resource);
    cv_.notify_one();
  }

  api::Status Reserve(std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) {
          return ASYNCKIT_POOL_STATUS(api::StatusCode::kPoolClosed,
                                      "pool '" + name_ + "' is closed", 0x0001);
        }
        if (LiveLocked() >= options_.max_resources) return api::Status::Ok();
        ++creating_;
      }
      api::Result<T*> created = CreateOne();
      bool close_now = false;
      {
        std::lock_guard<std::mutex> lock(mu_);
        --creating_;
        if (!created.ok()) return created.status();
        ++stats_.created;
        if (closed_) {
          ++stats_.destroyed;
          close_now = true;
        } else {
          idle_.push_back(created.value());
        }
      }
      if (close_now) closer_(created.value());
      cv_.notify_one();
    }
    return api::Status::Ok();
  }

  void Trim(std::size_t keep_idle) {
    std::vector<T*> victims;
    {
      std::lock_guard<std::mutex> lock(mu_);
      while (idle_.size() > keep_idle) {
        victims.push_back(idle_.front());
        idle_.erase(idle_.begin());
      }
      stats_.destroyed += victims.size();
    }
    for (std::size_t i = 0; i < victims.size(); ++i) closer_(victims[i]);
  }

  void Shutdown() {
    std::vector<T*> victims;
    std::size_t in_use = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) return;
      closed_ = true;
      victims.swap(idle_);
      stats_.destroyed += victims.size();
      in_use = in_use_;
    }
    cv_.notify_all();
    for (std::size_t i = 0; i < victims.size(); ++i) closer_(victims[i]);
    LogShutdown(victims.size(), in_use);
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  PoolStats Stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    PoolStats out = stats_;
    out.idle = idle_.size();
    out.in_use = in_use_;
    out.live = LiveLocked();
    return out;
  }

  const std::string& name() const { return name_; }
  const PoolOptions& options() const { return options_; }

 private:
  PoolCore(const PoolCore&);
  PoolCore& operator=(const PoolCore&);

  std::size_t LiveLocked() const { return idle_.size() + in_use_ + creating_; }

  void LogShutdown(std::size_t closed_idle, std::size_t in_use) const {
    std::ostringstream msg;
    msg << "pool '" << name_ << "' shut down: closed " << closed_idle << " idle, " << in_use
        << " still checked out";
    log::LogManager::Log(log::LogSeverity::kInfo, msg.str());
  }

  api::Result<T*> CreateOne() {
    try {
      api::Result<T*> created = factory_();
      if (created.ok() && created.value() == NULL) {
        return api::Result<T*>(ASYNCKIT_POOL_STATUS(api::StatusCode::kInternalError,
                                                    "factory returned a null resource", 0));
      }
      return created;
    } catch (const std::exception& ex) {
      return api::Result<T*>(ASYNCKIT_POOL_STATUS(
          api::StatusCode::kInternalError, std::string("factory threw: ") + ex.what(), 0));
    }
  }

  const std::string name_;
  const PoolOptions options_;
  Factory factory_;
  Closer closer_;
  observe::IEventRecorder* recorder_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<T*> idle_;
  std::size_t in_use_;
  std::size_t creating_;
  bool closed_;
  PoolStats stats_;
};

}  // namespace detail

// Scoped ownership of one pooled resource. Returns it to the pool on destruction, or closes it when
// MarkInvalid() was called or the pool has shut down in the meantime.
template <typename T>
class ResourceLease {
 public:
  ResourceLease() : resource_(NULL), invalid_(false) {}
  ResourceLease(ResourceLease&& other)
      : core_(std::move(other.core_)), resource_(other.resource_), invalid_(other.invalid_) {
    other.resource_ = NULL;
    other.invalid_ = false;
  }
  ResourceLease& operator=(ResourceLease&& other) {
    if (this != &other) {
      Release();
      core_ = std::move(other.core_);
      resource_ = other.resource_;
      invalid_ = other.invalid_;
      other.resource_ = NULL;
      other.invalid_ = false;
    }
    return *this;
  }
  ~ResourceLease() { Release(); }

  T* get() const { return resource_; }
  T* operator->() const { return resource_; }
  T& operator*() const { return *resource_; }
  explicit operator bool() const { return resource_ != NULL; }

  // The resource is discarded instead of going back to the idle set.
  void MarkInvalid() { invalid_ = true; }
  bool invalid() const { return invalid_; }

  // Hands the resource back early. Idempotent.
  void Release() {
    if (resource_ == NULL) return;
    T* resource = resource_;
    resource_ = NULL;
    core_->Return(resource, invalid_);
    core_.reset();
    invalid_ = false;
  }

 private:
  template <typename U>
  friend class ResourcePool;

  ResourceLease(const std::shared_ptr<detail::PoolCore<T> >& core, T* resource)
      : core_(core), resource_(resource), invalid_(false) {}

  ResourceLease(const ResourceLease&);
  ResourceLease& operator=(const ResourceLease&);

  std::shared_ptr<detail::PoolCore<T> > core_;
  T* resource_;
  bool invalid_;
};

// Bounded pool of lazily created resources. idle + checked out + being created never exceeds
// max_resources. The factory and closer run without the pool lock held; the closer must not throw.
template <typename T>
class ResourcePool {
 public:
  typedef typename detail::PoolCore<T>::Factory Factory;
  typedef typename detail::PoolCore<T>::Closer Closer;

  ResourcePool(const PoolOptions& options, const Factory& factory,
               const Closer& closer = Closer(), observe::IEventRecorder* recorder = NULL,
               const std::string& name = "pool")
      : core_(std::make_shared<detail::PoolCore<T> >(
            name, options, factory, closer ? closer : Closer(&ResourcePool::DeleteResource),
            recorder)) {}

  // Outstanding leases stay valid; their resources are closed when they come back.
  ~ResourcePool() { core_->Shutdown(); }

  // 获取一个资源。
  // 参数：
  // - timeout: 全部资源被占用时的最长等待时间；0 表示不等待。
  // - cancel: 可选取消信号。
  // 返回：
  // - kOk：value 为持有资源的 ResourceLease。
  // - kPoolExhausted：等待超时仍无可用资源。
  // - kPoolClosed：池已关闭（包括等待期间被关闭）。
  // - kCancelled：等待期间被取消。
  // - 其他：工厂函数返回的错误。
  // 线程安全：线程安全。
  api::Result<ResourceLease<T> > Acquire(std::chrono::milliseconds timeout,
                                         const concurrent::CancellationToken& cancel =
                                             concurrent::CancellationToken()) {
    api::Result<T*> got = core_->Acquire(timeout, cancel);
    if (!got.ok()) return api::Result<ResourceLease<T> >(got.status());
    return api::Result<ResourceLease<T> >(ResourceLease<T>(core_, got.value()));
  }

  // Waits up to PoolOptions::acquire_timeout.
  api::Result<ResourceLease<T> > Acquire() { return Acquire(core_->options().acquire_timeout); }

  // Creates up to `count` idle resources without exceeding max_resources.
  api::Status Reserve(std::size_t count) { return core_->Reserve(count); }

  // Closes idle resources beyond `keep_idle`, oldest first.
  void Trim(std::size_t keep_idle) { core_->Trim(keep_idle); }

  // Closes idle resources and fails current and future Acquire calls with kPoolClosed.
  void Shutdown() { core_->Shutdown(); }

  bool IsClosed() const { return core_->IsClosed(); }
  PoolStats Stats() const { return core_->Stats(); }
  const PoolOptions& options() const { return core_->options(); }

 private:
  ResourcePool(const ResourcePool&);
  ResourcePool& operator=(const ResourcePool&);

  static void DeleteResource(T* resource) { delete resource; }

  std::shared_ptr<detail::PoolCore<T> > core_;
};

#undef ASYNCKIT_POOL_STATUS

}  // namespace pool
}  // namespace asynckit
