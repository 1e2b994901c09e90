#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "asynckit/api/status.hpp"
#include "asynckit/concurrent/bounded_channel.hpp"
#include "asynckit/concurrent/cancellation.hpp"
#include "asynckit/log/log_manager.hpp"
#include "asynckit/stream/stage_group.hpp"

namespace asynckit {
namespace stream {

struct StreamOptions {
  // Items buffered between two adjacent stages.
  std::size_t buffer_capacity = 64;
};

inline api::Status StreamConsumedStatus() {
  return api::Status::FromModule(api::StatusCode::kInvalidArgument, "stream already consumed",
                                 api::ErrorModule::kStream, 0x0001);
}

// Next() reports this once every item has been handed out.
inline bool IsEndOfStream(const api::Status& status) {
  return concurrent::IsChannelClosed(status);
}

namespace detail {

inline api::Status StageFailed(const std::string& stage, const std::string& what) {
  const std::string message = "stream stage '" + stage + "' failed: " + what;
  log::LogManager::Log(log::LogSeverity::kWarning, message);
  return api::Status::FromModule(api::StatusCode::kInternalError, message,
                                 api::ErrorModule::kStream, 0x0001);
}

template <typename T>
void RunSource(const std::shared_ptr<concurrent::BoundedChannel<T> >& out,
               const concurrent::CancellationToken& token,
               const std::function<api::Status(T*)>& next) {
  for (;;) {
    if (token.IsCancelled()) {
      out->Cancel();
      return;
    }
    T item;
    api::Status st;
    try {
      st = next(&item);
    } catch (const std::exception& ex) {
      st = StageFailed("source", ex.what());
    } catch (...) {
      st = StageFailed("source", "non-std exception");
    }
    if (concurrent::IsChannelClosed(st)) {
      out->Close();
      return;
    }
    if (!st.ok()) {
      out->CloseWithError(st);
      return;
    }
    // Fails only when the pipeline is being torn down.
    if (!out->Push(std::move(item), token).ok()) return;
  }
}

// Moves items from `in` to `out` through `on_item` until `in` ends. `on_item` returns false once
// `out` stopped accepting items, which cancels upstream.
template <typename T, typename U>
void RunStage(const std::string& name, const std::shared_ptr<concurrent::BoundedChannel<T> >& in,
              const std::shared_ptr<concurrent::BoundedChannel<U> >& out,
              const concurrent::CancellationToken& token,
              const std::function<bool(T&, concurrent::BoundedChannel<U>*,
                                       const concurrent::CancellationToken&)>& on_item,
              const std::function<void(concurrent::BoundedChannel<U>*,
                                       const concurrent::CancellationToken&)>& on_end) {
  for (;;) {
    T item;
    const api::Status st = in->Pop(&item, token);
    if (!st.ok()) {
      if (concurrent::IsChannelClosed(st)) {
        if (on_end) on_end(out.get(), token);
        out->Close();
      } else if (st.code() == api::StatusCode::kCancelled) {
        out->Cancel();
      } else {
        out->CloseWithError(st);
      }
      return;
    }

    bool keep_going = false;
    try {
      keep_going = on_item(item, out.get(), token);
    } catch (const std::exception& ex) {
      out->CloseWithError(StageFailed(name, ex.what()));
    } catch (...) {
      out->CloseWithError(StageFailed(name, "non-std exception"));
    }
    if (!keep_going) {
      in->Cancel();
      return;
    }
  }
}

}  // namespace detail

// One-shot pipeline. The source and every stage run on their own thread, connected by bounded
// channels, so a slow consumer stalls producers instead of growing buffers. Threads start on the
// first pull. Order is preserved end to end.
//
// Composition consumes the receiver: after `s1.Map(f)` the stream `s1` reports STREAM_CONSUMED.
// A stage that throws ends the stream with STREAM_STAGE_FAILED after the items produced before the
// failure. Destroying or cancelling a stream stops and joins every stage.
template <typename T>
class Stream {
 public:
  typedef T value_type;
  typedef concurrent::BoundedChannel<T> Channel;

  // Consumed stream.
  Stream() {}
  Stream(Stream&& other)
      : group_(other.TakeGroup()), output_(std::move(other.output_)), options_(other.options_) {}
  Stream& operator=(Stream&& other) {
    if (this != &other) {
      Release();
      std::shared_ptr<detail::StageGroup> group = other.TakeGroup();
      {
        std::lock_guard<std::mutex> lock(group_mu_);
        group_ = std::move(group);
      }
      output_ = std::move(other.output_);
      options_ = other.options_;
    }
    return *this;
  }
  ~Stream() { Release(); }

  static Stream FromVector(const std::vector<T>& items,
                           const StreamOptions& options = StreamOptions()) {
    std::shared_ptr<std::vector<T> > data = std::make_shared<std::vector<T> >(items);
    std::shared_ptr<std::size_t> cursor = std::make_shared<std::size_t>(0);
    return FromGenerator(
        [data, cursor](T* out) -> api::Status {
          if (*cursor >= data->size()) return concurrent::ChannelClosedStatus();
          *out = (*data)[(*cursor)++];
          return api::Status::Ok();
        },
        options);
  }

  // `next` fills one item and returns kOk, returns ChannelClosedStatus() at the end, or any other
  // status to end the stream with that error. Runs on the source thread.
  static Stream FromGenerator(const std::function<api::Status(T*)>& next,
                              const StreamOptions& options = StreamOptions()) {
    if (!next) {
      return Failed(api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                            "stream generator is empty",
                                            api::ErrorModule::kStream),
                    options);
    }
    Stream s;
    s.options_ = options;
    s.group_ = std::make_shared<detail::StageGroup>();
    std::shared_ptr<Channel> out = std::make_shared<Channel>(options.buffer_capacity);
    s.output_ = out;
    const concurrent::CancellationToken token = s.group_->Token();
    s.group_->AddStage([out, token, next]() { detail::RunSource<T>(out, token, next); },
                       [out]() { out->Cancel(); });
    return s;
  }

  // Streams whatever producers push into `channel` until they close it. Cancelling the stream
  // cancels the channel.
  static Stream FromChannel(const std::shared_ptr<Channel>& channel,
                            const StreamOptions& options = StreamOptions()) {
    if (!channel) {
      return Failed(api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                            "stream channel is null", api::ErrorModule::kStream),
                    options);
    }
    Stream s;
    s.options_ = options;
    s.group_ = std::make_shared<detail::StageGroup>();
    s.output_ = channel;
    std::shared_ptr<Channel> captured = channel;
    s.group_->AddStage(std::function<void()>(), [captured]() { captured->Cancel(); });
    return s;
  }

  template <typename F>
  Stream<typename std::decay<typename std::result_of<F(T&)>::type>::type> Map(F fn) {
    typedef typename std::decay<typename std::result_of<F(T&)>::type>::type U;
    return Chain<U>(
        "map",
        [fn](T& item, concurrent::BoundedChannel<U>* out,
             const concurrent::CancellationToken& token) mutable {
          return out->Push(fn(item), token).ok();
        },
        std::function<void(concurrent::BoundedChannel<U>*,
                           const concurrent::CancellationToken&)>());
  }

  template <typename P>
  Stream<T> Filter(P pred) {
    return Chain<T>(
        "filter",
        [pred](T& item, Channel* out, const concurrent::CancellationToken& token) mutable -> bool {
          if (!pred(static_cast<const T&>(item))) return true;
          return out->Push(std::move(item), token).ok();
        },
        std::function<void(Channel*, const concurrent::CancellationToken&)>());
  }

  // Groups of `size` items; the last group may be shorter. size 0 is treated as 1.
  Stream<std::vector<T> > Batch(std::size_t size) {
    typedef std::vector<T> Group;
    const std::size_t n = size == 0 ? 1 : size;
    std::shared_ptr<Group> pending = std::make_shared<Group>();
    return Chain<Group>(
        "batch",
        [pending, n](T& item, concurrent::BoundedChannel<Group>* out,
                     const concurrent::CancellationToken& token) -> bool {
          pending->push_back(std::move(item));
          if (pending->size() < n) return true;
          Group full;
          full.swap(*pending);
          return out->Push(std::move(full), token).ok();
        },
        [pending](concurrent::BoundedChannel<Group>* out,
                  const concurrent::CancellationToken& token) {
          if (pending->empty()) return;
          Group rest;
          rest.swap(*pending);
          const api::Status st = out->Push(std::move(rest), token);
          if (!st.ok()) Trace("final batch dropped: " + st.ToString());
        });
  }

  // Full windows of `size` items, the next window starting `step` items later. Trailing items that
  // never fill a window are dropped. size/step 0 are treated as 1.
  Stream<std::vector<T> > Window(std::size_t size, std::size_t step = 1) {
    typedef std::vector<T> Group;
    const std::size_t n = size == 0 ? 1 : size;
    const std::size_t advance = step == 0 ? 1 : step;
    std::shared_ptr<Group> pending = std::make_shared<Group>();
    return Chain<Group>(
        "window",
        [pending, n, advance](T& item, concurrent::BoundedChannel<Group>* out,
                              const concurrent::CancellationToken& token) -> bool {
          pending->push_back(std::move(item));
          if (pending->size() < n) return true;
          Group window(*pending);
          const std::size_t drop = advance < pending->size() ? advance : pending->size();
          pending->erase(pending->begin(), pending->begin() + static_cast<std::ptrdiff_t>(drop));
          return out->Push(std::move(window), token).ok();
        },
        std::function<void(concurrent::BoundedChannel<Group>*,
                           const concurrent::CancellationToken&)>());
  }

  // 拉取下一个元素（首次调用时启动所有阶段线程）。
  // 返回：
  // - kOk：out 已填充。
  // - IsEndOfStream(status)：流已正常结束。
  // - kCancelled：流被取消。
  // - STREAM_STAGE_FAILED 或数据源返回的错误：流以错误结束。
  // - STREAM_CONSUMED：该流已被组合或终结操作消费。
  // 线程安全：单消费者；Cancel 可在其他线程调用。
  api::Status Next(T* out) {
    if (!output_) return StreamConsumedStatus();
    group_->Start();
    return output_->Pop(out);
  }

  // Drains the stream. Any error discards the collected items.
  api::Result<std::vector<T> > Collect() {
    if (!output_) return api::Result<std::vector<T> >(StreamConsumedStatus());
    std::vector<T> items;
    for (;;) {
      T item;
      const api::Status st = Next(&item);
      if (st.ok()) {
        items.push_back(std::move(item));
        continue;
      }
      Release();
      if (!IsEndOfStream(st)) return api::Result<std::vector<T> >(st);
      return api::Result<std::vector<T> >(std::move(items));
    }
  }

  // acc = fn(acc, item) over every item, in order, on the calling thread.
  template <typename A, typename F>
  api::Result<A> Reduce(A init, F fn) {
    if (!output_) return api::Result<A>(StreamConsumedStatus());
    A acc = init;
    for (;;) {
      T item;
      const api::Status st = Next(&item);
      if (st.ok()) {
        acc = fn(acc, item);
        continue;
      }
      Release();
      if (!IsEndOfStream(st)) return api::Result<A>(st);
      return api::Result<A>(acc);
    }
  }

  api::Result<std::size_t> Count() {
    return Reduce(std::size_t(0), [](std::size_t n, const T&) { return n + 1; });
  }

  // Stops every stage; a blocked or later Next() returns kCancelled. Callable from any thread.
  void Cancel() {
    std::shared_ptr<detail::StageGroup> group;
    {
      std::lock_guard<std::mutex> lock(group_mu_);
      group = group_;
    }
    if (group) group->CancelAll();
  }

  bool consumed() const { return !output_; }

 private:
  template <typename U>
  friend class Stream;

  Stream(const Stream&);
  Stream& operator=(const Stream&);

  static Stream Failed(const api::Status& status, const StreamOptions& options) {
    Stream s;
    s.options_ = options;
    s.group_ = std::make_shared<detail::StageGroup>();
    s.output_ = std::make_shared<Channel>(1);
    s.output_->CloseWithError(status);
    return s;
  }

  static void Trace(const std::string& message) {
    if (log::LogManager::IsVerbose(1)) log::LogManager::Log(log::LogSeverity::kInfo, message);
  }

  template <typename U>
  Stream<U> Chain(const char* stage,
                  const std::function<bool(T&, concurrent::BoundedChannel<U>*,
                                           const concurrent::CancellationToken&)>& on_item,
                  const std::function<void(concurrent::BoundedChannel<U>*,
                                           const concurrent::CancellationToken&)>& on_end) {
    if (!output_) return Stream<U>::Failed(StreamConsumedStatus(), options_);
    Stream<U> next;
    next.options_ = options_;
    next.group_ = TakeGroup();
    std::shared_ptr<Channel> in = std::move(output_);
    std::shared_ptr<concurrent::BoundedChannel<U> > out =
        std::make_shared<concurrent::BoundedChannel<U> >(options_.buffer_capacity);
    next.output_ = out;
    const concurrent::CancellationToken token = next.group_->Token();
    const std::string name(stage);
    next.group_->AddStage(
        [name, in, out, token, on_item, on_end]() {
          detail::RunStage<T, U>(name, in, out, token, on_item, on_end);
        },
        [out]() { out->Cancel(); });
    return next;
  }

  // group_ is written only under group_mu_ so Cancel() may race with the consumer.
  std::shared_ptr<detail::StageGroup> TakeGroup() {
    std::lock_guard<std::mutex> lock(group_mu_);
    std::shared_ptr<detail::StageGroup> group;
    group.swap(group_);
    return group;
  }

  void Release() {
    std::shared_ptr<detail::StageGroup> group = TakeGroup();
    if (group) {
      group->CancelAll();
      group->JoinAll();
    }
    output_.reset();
  }

  mutable std::mutex group_mu_;
  std::shared_ptr<detail::StageGroup> group_;
  std::shared_ptr<Channel> output_;
  StreamOptions options_;
};

}  // namespace stream
}  // namespace asynckit
