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

#include "asynckit/api/export.hpp"
#include "asynckit/api/status.hpp"
#include "asynckit/concurrent/cancellation.hpp"
#include "asynckit/log/log_manager.hpp"
#include "asynckit/observe/i_event_recorder.hpp"
#include "asynckit/task/iexecutor.hpp"

namespace asynckit {
namespace task {

struct RunnerOptions {
  std::size_t max_workers = 10;
  // Applied to tasks that carry no timeout of their own; 0 disables.
  std::chrono::milliseconds default_timeout = std::chrono::milliseconds(30000);
  bool fail_fast = false;
  // Cap on OS threads of the runner-owned executor, counting threads still busy with bodies that
  // already timed out.
  std::size_t max_threads = 256;
};

// What a running task body can observe about itself.
struct TaskContext {
  std::size_t index = 0;
  std::string id;
  concurrent::CancellationToken cancel;
  bool has_deadline = false;
  std::chrono::steady_clock::time_point deadline;

  bool IsCancelled() const { return cancel.IsCancelled(); }
};

template <typename T>
struct Task {
  typedef std::function<api::Result<T>(const TaskContext&)> Body;

  std::string id;
  Body fn;
  // 0 falls back to RunOptions::timeout.
  std::chrono::milliseconds timeout = std::chrono::milliseconds(0);
  TaskPriority priority = TaskPriority::kNormal;

  Task() {}
  Task(const std::string& task_id, const Body& body) : id(task_id), fn(body) {}
  Task(const std::string& task_id, const Body& body, std::chrono::milliseconds task_timeout)
      : id(task_id), fn(body), timeout(task_timeout) {}
};

struct RunOptions {
  std::size_t max_workers = 10;
  bool fail_fast = false;
  // Default per-task timeout; 0 disables.
  std::chrono::milliseconds timeout = std::chrono::milliseconds(0);
  concurrent::CancellationToken cancel;
};

struct RunStats {
  std::size_t total = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t timed_out = 0;
  std::size_t cancelled = 0;
  std::chrono::milliseconds elapsed = std::chrono::milliseconds(0);
};

namespace detail {

enum class SlotPhase { kPending, kRunning, kDone };

template <typename T>
struct BatchState {
  explicit BatchState(std::size_t n)
      : phases(n, SlotPhase::kPending),
        deadlines(n),
        has_deadline(n, false),
        sources(n),
        in_flight(0),
        finished(0),
        failure_seen(false) {
    results.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      results.push_back(api::Result<T>(api::Status(api::StatusCode::kInternalError, "not run")));
    }
  }

  void CompleteLocked(std::size_t i, const api::Status& status) {
    if (phases[i] == SlotPhase::kRunning) --in_flight;
    phases[i] = SlotPhase::kDone;
    results[i] = api::Result<T>(status);
    ++finished;
  }

  std::mutex mu;
  std::condition_variable cv;
  std::vector<api::Result<T> > results;
  std::vector<SlotPhase> phases;
  std::vector<std::chrono::steady_clock::time_point> deadlines;
  std::vector<bool> has_deadline;
  // Written only by the dispatcher before the slot is submitted.
  std::vector<concurrent::CancellationSource> sources;
  std::size_t in_flight;
  std::size_t finished;
  bool failure_seen;
};

inline observe::EventAttributes TaskAttributes(const TaskContext& ctx) {
  observe::EventAttributes attrs;
  std::ostringstream index;
  index << ctx.index;
  attrs.push_back(std::make_pair(std::string("index"), index.str()));
  attrs.push_back(std::make_pair(std::string("id"), ctx.id));
  return attrs;
}

template <typename T>
api::Result<T> InvokeGuarded(const typename Task<T>::Body& body, const TaskContext& ctx) {
  try {
    return body(ctx);
  } catch (const std::exception& ex) {
    return api::Result<T>(api::Status::FromModule(
        api::StatusCode::kInternalError, std::string("task threw: ") + ex.what(),
        api::ErrorModule::kTask));
  } catch (...) {
    return api::Result<T>(api::Status::FromModule(api::StatusCode::kInternalError,
                                                  "task threw a non-std exception",
                                                  api::ErrorModule::kTask));
  }
}

// Body of one executor job. A slot that is no longer kRunning was resolved by the dispatcher
// (timeout or caller cancellation) and its late result is dropped.
template <typename T>
void RunSlot(const std::shared_ptr<BatchState<T> >& state, const TaskContext& ctx,
             const typename Task<T>::Body& body, observe::IEventRecorder* recorder) {
  {
    std::lock_guard<std::mutex> lock(state->mu);
    if (state->phases[ctx.index] != SlotPhase::kRunning) return;
  }
  recorder->RecordEvent("task.start", TaskAttributes(ctx));
  const std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

  api::Result<T> result = InvokeGuarded<T>(body, ctx);
  const api::Status status = result.status();

  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(state->mu);
    if (state->phases[ctx.index] == SlotPhase::kRunning) {
      state->phases[ctx.index] = SlotPhase::kDone;
      state->results[ctx.index] = std::move(result);
      --state->in_flight;
      ++state->finished;
      if (!status.ok()) state->failure_seen = true;
      accepted = true;
    }
  }
  state->cv.notify_all();

  if (!accepted) {
    if (log::LogManager::IsVerbose(1)) {
      log::LogManager::Log(log::LogSeverity::kInfo,
                           "late result of task '" + ctx.id + "' discarded");
    }
    return;
  }
  observe::EventAttributes attrs = TaskAttributes(ctx);
  std::ostringstream elapsed;
  elapsed << std::chrono::duration_cast<std::chrono::milliseconds>(
                 std::chrono::steady_clock::now() - started)
                 .count();
  attrs.push_back(std::make_pair(std::string("elapsed_ms"), elapsed.str()));
  if (status.ok()) {
    recorder->RecordEvent("task.complete", attrs);
  } else {
    attrs.push_back(std::make_pair(std::string("error"), status.ToString()));
    recorder->RecordEvent("task.failure", attrs);
  }
}

}  // namespace detail

// Runs batches of independent tasks with bounded parallelism and returns one result per task,
// in input order.
//
// A timed-out or caller-cancelled task resolves immediately; its body keeps its worker until it
// returns (bodies should poll TaskContext::cancel) and the late result is dropped. Destroying the
// runner waits for such bodies. The recorder must outlive the runner.
class ASYNCKIT_API TaskRunner {
 public:
  explicit TaskRunner(const RunnerOptions& options = RunnerOptions(),
                      observe::IEventRecorder* recorder = NULL);
  // Borrowed executor, it must outlive the runner. Timed-out bodies occupy its workers.
  // A NULL executor falls back to an owned one.
  TaskRunner(IExecutor* executor, const RunnerOptions& options,
             observe::IEventRecorder* recorder = NULL);
  ~TaskRunner();

  const RunnerOptions& options() const { return options_; }
  IExecutor* executor() const { return executor_; }

  // RunOptions seeded from RunnerOptions.
  RunOptions DefaultRunOptions() const;

  template <typename T>
  std::vector<api::Result<T> > Run(const std::vector<Task<T> >& tasks, RunStats* stats = NULL) {
    return Run(tasks, DefaultRunOptions(), stats);
  }

  template <typename T>
  std::vector<api::Result<T> > Run(const std::vector<Task<T> >& tasks, const RunOptions& options,
                                   RunStats* stats = NULL);

 private:
  TaskRunner(const TaskRunner&);
  TaskRunner& operator=(const TaskRunner&);

  void CreateOwnedExecutor();

  IExecutor* executor_;
  bool owns_executor_;
  RunnerOptions options_;
  observe::IEventRecorder* recorder_;
};

template <typename T>
std::vector<api::Result<T> > TaskRunner::Run(const std::vector<Task<T> >& tasks,
                                             const RunOptions& options, RunStats* stats) {
  typedef std::chrono::steady_clock Clock;
  const Clock::time_point run_started = Clock::now();
  const std::size_t n = tasks.size();
  std::vector<api::Result<T> > out;

  if (n > 0 && options.max_workers < 1) {
    for (std::size_t i = 0; i < n; ++i) {
      out.push_back(api::Result<T>(api::Status::FromModule(
          api::StatusCode::kInvalidArgument, "max_workers must be >= 1", api::ErrorModule::kTask)));
    }
  } else if (n > 0) {
    std::shared_ptr<detail::BatchState<T> > state = std::make_shared<detail::BatchState<T> >(n);
    concurrent::CancellationRegistration wake(options.cancel, [state]() {
      std::lock_guard<std::mutex> lock(state->mu);
      state->cv.notify_all();
    });

    std::size_t next = 0;
    bool stop = false;
    bool caller_cancelled = false;
    std::unique_lock<std::mutex> lock(state->mu);
    for (;;) {
      std::vector<std::size_t> timed_out;
      std::vector<std::size_t> to_signal;
      std::vector<std::size_t> to_dispatch;
      const Clock::time_point now = Clock::now();

      for (std::size_t i = 0; i < next; ++i) {
        if (state->phases[i] == detail::SlotPhase::kRunning && state->has_deadline[i] &&
            state->deadlines[i] <= now) {
          std::ostringstream msg;
          msg << "task '" << tasks[i].id << "' exceeded its timeout";
          state->CompleteLocked(i, api::Status::FromModule(api::StatusCode::kTimeout, msg.str(),
                                                           api::ErrorModule::kTask, 0x0001));
          state->failure_seen = true;
          timed_out.push_back(i);
        }
      }

      if (!caller_cancelled && options.cancel.IsCancelled()) {
        caller_cancelled = true;
        stop = true;
        for (std::size_t i = 0; i < next; ++i) {
          if (state->phases[i] != detail::SlotPhase::kRunning) continue;
          state->CompleteLocked(i, api::Status::FromModule(api::StatusCode::kCancelled,
                                                           "task cancelled by caller",
                                                           api::ErrorModule::kTask, 0x0001));
          to_signal.push_back(i);
        }
      }

      if (!stop && options.fail_fast && state->failure_seen) {
        stop = true;
        for (std::size_t i = 0; i < next; ++i) {
          if (state->phases[i] == detail::SlotPhase::kRunning) to_signal.push_back(i);
        }
      }

      while (!stop && next < n && state->in_flight < options.max_workers) {
        const std::size_t i = next++;
        if (!tasks[i].fn) {
          state->CompleteLocked(i, api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                                           "task function is empty",
                                                           api::ErrorModule::kTask, 0x0001));
          state->failure_seen = true;
          if (options.fail_fast) stop = true;
          continue;
        }
        const std::chrono::milliseconds timeout =
            tasks[i].timeout.count() > 0 ? tasks[i].timeout : options.timeout;
        state->phases[i] = detail::SlotPhase::kRunning;
        ++state->in_flight;
        if (timeout.count() > 0) {
          state->has_deadline[i] = true;
          state->deadlines[i] = now + timeout;
        }
        to_dispatch.push_back(i);
      }

      if (stop) {
        for (; next < n; ++next) {
          state->CompleteLocked(next, api::Status::FromModule(
                                          api::StatusCode::kCancelled,
                                          caller_cancelled ? "batch cancelled before task started"
                                                           : "fail-fast: task never started",
                                          api::ErrorModule::kTask, 0x0001));
        }
      }

      if (!timed_out.empty() || !to_signal.empty() || !to_dispatch.empty()) {
        lock.unlock();
        for (std::size_t k = 0; k < timed_out.size(); ++k) {
          const std::size_t i = timed_out[k];
          state->sources[i].Cancel();
          log::LogManager::Log(log::LogSeverity::kWarning,
                               "task '" + tasks[i].id + "' timed out, result will be discarded");
          TaskContext ctx;
          ctx.index = i;
          ctx.id = tasks[i].id;
          recorder_->RecordEvent("task.timeout", detail::TaskAttributes(ctx));
        }
        for (std::size_t k = 0; k < to_signal.size(); ++k) {
          state->sources[to_signal[k]].Cancel();
          if (caller_cancelled) {
            TaskContext ctx;
            ctx.index = to_signal[k];
            ctx.id = tasks[to_signal[k]].id;
            recorder_->RecordEvent("task.cancelled", detail::TaskAttributes(ctx));
          }
        }
        for (std::size_t k = 0; k < to_dispatch.size(); ++k) {
          const std::size_t i = to_dispatch[k];
          TaskContext ctx;
          ctx.index = i;
          ctx.id = tasks[i].id;
          ctx.cancel = state->sources[i].Token();
          ctx.has_deadline = state->has_deadline[i];
          ctx.deadline = state->deadlines[i];
          const typename Task<T>::Body body = tasks[i].fn;
          observe::IEventRecorder* recorder = recorder_;
          TaskSubmitOptions submit_options;
          submit_options.priority = tasks[i].priority;
          api::Result<TaskId> submitted = executor_->Submit(
              [state, ctx, body, recorder]() { detail::RunSlot<T>(state, ctx, body, recorder); },
              submit_options);
          if (!submitted.ok()) {
            std::lock_guard<std::mutex> relock(state->mu);
            if (state->phases[i] == detail::SlotPhase::kRunning) {
              state->CompleteLocked(i, submitted.status());
              state->failure_seen = true;
            }
          }
        }
        lock.lock();
        continue;
      }

      if (state->finished == n) break;

      bool any_deadline = false;
      Clock::time_point earliest = Clock::time_point::max();
      for (std::size_t i = 0; i < next; ++i) {
        if (state->phases[i] == detail::SlotPhase::kRunning && state->has_deadline[i] &&
            state->deadlines[i] < earliest) {
          earliest = state->deadlines[i];
          any_deadline = true;
        }
      }
      if (any_deadline) {
        state->cv.wait_until(lock, earliest);
      } else {
        state->cv.wait(lock);
      }
    }
    out.swap(state->results);
  }

  if (stats != NULL) {
    RunStats s;
    s.total = n;
    for (std::size_t i = 0; i < out.size(); ++i) {
      if (out[i].ok()) {
        ++s.succeeded;
      } else if (out[i].status().code() == api::StatusCode::kTimeout) {
        ++s.timed_out;
      } else if (out[i].status().code() == api::StatusCode::kCancelled) {
        ++s.cancelled;
      } else {
        ++s.failed;
      }
    }
    s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - run_started);
    *stats = s;
  }
  return out;
}

}  // namespace task
}  // namespace asynckit
