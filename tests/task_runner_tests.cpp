#include "asynckit/task/task_runner.hpp"
#include "asynckit/observe/memory_event_recorder.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

typedef asynckit::task::Task<int> IntTask;
typedef std::vector<asynckit::api::Result<int> > IntResults;

IntTask SleepTask(const std::string& id, int value, int sleep_ms) {
  return IntTask(id, [value, sleep_ms](const asynckit::task::TaskContext&) -> asynckit::api::Result<int> {
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    return asynckit::api::Result<int>(value);
  });
}

IntTask FailingTask(const std::string& id, int sleep_ms) {
  return IntTask(id, [sleep_ms](const asynckit::task::TaskContext&) -> asynckit::api::Result<int> {
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    return asynckit::api::Result<int>(asynckit::api::Status(
        asynckit::api::StatusCode::kApplicationError, "boom"));
  });
}

// Sleeps in small steps so a cancelled context releases the worker early.
IntTask CooperativeTask(const std::string& id, int value, int sleep_ms) {
  return IntTask(id, [value, sleep_ms](const asynckit::task::TaskContext& ctx) -> asynckit::api::Result<int> {
    const std::chrono::steady_clock::time_point until =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(sleep_ms);
    while (std::chrono::steady_clock::now() < until) {
      if (ctx.IsCancelled()) {
        return asynckit::api::Result<int>(
            asynckit::api::Status(asynckit::api::StatusCode::kCancelled, "stopped"));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return asynckit::api::Result<int>(value);
  });
}

}  // namespace

bool TestResultsKeepInputOrder() {
  asynckit::task::TaskRunner runner;
  std::vector<IntTask> tasks;
  for (int i = 0; i < 8; ++i) {
    // Later tasks finish first.
    tasks.push_back(SleepTask("t" + std::to_string(i), i * 10, (8 - i) * 5));
  }
  asynckit::task::RunStats stats;
  IntResults results = runner.Run(tasks, &stats);
  if (results.size() != tasks.size()) return false;
  for (int i = 0; i < 8; ++i) {
    if (!results[i].ok() || results[i].value() != i * 10) return false;
  }
  return stats.total == 8 && stats.succeeded == 8 && stats.failed == 0;
}

bool TestEmptyBatch() {
  asynckit::task::TaskRunner runner;
  asynckit::task::RunStats stats;
  stats.total = 99;
  IntResults results = runner.Run(std::vector<IntTask>(), &stats);
  return results.empty() && stats.total == 0;
}

bool TestBoundedParallelism() {
  asynckit::task::TaskRunner runner;
  std::atomic<int> running(0);
  std::atomic<int> peak(0);
  std::vector<IntTask> tasks;
  for (int i = 0; i < 12; ++i) {
    tasks.push_back(IntTask("t" + std::to_string(i),
                            [&running, &peak, i](const asynckit::task::TaskContext&) -> asynckit::api::Result<int> {
                              const int now = running.fetch_add(1) + 1;
                              int seen = peak.load();
                              while (seen < now && !peak.compare_exchange_weak(seen, now)) {
                              }
                              std::this_thread::sleep_for(std::chrono::milliseconds(20));
                              running.fetch_sub(1);
                              return asynckit::api::Result<int>(i);
                            }));
  }
  asynckit::task::RunOptions opt = runner.DefaultRunOptions();
  opt.max_workers = 3;
  IntResults results = runner.Run(tasks, opt);
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (!results[i].ok()) return false;
  }
  return peak.load() <= 3 && peak.load() >= 1;
}

bool TestParallelismShortensBatch() {
  asynckit::task::TaskRunner runner;
  std::vector<IntTask> tasks;
  for (int i = 0; i < 4; ++i) tasks.push_back(SleepTask("t" + std::to_string(i), i, 100));
  asynckit::task::RunOptions opt = runner.DefaultRunOptions();
  opt.max_workers = 4;
  const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  IntResults results = runner.Run(tasks, opt);
  const long long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
  return results.size() == 4 && elapsed < 350;
}

bool TestPerTaskTimeout() {
  asynckit::observe::MemoryEventRecorder recorder;
  asynckit::task::TaskRunner runner(asynckit::task::RunnerOptions(), &recorder);
  std::vector<IntTask> tasks;
  tasks.push_back(SleepTask("fast", 1, 5));
  IntTask slow = CooperativeTask("slow", 2, 2000);
  slow.timeout = std::chrono::milliseconds(50);
  tasks.push_back(slow);

  asynckit::task::RunStats stats;
  const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  IntResults results = runner.Run(tasks, &stats);
  const long long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
  if (!results[0].ok() || results[0].value() != 1) return false;
  if (results[1].status().code() != asynckit::api::StatusCode::kTimeout) return false;
  if (elapsed >= 1000) return false;
  if (stats.timed_out != 1 || stats.succeeded != 1) return false;

  const std::vector<asynckit::observe::RecordedEvent> events = recorder.Drain();
  bool saw_timeout = false;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (events[i].name == "task.timeout" && events[i].Attribute("id") == "slow") saw_timeout = true;
  }
  return saw_timeout;
}

bool TestBatchTimeoutAppliesToEveryTask() {
  asynckit::task::TaskRunner runner;
  std::vector<IntTask> tasks;
  tasks.push_back(CooperativeTask("a", 1, 1000));
  tasks.push_back(CooperativeTask("b", 2, 1000));
  asynckit::task::RunOptions opt = runner.DefaultRunOptions();
  opt.timeout = std::chrono::milliseconds(40);
  IntResults results = runner.Run(tasks, opt);
  return results[0].status().code() == asynckit::api::StatusCode::kTimeout &&
         results[1].status().code() == asynckit::api::StatusCode::kTimeout;
}

bool TestFailureDoesNotStopBatch() {
  asynckit::task::TaskRunner runner;
  std::vector<IntTask> tasks;
  tasks.push_back(SleepTask("a", 1, 5));
  tasks.push_back(FailingTask("b", 1));
  tasks.push_back(SleepTask("c", 3, 20));
  asynckit::task::RunStats stats;
  IntResults results = runner.Run(tasks, &stats);
  return results[0].ok() && !results[1].ok() &&
         results[1].status().code() == asynckit::api::StatusCode::kApplicationError &&
         results[2].ok() && results[2].value() == 3 && stats.failed == 1;
}

bool TestFailFastCancelsUnstarted() {
  asynckit::task::TaskRunner runner;
  std::atomic<int> started(0);
  std::vector<IntTask> tasks;
  tasks.push_back(FailingTask("bad", 5));
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(IntTask("late" + std::to_string(i),
                            [&started, i](const asynckit::task::TaskContext&) -> asynckit::api::Result<int> {
                              started.fetch_add(1);
                              return asynckit::api::Result<int>(i);
                            }));
  }
  asynckit::task::RunOptions opt = runner.DefaultRunOptions();
  opt.max_workers = 1;
  opt.fail_fast = true;
  asynckit::task::RunStats stats;
  IntResults results = runner.Run(tasks, opt, &stats);
  if (results.size() != 6) return false;
  if (results[0].status().code() != asynckit::api::StatusCode::kApplicationError) return false;
  for (std::size_t i = 1; i < results.size(); ++i) {
    if (results[i].status().code() != asynckit::api::StatusCode::kCancelled) return false;
  }
  return started.load() == 0 && stats.cancelled == 5;
}

bool TestCallerCancellation() {
  asynckit::task::TaskRunner runner;
  asynckit::concurrent::CancellationSource source;
  std::vector<IntTask> tasks;
  for (int i = 0; i < 4; ++i) tasks.push_back(CooperativeTask("t" + std::to_string(i), i, 2000));
  asynckit::task::RunOptions opt = runner.DefaultRunOptions();
  opt.max_workers = 2;
  opt.cancel = source.Token();

  std::thread canceller([&source]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    source.Cancel();
  });
  const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  IntResults results = runner.Run(tasks, opt);
  const long long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
  canceller.join();
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (results[i].status().code() != asynckit::api::StatusCode::kCancelled) return false;
  }
  return elapsed < 1000;
}

bool TestInvalidTasks() {
  asynckit::task::TaskRunner runner;
  std::vector<IntTask> tasks;
  tasks.push_back(IntTask("empty", IntTask::Body()));
  tasks.push_back(SleepTask("ok", 7, 1));
  IntResults results = runner.Run(tasks);
  if (results[0].status().code() != asynckit::api::StatusCode::kInvalidArgument) return false;
  if (!results[1].ok()) return false;

  asynckit::task::RunOptions opt = runner.DefaultRunOptions();
  opt.max_workers = 0;
  results = runner.Run(tasks, opt);
  return results.size() == 2 &&
         results[0].status().code() == asynckit::api::StatusCode::kInvalidArgument &&
         results[1].status().code() == asynckit::api::StatusCode::kInvalidArgument;
}

bool TestThrowingTaskBecomesError() {
  asynckit::task::TaskRunner runner;
  std::vector<IntTask> tasks;
  tasks.push_back(IntTask("throws", [](const asynckit::task::TaskContext&) -> asynckit::api::Result<int> {
    throw std::runtime_error("bad input");
  }));
  IntResults results = runner.Run(tasks);
  return results[0].status().code() == asynckit::api::StatusCode::kInternalError &&
         results[0].status().message().find("bad input") != std::string::npos;
}

bool TestBorrowedExecutor() {
  asynckit::task::ExecutorOptions exec_opt;
  exec_opt.worker_count = 2;
  asynckit::task::IExecutor* executor = asynckit_create_executor_v2(&exec_opt);
  if (executor == NULL) return false;
  bool ok = true;
  {
    asynckit::task::TaskRunner runner(executor, asynckit::task::RunnerOptions());
    ok = runner.executor() == executor;
    std::vector<IntTask> tasks;
    tasks.push_back(SleepTask("a", 1, 1));
    tasks.push_back(SleepTask("b", 2, 1));
    IntResults results = runner.Run(tasks);
    ok = ok && results[0].ok() && results[1].ok() && results[1].value() == 2;
  }
  asynckit_destroy_executor(executor);
  return ok;
}

bool TestTaskContextCarriesIndexAndId() {
  asynckit::task::TaskRunner runner;
  std::vector<asynckit::task::Task<std::string> > tasks;
  for (int i = 0; i < 3; ++i) {
    tasks.push_back(asynckit::task::Task<std::string>(
        "job" + std::to_string(i), [](const asynckit::task::TaskContext& ctx) {
          return asynckit::api::Result<std::string>(ctx.id + "@" + std::to_string(ctx.index));
        }));
  }
  std::vector<asynckit::api::Result<std::string> > results = runner.Run(tasks);
  return results[0].value() == "job0@0" && results[2].value() == "job2@2";
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"results_keep_input_order", TestResultsKeepInputOrder},
      {"empty_batch", TestEmptyBatch},
      {"bounded_parallelism", TestBoundedParallelism},
      {"parallelism_shortens_batch", TestParallelismShortensBatch},
      {"per_task_timeout", TestPerTaskTimeout},
      {"batch_timeout_applies_to_every_task", TestBatchTimeoutAppliesToEveryTask},
      {"failure_does_not_stop_batch", TestFailureDoesNotStopBatch},
      {"fail_fast_cancels_unstarted", TestFailFastCancelsUnstarted},
      {"caller_cancellation", TestCallerCancellation},
      {"invalid_tasks", TestInvalidTasks},
      {"throwing_task_becomes_error", TestThrowingTaskBecomesError},
      {"borrowed_executor", TestBorrowedExecutor},
      {"task_context_carries_index_and_id", TestTaskContextCarriesIndexAndId},
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
