#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "asynckit/task/iexecutor.hpp"

namespace asynckit {
namespace task {

class ThreadPoolExecutor : public IExecutor {
 public:
  explicit ThreadPoolExecutor(std::size_t worker_count = 0);
  explicit ThreadPoolExecutor(const ExecutorOptions& options);
  ~ThreadPoolExecutor() override;

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Result<TaskId> Submit(const TaskFn& fn, const TaskSubmitOptions& options) override;
  api::Status Wait(TaskId id, std::uint32_t timeout_ms) override;
  api::Status TryCancel(TaskId id) override;
  api::Status WaitAll() override;
  api::Result<ExecutorStats> QueryStats() const override;
  api::Status Shutdown() override;

 private:
  struct TaskState {
    bool started = false;
    bool done = false;
    bool canceled = false;
    std::condition_variable cv;
  };

  struct TaskEntry {
    TaskId id = 0;
    TaskFn fn;
    std::shared_ptr<TaskState> state;
    TaskPriority priority = TaskPriority::kNormal;
    std::uint64_t seq = 0;
  };

  void StartWorkersLocked(std::size_t count);
  std::size_t PickNextTaskIndexLocked() const;
  void RunEntry(const TaskEntry& entry);
  void MarkTaskDone(TaskId id, bool executed, bool failed);
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::deque<TaskEntry> tasks_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool stopping_;
  std::size_t active_workers_;
  TaskId next_task_id_;
  std::uint64_t enqueue_seq_;
  std::size_t max_retained_states_;
  ExecutorStats stats_;
  ExecutorOptions options_;
  std::unordered_map<TaskId, std::shared_ptr<TaskState> > states_;
  std::deque<TaskId> done_ids_;
};

}  // namespace task
}  // namespace asynckit
