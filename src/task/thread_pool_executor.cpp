#include "task/thread_pool_executor.hpp"

#include <glog/logging.h>

#include <chrono>
#include <exception>

namespace asynckit {
namespace task {

#define ASYNCKIT_TASK_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kTask)

namespace {

std::size_t NormalizeWorkerCount(std::size_t worker_count) {
  if (worker_count > 0) return worker_count;
  const std::size_t count = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return count == 0 ? 1 : count;
}

}  // namespace

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t worker_count)
    : stopping_(false),
      active_workers_(0),
      next_task_id_(1),
      enqueue_seq_(0),
      max_retained_states_(65536) {
  options_.worker_count = NormalizeWorkerCount(worker_count);
  std::lock_guard<std::mutex> lock(mu_);
  StartWorkersLocked(options_.worker_count);
}

ThreadPoolExecutor::ThreadPoolExecutor(const ExecutorOptions& options)
    : stopping_(false),
      active_workers_(0),
      next_task_id_(1),
      enqueue_seq_(0),
      max_retained_states_(65536),
      options_(options) {
  options_.worker_count = NormalizeWorkerCount(options.worker_count);
  std::lock_guard<std::mutex> lock(mu_);
  StartWorkersLocked(options_.worker_count);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
  api::Status st = Shutdown();
  if (!st.ok()) LOG(WARNING) << "executor shutdown: " << st.ToString();
}

const char* ThreadPoolExecutor::Name() const { return "asynckit.task.thread_pool_executor"; }
std::uint32_t ThreadPoolExecutor::ApiVersion() const { return api::kApiVersion; }
void ThreadPoolExecutor::Release() { delete this; }

void ThreadPoolExecutor::StartWorkersLocked(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.push_back(std::thread(&ThreadPoolExecutor::WorkerLoop, this));
  }
  stats_.worker_count = workers_.size();
}

std::size_t ThreadPoolExecutor::PickNextTaskIndexLocked() const {
  // Highest priority first, FIFO within the same priority.
  std::size_t best = 0;
  for (std::size_t i = 1; i < tasks_.size(); ++i) {
    if (tasks_[i].priority > tasks_[best].priority ||
        (tasks_[i].priority == tasks_[best].priority && tasks_[i].seq < tasks_[best].seq)) {
      best = i;
    }
  }
  return best;
}

api::Result<TaskId> ThreadPoolExecutor::Submit(const TaskFn& fn,
                                               const TaskSubmitOptions& options) {
  if (!fn) {
    return api::Result<TaskId>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "fn is empty", api::ErrorModule::kTask, 0x0001));
  }

  TaskId id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      return api::Result<TaskId>(ASYNCKIT_TASK_STATUS(
          api::StatusCode::kCancelled, "executor is stopping, cannot accept new tasks"));
    }
    if (options_.queue_capacity > 0 && tasks_.size() >= options_.queue_capacity) {
      ++stats_.rejected;
      return api::Result<TaskId>(api::Status::FromModule(
          api::StatusCode::kWouldBlock, "executor queue is full", api::ErrorModule::kTask,
          0x0001));
    }

    id = next_task_id_++;
    TaskEntry entry;
    entry.id = id;
    entry.fn = fn;
    entry.state = std::make_shared<TaskState>();
    entry.priority = options.priority;
    entry.seq = ++enqueue_seq_;
    states_[id] = entry.state;
    tasks_.push_back(entry);
    ++stats_.submitted;
    if (tasks_.size() > stats_.queue_high_watermark) {
      stats_.queue_high_watermark = tasks_.size();
    }

    const std::size_t idle = workers_.size() - active_workers_;
    if (tasks_.size() > idle && workers_.size() < options_.max_worker_count) {
      StartWorkersLocked(1);
      VLOG(1) << Name() << " grew to " << workers_.size() << " workers";
    }
  }
  cv_.notify_one();
  return api::Result<TaskId>(id);
}

api::Status ThreadPoolExecutor::Wait(TaskId id, std::uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mu_);
  std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) {
    return ASYNCKIT_TASK_STATUS(api::StatusCode::kNotFound, "task id not found");
  }
  std::shared_ptr<TaskState> state = it->second;
  if (timeout_ms == 0) {
    state->cv.wait(lock, [state]() { return state->done; });
    return api::Status::Ok();
  }
  const bool done = state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                       [state]() { return state->done; });
  return done ? api::Status::Ok()
              : ASYNCKIT_TASK_STATUS(api::StatusCode::kTimeout, "wait timeout");
}

api::Status ThreadPoolExecutor::TryCancel(TaskId id) {
  std::lock_guard<std::mutex> lock(mu_);
  std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) {
    return ASYNCKIT_TASK_STATUS(api::StatusCode::kNotFound, "task id not found");
  }
  if (it->second->started || it->second->done) {
    return ASYNCKIT_TASK_STATUS(api::StatusCode::kWouldBlock, "task already running or done");
  }
  it->second->canceled = true;
  ++stats_.canceled;
  return api::Status::Ok();
}

api::Status ThreadPoolExecutor::WaitAll() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this]() { return tasks_.empty() && active_workers_ == 0; });
  return api::Status::Ok();
}

api::Result<ExecutorStats> ThreadPoolExecutor::QueryStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  ExecutorStats out = stats_;
  out.queue_depth = tasks_.size();
  out.active_workers = active_workers_;
  return api::Result<ExecutorStats>(out);
}

api::Status ThreadPoolExecutor::Shutdown() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
    workers.swap(workers_);
  }
  cv_.notify_all();
  for (std::size_t i = 0; i < workers.size(); ++i) {
    if (workers[i].get_id() == std::this_thread::get_id()) {
      workers[i].detach();
      LOG(ERROR) << Name() << " shut down from one of its own workers";
      continue;
    }
    if (workers[i].joinable()) workers[i].join();
  }
  return api::Status::Ok();
}

void ThreadPoolExecutor::MarkTaskDone(TaskId id, bool executed, bool failed) {
  std::lock_guard<std::mutex> lock(mu_);
  std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) return;

  it->second->done = true;
  it->second->cv.notify_all();
  const bool canceled = it->second->canceled;

  done_ids_.push_back(id);
  while (done_ids_.size() > max_retained_states_) {
    states_.erase(done_ids_.front());
    done_ids_.pop_front();
  }

  if (canceled) return;
  if (failed) {
    ++stats_.failed;
  } else if (executed) {
    ++stats_.completed;
  }
}

void ThreadPoolExecutor::RunEntry(const TaskEntry& entry) {
  bool canceled = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    entry.state->started = true;
    canceled = entry.state->canceled;
  }
  if (canceled) {
    MarkTaskDone(entry.id, false, false);
    return;
  }

  bool failed = false;
  try {
    entry.fn();
  } catch (const std::exception& ex) {
    LOG(ERROR) << Name() << " task " << entry.id << " threw: " << ex.what();
    failed = true;
  } catch (...) {
    LOG(ERROR) << Name() << " task " << entry.id << " threw a non-std exception";
    failed = true;
  }
  MarkTaskDone(entry.id, !failed, failed);
}

void ThreadPoolExecutor::WorkerLoop() {
  for (;;) {
    TaskEntry entry;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (stopping_ && tasks_.empty()) return;
      const std::size_t idx = PickNextTaskIndexLocked();
      entry = tasks_[idx];
      tasks_.erase(tasks_.begin() + static_cast<std::ptrdiff_t>(idx));
      ++active_workers_;
    }

    RunEntry(entry);

    {
      std::lock_guard<std::mutex> lock(mu_);
      --active_workers_;
    }
    idle_cv_.notify_all();
  }
}

#undef ASYNCKIT_TASK_STATUS

}  // namespace task
}  // namespace asynckit
