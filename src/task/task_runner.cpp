#include "asynckit/task/task_runner.hpp"

#include <glog/logging.h>

#include <algorithm>

#include "asynckit/api/factory.hpp"

namespace asynckit {
namespace task {

TaskRunner::TaskRunner(const RunnerOptions& options, observe::IEventRecorder* recorder)
    : executor_(NULL),
      owns_executor_(true),
      options_(options),
      recorder_(observe::RecorderOrNull(recorder)) {
  CreateOwnedExecutor();
}

TaskRunner::TaskRunner(IExecutor* executor, const RunnerOptions& options,
                       observe::IEventRecorder* recorder)
    : executor_(executor),
      owns_executor_(false),
      options_(options),
      recorder_(observe::RecorderOrNull(recorder)) {
  if (executor_ == NULL) {
    LOG(WARNING) << "task runner given a null executor, creating its own";
    owns_executor_ = true;
    CreateOwnedExecutor();
  }
}

void TaskRunner::CreateOwnedExecutor() {
  ExecutorOptions executor_options;
  executor_options.worker_count = std::max<std::size_t>(options_.max_workers, 1);
  executor_options.max_worker_count =
      std::max<std::size_t>(options_.max_threads, executor_options.worker_count);
  executor_ = asynckit_create_executor_v2(&executor_options);
  VLOG(1) << "task runner started with " << executor_options.worker_count
          << " workers, thread cap " << executor_options.max_worker_count;
}

TaskRunner::~TaskRunner() {
  if (!owns_executor_) return;
  // Joins workers, including ones still inside timed-out bodies.
  asynckit_destroy_executor(executor_);
  executor_ = NULL;
}

RunOptions TaskRunner::DefaultRunOptions() const {
  RunOptions out;
  out.max_workers = options_.max_workers;
  out.fail_fast = options_.fail_fast;
  out.timeout = options_.default_timeout;
  return out;
}

}  // namespace task
}  // namespace asynckit
