#include "asynckit/api/factory.hpp"

#include "asynckit/api/version.hpp"
#include "log/log_manager_adapter.hpp"
#include "observe/log_event_recorder.hpp"
#include "task/thread_pool_executor.hpp"

extern "C" {

std::uint32_t asynckit_get_api_version() { return asynckit::api::kApiVersion; }

asynckit::log::ILogManager* asynckit_create_log_manager() {
  return new asynckit::log::LogManagerAdapter();
}

void asynckit_destroy_log_manager(asynckit::log::ILogManager* manager) { delete manager; }

asynckit::task::IExecutor* asynckit_create_executor() {
  return new asynckit::task::ThreadPoolExecutor();
}

asynckit::task::IExecutor* asynckit_create_executor_v2(
    const asynckit::task::ExecutorOptions* options) {
  if (options == NULL) {
    return new asynckit::task::ThreadPoolExecutor();
  }
  return new asynckit::task::ThreadPoolExecutor(*options);
}

void asynckit_destroy_executor(asynckit::task::IExecutor* executor) { delete executor; }

asynckit::observe::IEventRecorder* asynckit_create_log_event_recorder() {
  return new asynckit::observe::LogEventRecorder();
}

void asynckit_destroy_event_recorder(asynckit::observe::IEventRecorder* recorder) {
  delete recorder;
}

}
