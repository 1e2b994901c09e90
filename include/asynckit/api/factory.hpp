#pragma once

#include <cstdint>

#include "asynckit/api/export.hpp"

namespace asynckit {
namespace log {
class ILogManager;
}
namespace observe {
class IEventRecorder;
}
namespace task {
class IExecutor;
struct ExecutorOptions;
}
}  // namespace asynckit

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
ASYNCKIT_API std::uint32_t asynckit_get_api_version();

// Create a log manager instance owned by the caller.
ASYNCKIT_API asynckit::log::ILogManager* asynckit_create_log_manager();

// Destroy a log manager created by asynckit_create_log_manager.
ASYNCKIT_API void asynckit_destroy_log_manager(asynckit::log::ILogManager* manager);

// Create an executor with hardware_concurrency workers.
ASYNCKIT_API asynckit::task::IExecutor* asynckit_create_executor();

// Create an executor from options. NULL options behave like asynckit_create_executor.
ASYNCKIT_API asynckit::task::IExecutor* asynckit_create_executor_v2(
    const asynckit::task::ExecutorOptions* options);

// Destroy an executor. Queued tasks run to completion before this returns.
ASYNCKIT_API void asynckit_destroy_executor(asynckit::task::IExecutor* executor);

// Create an event recorder that writes every event through the glog pipeline.
ASYNCKIT_API asynckit::observe::IEventRecorder* asynckit_create_log_event_recorder();

// Destroy an event recorder created by asynckit_create_log_event_recorder.
ASYNCKIT_API void asynckit_destroy_event_recorder(asynckit::observe::IEventRecorder* recorder);

}
