#pragma once

#include <string>

#include "asynckit/api/export.hpp"
#include "asynckit/api/status.hpp"
#include "asynckit/json/i_json.hpp"
#include "asynckit/net/client.hpp"
#include "asynckit/stream/stream.hpp"
#include "asynckit/task/task_runner.hpp"

namespace asynckit {
namespace config {

// Every tunable of the runtime. client.pool / client.breaker / client.retry double as the options of
// standalone pools, breakers and retry policies.
struct RuntimeOptions {
  task::RunnerOptions runner;
  net::ClientOptions client;
  stream::StreamOptions stream;
};

// 从 JSON 文件加载运行时配置。
// 文件结构：
// {
//   "runner":  {"max_workers", "default_timeout", "fail_fast", "max_threads"},
//   "pool":    {"max_resources", "acquire_timeout"},
//   "breaker": {"failure_threshold", "recovery_timeout"},
//   "retry":   {"max_retries", "backoff_base", "backoff_factor", "max_backoff", "jitter"},
//   "stream":  {"buffer_capacity"},
//   "client":  {"request_timeout", "batch_workers"}
// }
// 时长均以毫秒为单位；也接受带 "_ms" 后缀的同名键（两者同时存在时以无后缀键为准）。
// 缺失的节或键保留默认值；未知键忽略。
// 返回：
// - kOk：value 为已通过 ValidateRuntimeOptions 的配置。
// - kNotFound：文件不存在。
// - kInvalidArgument：JSON 非法、类型错误或取值越界。
ASYNCKIT_API api::Result<RuntimeOptions> LoadRuntimeOptions(const std::string& path);

// Same as LoadRuntimeOptions on an already parsed document, starting from defaults.
ASYNCKIT_API api::Result<RuntimeOptions> ParseRuntimeOptions(const json::Json& root);

// ASYNCKIT_WORKERS, ASYNCKIT_TIMEOUT (seconds), ASYNCKIT_RETRY_MAX, ASYNCKIT_POOL_SIZE. Unset
// variables are skipped; a non-numeric value fails and leaves `options` untouched.
ASYNCKIT_API api::Status ApplyEnvironmentOverrides(RuntimeOptions* options);

ASYNCKIT_API api::Status ValidateRuntimeOptions(const RuntimeOptions& options);

ASYNCKIT_API json::Json RuntimeOptionsToJson(const RuntimeOptions& options);

}  // namespace config
}  // namespace asynckit
