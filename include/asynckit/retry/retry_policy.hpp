#pragma once

#include <chrono>
#include <cstdint>

#include "asynckit/api/export.hpp"
#include "asynckit/api/status.hpp"

namespace asynckit {
namespace retry {

// Coarse failure class a retry decision is made on.
enum class ErrorKind {
  kTransport,    // connection refused/reset/broken
  kTimeout,      // per-attempt deadline elapsed
  kServerError,  // 500, 502, 503, 504
  kRateLimited,  // 429
  kClientError,  // other 4xx
  kValidation,   // request rejected before it was sent
  kCancelled,
  kOther
};

struct RetryOptions {
  std::uint32_t max_retries = 3;
  std::chrono::milliseconds backoff_base = std::chrono::milliseconds(1000);
  double backoff_factor = 2.0;
  // 0 leaves the delay uncapped.
  std::chrono::milliseconds max_backoff = std::chrono::milliseconds(0);
  // Delay is scaled by a uniform factor in [1 - jitter, 1 + jitter].
  double jitter = 0.0;
};

ASYNCKIT_API const char* ErrorKindName(ErrorKind kind);

// 408 -> kTimeout, 429 -> kRateLimited, 500/502/503/504 -> kServerError, other 4xx -> kClientError.
// Other 5xx map to kOther and are not retried.
ASYNCKIT_API ErrorKind ClassifyHttpStatus(int status_code);

// Maps a runtime status onto an ErrorKind; HTTP errors are classified by the status code carried in
// `http_status` (0 when unknown).
ASYNCKIT_API ErrorKind ClassifyStatus(const api::Status& status, int http_status = 0);

ASYNCKIT_API bool IsRetryable(ErrorKind kind);

// Immutable backoff schedule. Safe to share between threads without locking.
class ASYNCKIT_API RetryPolicy {
 public:
  explicit RetryPolicy(const RetryOptions& options = RetryOptions());

  // max_retries is unrestricted; backoff_factor >= 1; 0 <= jitter <= 1.
  static api::Status ValidateOptions(const RetryOptions& options);

  // 参数：
  // - attempt: 即将进行的第几次重试（从 1 开始）。
  // - kind: 上一次失败的分类。
  // - delay: 输出等待时长，可为 NULL。
  // 返回：
  // - true：应当重试，delay 为 backoff_base * backoff_factor^attempt（经 max_backoff 截断与 jitter 扰动）。
  // - false：attempt > max_retries，或 kind 不可重试。
  // 线程安全：线程安全。
  bool NextDelay(std::uint32_t attempt, ErrorKind kind, std::chrono::milliseconds* delay) const;

  // Delay before jitter is applied.
  std::chrono::milliseconds BaseDelay(std::uint32_t attempt) const;

  const RetryOptions& options() const { return options_; }

 private:
  RetryOptions options_;
};

}  // namespace retry
}  // namespace asynckit
