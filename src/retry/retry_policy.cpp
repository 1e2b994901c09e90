#include "asynckit/retry/retry_policy.hpp"

#include <cmath>
#include <random>

namespace asynckit {
namespace retry {

namespace {

// About 24 days; keeps the double -> integer conversion in range.
const double kMaxDelayMs = 2147483647.0;

double UniformUnit() {
  static thread_local std::mt19937 engine(std::random_device{}());
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(engine);
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTransport:
      return "transport";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kServerError:
      return "server_error";
    case ErrorKind::kRateLimited:
      return "rate_limited";
    case ErrorKind::kClientError:
      return "client_error";
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kCancelled:
      return "cancelled";
    default:
      return "other";
  }
}

ErrorKind ClassifyHttpStatus(int status_code) {
  switch (status_code) {
    case 408:
      return ErrorKind::kTimeout;
    case 429:
      return ErrorKind::kRateLimited;
    case 500:
    case 502:
    case 503:
    case 504:
      return ErrorKind::kServerError;
    default:
      break;
  }
  if (status_code >= 400 && status_code < 500) return ErrorKind::kClientError;
  return ErrorKind::kOther;
}

ErrorKind ClassifyStatus(const api::Status& status, int http_status) {
  switch (status.code()) {
    case api::StatusCode::kTransportError:
      return ErrorKind::kTransport;
    case api::StatusCode::kTimeout:
      return ErrorKind::kTimeout;
    case api::StatusCode::kCancelled:
      return ErrorKind::kCancelled;
    case api::StatusCode::kInvalidArgument:
      return ErrorKind::kValidation;
    case api::StatusCode::kApplicationError:
      return http_status > 0 ? ClassifyHttpStatus(http_status) : ErrorKind::kOther;
    default:
      return ErrorKind::kOther;
  }
}

bool IsRetryable(ErrorKind kind) {
  return kind == ErrorKind::kTransport || kind == ErrorKind::kTimeout ||
         kind == ErrorKind::kServerError || kind == ErrorKind::kRateLimited;
}

RetryPolicy::RetryPolicy(const RetryOptions& options) : options_(options) {}

api::Status RetryPolicy::ValidateOptions(const RetryOptions& options) {
  if (options.backoff_base.count() < 0 || options.max_backoff.count() < 0) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                   "backoff durations must be non-negative",
                                   api::ErrorModule::kRetry);
  }
  if (!(options.backoff_factor >= 1.0)) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                   "backoff_factor must be >= 1", api::ErrorModule::kRetry);
  }
  if (!(options.jitter >= 0.0 && options.jitter <= 1.0)) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                   "jitter must be within [0, 1]", api::ErrorModule::kRetry);
  }
  return api::Status::Ok();
}

std::chrono::milliseconds RetryPolicy::BaseDelay(std::uint32_t attempt) const {
  double ms = static_cast<double>(options_.backoff_base.count()) *
              std::pow(options_.backoff_factor, static_cast<double>(attempt));
  const double cap = options_.max_backoff.count() > 0
                         ? static_cast<double>(options_.max_backoff.count())
                         : kMaxDelayMs;
  if (!(ms <= cap)) ms = cap;  // also catches inf/nan
  if (ms < 0.0) ms = 0.0;
  return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
}

bool RetryPolicy::NextDelay(std::uint32_t attempt, ErrorKind kind,
                            std::chrono::milliseconds* delay) const {
  if (attempt > options_.max_retries || !IsRetryable(kind)) return false;
  if (delay == NULL) return true;

  double ms = static_cast<double>(BaseDelay(attempt).count());
  if (options_.jitter > 0.0) {
    const double spread = options_.jitter > 1.0 ? 1.0 : options_.jitter;
    ms *= (1.0 - spread) + 2.0 * spread * UniformUnit();
  }
  if (ms > kMaxDelayMs) ms = kMaxDelayMs;
  *delay = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
  return true;
}

}  // namespace retry
}  // namespace asynckit
