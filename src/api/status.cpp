#include "asynckit/api/status.hpp"

#include <cstdio>

namespace asynckit {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define ASYNCKIT_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Core generic status family (detail id = 0)
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kOk, 0x0000), "CORE_OK",
     "Operation succeeded"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, 0x0000),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kNotFound, 0x0000), "CORE_NOT_FOUND",
     "Resource not found"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kWouldBlock, 0x0000), "CORE_WOULD_BLOCK",
     "Operation would block"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kIoError, 0x0000), "CORE_IO_ERROR",
     "I/O error"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kInternalError, 0x0000),
     "CORE_INTERNAL_ERROR", "Internal error"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kUnsupported, 0x0000), "CORE_UNSUPPORTED",
     "Operation unsupported"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kTimeout, 0x0000), "CORE_TIMEOUT",
     "Deadline elapsed"},
    {ASYNCKIT_ECODE(ErrorModule::kCore, StatusCode::kCancelled, 0x0000), "CORE_CANCELLED",
     "Operation cancelled"},

    // Module detail ids; keep appending here as a unified lookup table.
    {ASYNCKIT_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument, 0x0001),
     "CONFIG_INVALID_VALUE", "Configuration value has the wrong type or range"},
    {ASYNCKIT_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument, 0x0002),
     "CONFIG_INVALID_ENV", "Environment override is not a valid number"},
    {ASYNCKIT_ECODE(ErrorModule::kLog, StatusCode::kInvalidArgument, 0x0001),
     "LOG_INVALID_CONFIG", "Logging config contains a malformed value"},
    {ASYNCKIT_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument, 0x0001),
     "JSON_PARSE_FAILED", "JSON parse failed"},
    {ASYNCKIT_ECODE(ErrorModule::kConcurrent, StatusCode::kWouldBlock, 0x0001),
     "CHANNEL_FULL", "Channel buffer is full"},
    {ASYNCKIT_ECODE(ErrorModule::kConcurrent, StatusCode::kWouldBlock, 0x0002),
     "CHANNEL_EMPTY", "Channel buffer is empty"},
    {ASYNCKIT_ECODE(ErrorModule::kConcurrent, StatusCode::kNotFound, 0x0003),
     "CHANNEL_CLOSED", "Channel closed and drained"},
    {ASYNCKIT_ECODE(ErrorModule::kTask, StatusCode::kWouldBlock, 0x0001),
     "TASK_QUEUE_FULL", "Task queue is full"},
    {ASYNCKIT_ECODE(ErrorModule::kTask, StatusCode::kInvalidArgument, 0x0001),
     "TASK_INVALID_FN", "Task function is empty"},
    {ASYNCKIT_ECODE(ErrorModule::kTask, StatusCode::kTimeout, 0x0001),
     "TASK_TIMEOUT", "Task exceeded its timeout"},
    {ASYNCKIT_ECODE(ErrorModule::kTask, StatusCode::kCancelled, 0x0001),
     "TASK_CANCELLED", "Task cancelled before or while running"},
    {ASYNCKIT_ECODE(ErrorModule::kPool, StatusCode::kPoolExhausted, 0x0001),
     "POOL_EXHAUSTED", "No resource available within acquire timeout"},
    {ASYNCKIT_ECODE(ErrorModule::kPool, StatusCode::kPoolClosed, 0x0001),
     "POOL_CLOSED", "Pool is shutting down"},
    {ASYNCKIT_ECODE(ErrorModule::kBreaker, StatusCode::kCircuitOpen, 0x0001),
     "BREAKER_OPEN", "Circuit breaker rejected the call"},
    {ASYNCKIT_ECODE(ErrorModule::kBreaker, StatusCode::kCircuitOpen, 0x0002),
     "BREAKER_TRIAL_IN_FLIGHT", "Half-open trial call already in flight"},
    {ASYNCKIT_ECODE(ErrorModule::kNet, StatusCode::kRetriesExhausted, 0x0001),
     "NET_RETRIES_EXHAUSTED", "Retryable failure persisted past max_retries"},
    {ASYNCKIT_ECODE(ErrorModule::kNet, StatusCode::kNonRetryable, 0x0001),
     "NET_NON_RETRYABLE", "Failure classified as not worth retrying"},
    {ASYNCKIT_ECODE(ErrorModule::kNet, StatusCode::kApplicationError, 0x0001),
     "NET_HTTP_ERROR", "Endpoint answered with an error status"},
    {ASYNCKIT_ECODE(ErrorModule::kStream, StatusCode::kInternalError, 0x0001),
     "STREAM_STAGE_FAILED", "Stream stage function threw"},
    {ASYNCKIT_ECODE(ErrorModule::kStream, StatusCode::kInvalidArgument, 0x0001),
     "STREAM_CONSUMED", "Stream was already consumed"},
};

#undef ASYNCKIT_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kConfig:
      return "config";
    case ErrorModule::kJson:
      return "json";
    case ErrorModule::kConcurrent:
      return "concurrent";
    case ErrorModule::kObserve:
      return "observe";
    case ErrorModule::kTask:
      return "task";
    case ErrorModule::kPool:
      return "pool";
    case ErrorModule::kBreaker:
      return "breaker";
    case ErrorModule::kRetry:
      return "retry";
    case ErrorModule::kNet:
      return "net";
    case ErrorModule::kStream:
      return "stream";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kWouldBlock:
      return "kWouldBlock";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    case StatusCode::kTimeout:
      return "kTimeout";
    case StatusCode::kCancelled:
      return "kCancelled";
    case StatusCode::kCircuitOpen:
      return "kCircuitOpen";
    case StatusCode::kPoolExhausted:
      return "kPoolExhausted";
    case StatusCode::kPoolClosed:
      return "kPoolClosed";
    case StatusCode::kRetriesExhausted:
      return "kRetriesExhausted";
    case StatusCode::kNonRetryable:
      return "kNonRetryable";
    case StatusCode::kTransportError:
      return "kTransportError";
    case StatusCode::kApplicationError:
      return "kApplicationError";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

bool IsSelfProtection(StatusCode status_code) {
  return status_code == StatusCode::kCircuitOpen || status_code == StatusCode::kPoolExhausted;
}

bool IsWorkFailure(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kTransportError:
    case StatusCode::kApplicationError:
    case StatusCode::kRetriesExhausted:
    case StatusCode::kNonRetryable:
      return true;
    default:
      return false;
  }
}

std::string Status::ToString() const {
  std::string out;
  const Status* current = this;
  while (current != NULL) {
    if (!out.empty()) out += " <- ";
    out += StatusCodeName(current->code_);
    out += "[";
    out += FormatErrorCodeHex(current->hex_code_);
    out += "]";
    if (!current->message_.empty()) {
      out += ": ";
      out += current->message_;
    }
    current = current->cause_.get();
  }
  return out;
}

}  // namespace api
}  // namespace asynckit
