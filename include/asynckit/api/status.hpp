#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "asynckit/api/export.hpp"

namespace asynckit {
namespace api {

// Four bits are reserved for the status family in the packed code, keep this enum <= 16 entries.
enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotFound,
  kWouldBlock,
  kIoError,
  kInternalError,
  kUnsupported,
  kTimeout,
  kCancelled,
  kCircuitOpen,
  kPoolExhausted,
  kPoolClosed,
  kRetriesExhausted,
  kNonRetryable,
  kTransportError,
  kApplicationError
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kConfig = 0x11,
  kJson = 0x12,
  kConcurrent = 0x20,
  kObserve = 0x21,
  kTask = 0x30,
  kPool = 0x40,
  kBreaker = 0x50,
  kRetry = 0x60,
  kNet = 0x70,
  kStream = 0x80,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
ASYNCKIT_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                         std::uint32_t detail_id = 0);
ASYNCKIT_API const char* ErrorModuleName(ErrorModule module);
ASYNCKIT_API const char* StatusCodeName(StatusCode status_code);
ASYNCKIT_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
ASYNCKIT_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

// "The system protected itself": the call was vetoed before any work was attempted.
ASYNCKIT_API bool IsSelfProtection(StatusCode status_code);

// "The work itself failed": transport/application errors and the wrappers around them.
ASYNCKIT_API bool IsWorkFailure(StatusCode status_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}
  Status(StatusCode code, std::string message, std::uint32_t hex_code)
      : code_(code), message_(std::move(message)), hex_code_(hex_code) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // Underlying error this status wraps, NULL when there is none.
  const Status* cause() const { return cause_.get(); }

  // Returns a copy of this status wrapping `cause`. An ok cause is not attached.
  Status WithCause(const Status& cause) const {
    Status out(*this);
    if (!cause.ok()) out.cause_ = std::make_shared<const Status>(cause);
    return out;
  }

  // Innermost status of the cause chain (this status when nothing is wrapped).
  const Status& RootCause() const {
    const Status* current = this;
    while (current->cause_) current = current->cause_.get();
    return *current;
  }

  // "kTimeout[0x70700002]: message <- kTransportError[...]: inner"
  ASYNCKIT_API std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
  std::shared_ptr<const Status> cause_;
};

template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), has_value_(false), value_() {}
  Result(const T& value) : status_(Status::Ok()), has_value_(true), value_(value) {}
  Result(T&& value) : status_(Status::Ok()), has_value_(true), value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  bool has_value() const { return has_value_; }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  bool has_value_;
  T value_;
};

}  // namespace api
}  // namespace asynckit
