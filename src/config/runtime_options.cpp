#include "asynckit/config/runtime_options.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace asynckit {
namespace config {

#define ASYNCKIT_CONFIG_STATUS(message, detail)                                          \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message), api::ErrorModule::kConfig, \
                          (detail))

namespace {

// Unsigned integers only; a negative or fractional number is a type error.
api::Status ReadUnsigned(const json::Json& section, const char* section_name, const char* key,
                         std::uint64_t* out) {
  if (!section.contains(key)) return api::Status::Ok();
  const json::Json& value = section[key];
  const bool non_negative =
      value.is_number_unsigned() || (value.is_number_integer() && value.get<std::int64_t>() >= 0);
  if (!non_negative) {
    return ASYNCKIT_CONFIG_STATUS(std::string(section_name) + "." + key +
                                      " must be a non-negative integer",
                                  0x0001);
  }
  *out = value.get<std::uint64_t>();
  return api::Status::Ok();
}

api::Status ReadDouble(const json::Json& section, const char* section_name, const char* key,
                       double* out) {
  if (!section.contains(key)) return api::Status::Ok();
  const json::Json& value = section[key];
  if (!value.is_number()) {
    return ASYNCKIT_CONFIG_STATUS(std::string(section_name) + "." + key + " must be a number",
                                  0x0001);
  }
  *out = value.get<double>();
  return api::Status::Ok();
}

api::Status ReadBool(const json::Json& section, const char* section_name, const char* key,
                     bool* out) {
  if (!section.contains(key)) return api::Status::Ok();
  const json::Json& value = section[key];
  if (!value.is_boolean()) {
    return ASYNCKIT_CONFIG_STATUS(std::string(section_name) + "." + key + " must be boolean",
                                  0x0001);
  }
  *out = value.get<bool>();
  return api::Status::Ok();
}

api::Status ReadSize(const json::Json& section, const char* section_name, const char* key,
                     std::size_t* out) {
  std::uint64_t value = *out;
  api::Status st = ReadUnsigned(section, section_name, key, &value);
  if (st.ok()) *out = static_cast<std::size_t>(value);
  return st;
}

api::Status ReadU32(const json::Json& section, const char* section_name, const char* key,
                    std::uint32_t* out) {
  std::uint64_t value = *out;
  api::Status st = ReadUnsigned(section, section_name, key, &value);
  if (!st.ok()) return st;
  if (value > 0xFFFFFFFFull) {
    return ASYNCKIT_CONFIG_STATUS(std::string(section_name) + "." + key + " is out of range",
                                  0x0001);
  }
  *out = static_cast<std::uint32_t>(value);
  return api::Status::Ok();
}

const std::uint64_t kMaxMillis = 0x7FFFFFFFFFFFFFFFull;

api::Status ReadMillisKey(const json::Json& section, const char* section_name,
                          const std::string& key, std::chrono::milliseconds* out) {
  std::uint64_t value = static_cast<std::uint64_t>(out->count());
  api::Status st = ReadUnsigned(section, section_name, key.c_str(), &value);
  if (!st.ok()) return st;
  if (value > kMaxMillis) {
    return ASYNCKIT_CONFIG_STATUS(std::string(section_name) + "." + key + " is out of range",
                                  0x0001);
  }
  *out = std::chrono::milliseconds(static_cast<std::int64_t>(value));
  return api::Status::Ok();
}

// Durations are milliseconds under `key`; `key`_ms is accepted too and loses when both are set.
api::Status ReadMillis(const json::Json& section, const char* section_name, const char* key,
                       std::chrono::milliseconds* out) {
  api::Status st = ReadMillisKey(section, section_name, std::string(key) + "_ms", out);
  if (!st.ok()) return st;
  return ReadMillisKey(section, section_name, key, out);
}

// Missing sections are fine; present ones must be objects.
api::Status Section(const json::Json& root, const char* name, const json::Json** out) {
  *out = NULL;
  if (!root.contains(name)) return api::Status::Ok();
  const json::Json& section = root[name];
  if (!section.is_object()) {
    return ASYNCKIT_CONFIG_STATUS(std::string(name) + " must be JSON object", 0x0001);
  }
  *out = &section;
  return api::Status::Ok();
}

// `present` stays false when the variable is unset or empty.
api::Status ReadEnvUnsigned(const char* name, bool* present, std::uint64_t* out) {
  *present = false;
  const char* raw = std::getenv(name);
  if (raw == NULL || *raw == '\0') return api::Status::Ok();
  char* end = NULL;
  errno = 0;
  const unsigned long long value = std::strtoull(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0' || raw[0] == '-') {
    return ASYNCKIT_CONFIG_STATUS(
        std::string(name) + "='" + raw + "' is not a non-negative integer", 0x0002);
  }
  *present = true;
  *out = static_cast<std::uint64_t>(value);
  return api::Status::Ok();
}

}  // namespace

#define ASYNCKIT_RETURN_IF_ERROR(expr) \
  do {                                 \
    const api::Status _st = (expr);    \
    if (!_st.ok()) return _st;         \
  } while (0)

namespace {

api::Status ParseInto(const json::Json& root, RuntimeOptions* options) {
  if (!root.is_object()) {
    return ASYNCKIT_CONFIG_STATUS("root JSON must be object", 0x0001);
  }
  const json::Json* section = NULL;

  ASYNCKIT_RETURN_IF_ERROR(Section(root, "runner", &section));
  if (section != NULL) {
    ASYNCKIT_RETURN_IF_ERROR(
        ReadSize(*section, "runner", "max_workers", &options->runner.max_workers));
    ASYNCKIT_RETURN_IF_ERROR(
        ReadMillis(*section, "runner", "default_timeout", &options->runner.default_timeout));
    ASYNCKIT_RETURN_IF_ERROR(ReadBool(*section, "runner", "fail_fast", &options->runner.fail_fast));
    ASYNCKIT_RETURN_IF_ERROR(
        ReadSize(*section, "runner", "max_threads", &options->runner.max_threads));
  }

  ASYNCKIT_RETURN_IF_ERROR(Section(root, "pool", &section));
  if (section != NULL) {
    ASYNCKIT_RETURN_IF_ERROR(
        ReadSize(*section, "pool", "max_resources", &options->client.pool.max_resources));
    ASYNCKIT_RETURN_IF_ERROR(
        ReadMillis(*section, "pool", "acquire_timeout", &options->client.pool.acquire_timeout));
  }

  ASYNCKIT_RETURN_IF_ERROR(Section(root, "breaker", &section));
  if (section != NULL) {
    ASYNCKIT_RETURN_IF_ERROR(ReadU32(*section, "breaker", "failure_threshold",
                                     &options->client.breaker.failure_threshold));
    ASYNCKIT_RETURN_IF_ERROR(ReadMillis(*section, "breaker", "recovery_timeout",
                                        &options->client.breaker.recovery_timeout));
  }

  ASYNCKIT_RETURN_IF_ERROR(Section(root, "retry", &section));
  if (section != NULL) {
    retry::RetryOptions& retry = options->client.retry;
    ASYNCKIT_RETURN_IF_ERROR(ReadU32(*section, "retry", "max_retries", &retry.max_retries));
    ASYNCKIT_RETURN_IF_ERROR(ReadMillis(*section, "retry", "backoff_base", &retry.backoff_base));
    ASYNCKIT_RETURN_IF_ERROR(ReadDouble(*section, "retry", "backoff_factor", &retry.backoff_factor));
    ASYNCKIT_RETURN_IF_ERROR(ReadMillis(*section, "retry", "max_backoff", &retry.max_backoff));
    ASYNCKIT_RETURN_IF_ERROR(ReadDouble(*section, "retry", "jitter", &retry.jitter));
  }

  ASYNCKIT_RETURN_IF_ERROR(Section(root, "stream", &section));
  if (section != NULL) {
    ASYNCKIT_RETURN_IF_ERROR(
        ReadSize(*section, "stream", "buffer_capacity", &options->stream.buffer_capacity));
  }

  ASYNCKIT_RETURN_IF_ERROR(Section(root, "client", &section));
  if (section != NULL) {
    ASYNCKIT_RETURN_IF_ERROR(ReadMillis(*section, "client", "request_timeout",
                                        &options->client.request_timeout));
    ASYNCKIT_RETURN_IF_ERROR(
        ReadSize(*section, "client", "batch_workers", &options->client.batch_workers));
  }
  return api::Status::Ok();
}

}  // namespace

api::Result<RuntimeOptions> ParseRuntimeOptions(const json::Json& root) {
  RuntimeOptions options;
  api::Status st = ParseInto(root, &options);
  if (!st.ok()) return api::Result<RuntimeOptions>(st);
  st = ValidateRuntimeOptions(options);
  if (!st.ok()) return api::Result<RuntimeOptions>(st);
  return api::Result<RuntimeOptions>(options);
}

api::Result<RuntimeOptions> LoadRuntimeOptions(const std::string& path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(path);
  if (!loaded.ok()) return api::Result<RuntimeOptions>(loaded.status());
  return ParseRuntimeOptions(loaded.value());
}

api::Status ApplyEnvironmentOverrides(RuntimeOptions* options) {
  if (options == NULL) {
    return ASYNCKIT_CONFIG_STATUS("options is null", 0);
  }
  RuntimeOptions updated = *options;
  bool present = false;
  std::uint64_t value = 0;

  ASYNCKIT_RETURN_IF_ERROR(ReadEnvUnsigned("ASYNCKIT_WORKERS", &present, &value));
  if (present) updated.runner.max_workers = static_cast<std::size_t>(value);

  ASYNCKIT_RETURN_IF_ERROR(ReadEnvUnsigned("ASYNCKIT_TIMEOUT", &present, &value));
  if (present && value > kMaxMillis / 1000) {
    return ASYNCKIT_CONFIG_STATUS("ASYNCKIT_TIMEOUT is out of range", 0x0002);
  }
  if (present) {
    updated.runner.default_timeout =
        std::chrono::milliseconds(static_cast<std::int64_t>(value) * 1000);
  }

  ASYNCKIT_RETURN_IF_ERROR(ReadEnvUnsigned("ASYNCKIT_RETRY_MAX", &present, &value));
  if (present && value > 0xFFFFFFFFull) {
    return ASYNCKIT_CONFIG_STATUS("ASYNCKIT_RETRY_MAX is out of range", 0x0002);
  }
  if (present) updated.client.retry.max_retries = static_cast<std::uint32_t>(value);

  ASYNCKIT_RETURN_IF_ERROR(ReadEnvUnsigned("ASYNCKIT_POOL_SIZE", &present, &value));
  if (present) updated.client.pool.max_resources = static_cast<std::size_t>(value);

  *options = updated;
  return api::Status::Ok();
}

api::Status ValidateRuntimeOptions(const RuntimeOptions& options) {
  if (options.runner.max_workers < 1) {
    return ASYNCKIT_CONFIG_STATUS("runner.max_workers must be >= 1", 0x0001);
  }
  if (options.client.pool.max_resources < 1) {
    return ASYNCKIT_CONFIG_STATUS("pool.max_resources must be >= 1", 0x0001);
  }
  if (options.client.breaker.failure_threshold < 1) {
    return ASYNCKIT_CONFIG_STATUS("breaker.failure_threshold must be >= 1", 0x0001);
  }
  if (options.stream.buffer_capacity < 1) {
    return ASYNCKIT_CONFIG_STATUS("stream.buffer_capacity must be >= 1", 0x0001);
  }
  const api::Status retry_st = retry::RetryPolicy::ValidateOptions(options.client.retry);
  if (!retry_st.ok()) {
    return ASYNCKIT_CONFIG_STATUS("retry: " + retry_st.message(), 0x0001);
  }
  return api::Status::Ok();
}

json::Json RuntimeOptionsToJson(const RuntimeOptions& options) {
  json::Json root = json::Json::object();
  root["runner"]["max_workers"] = options.runner.max_workers;
  root["runner"]["default_timeout"] = options.runner.default_timeout.count();
  root["runner"]["fail_fast"] = options.runner.fail_fast;
  root["runner"]["max_threads"] = options.runner.max_threads;
  root["pool"]["max_resources"] = options.client.pool.max_resources;
  root["pool"]["acquire_timeout"] = options.client.pool.acquire_timeout.count();
  root["breaker"]["failure_threshold"] = options.client.breaker.failure_threshold;
  root["breaker"]["recovery_timeout"] = options.client.breaker.recovery_timeout.count();
  root["retry"]["max_retries"] = options.client.retry.max_retries;
  root["retry"]["backoff_base"] = options.client.retry.backoff_base.count();
  root["retry"]["backoff_factor"] = options.client.retry.backoff_factor;
  root["retry"]["max_backoff"] = options.client.retry.max_backoff.count();
  root["retry"]["jitter"] = options.client.retry.jitter;
  root["stream"]["buffer_capacity"] = options.stream.buffer_capacity;
  root["client"]["request_timeout"] = options.client.request_timeout.count();
  root["client"]["batch_workers"] = options.client.batch_workers;
  return root;
}

#undef ASYNCKIT_RETURN_IF_ERROR
#undef ASYNCKIT_CONFIG_STATUS

}  // namespace config
}  // namespace asynckit
