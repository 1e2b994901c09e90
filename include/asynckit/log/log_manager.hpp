#pragma once

#include <string>

#include "asynckit/api/export.hpp"
#include "asynckit/api/status.hpp"
#include "asynckit/log/log_types.hpp"

namespace asynckit {
namespace log {

// Process-wide glog front end. Callers never include glog headers.
class ASYNCKIT_API LogManager {
 public:
  // Initialize glog with an application name and optional config file.
  // Returns kOk when already initialized.
  static api::Status Init(const std::string& app_name,
                          const std::string& config_path = std::string());

  // Reload configuration at runtime. On failure the active options stay in effect.
  static api::Status Reload(const std::string& config_path);

  static LoggingOptions CurrentOptions();
  static bool IsInitialized();

  // Shutdown glog. Repeated calls are no-ops.
  static void Shutdown();

  static void Log(LogSeverity severity, const std::string& message);

  // True when VLOG(level) output is enabled.
  static bool IsVerbose(int level);

  // Parse config text. Unknown keys are ignored, malformed values fail with kInvalidArgument.
  static api::Result<LoggingOptions> ParseOptions(const std::string& text);

  // Empty path yields defaults, a missing file yields kNotFound.
  static api::Result<LoggingOptions> LoadOptions(const std::string& path);

 private:
  static api::Status ApplyOptions(const LoggingOptions& options);
};

}  // namespace log
}  // namespace asynckit
