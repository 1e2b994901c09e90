#include "log/log_manager_adapter.hpp"

#include "asynckit/log/log_manager.hpp"

namespace asynckit {
namespace log {

const char* LogManagerAdapter::Name() const { return "asynckit.log.glog_adapter"; }

std::uint32_t LogManagerAdapter::ApiVersion() const { return api::kApiVersion; }

void LogManagerAdapter::Release() { delete this; }

api::Status LogManagerAdapter::Init(const std::string& app_name,
                                    const std::string& config_path) {
  return LogManager::Init(app_name, config_path);
}

api::Status LogManagerAdapter::Reload(const std::string& config_path) {
  return LogManager::Reload(config_path);
}

api::Status LogManagerAdapter::Log(LogSeverity severity, const std::string& message) {
  if (severity == LogSeverity::kFatal) {
    // FATAL aborts the process inside glog; keep that reserved for LOG(FATAL) call sites.
    return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                   "fatal severity is not accepted through the interface",
                                   api::ErrorModule::kLog);
  }
  LogManager::Log(severity, message);
  return api::Status::Ok();
}

api::Result<LoggingOptions> LogManagerAdapter::CurrentOptions() const {
  return api::Result<LoggingOptions>(LogManager::CurrentOptions());
}

api::Status LogManagerAdapter::Shutdown() {
  LogManager::Shutdown();
  return api::Status::Ok();
}

}  // namespace log
}  // namespace asynckit
