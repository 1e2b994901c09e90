#include "observe/log_event_recorder.hpp"

#include <glog/logging.h>

namespace asynckit {
namespace observe {

const char* LogEventRecorder::Name() const { return "asynckit.observe.log_recorder"; }
std::uint32_t LogEventRecorder::ApiVersion() const { return api::kApiVersion; }
void LogEventRecorder::Release() { delete this; }

void LogEventRecorder::RecordEvent(const std::string& name, const EventAttributes& attributes) {
  std::string line = "event " + name;
  for (std::size_t i = 0; i < attributes.size(); ++i) {
    line += " ";
    line += attributes[i].first;
    line += "=";
    line += attributes[i].second;
  }
  LOG(INFO) << line;
}

}  // namespace observe
}  // namespace asynckit
