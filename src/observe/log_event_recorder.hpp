#pragma once

#include "asynckit/observe/i_event_recorder.hpp"

namespace asynckit {
namespace observe {

// Writes each event as one glog INFO line: "event task.start index=0 id=fetch".
class LogEventRecorder : public IEventRecorder {
 public:
  LogEventRecorder() {}
  ~LogEventRecorder() override {}

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  void RecordEvent(const std::string& name, const EventAttributes& attributes) override;
};

}  // namespace observe
}  // namespace asynckit
