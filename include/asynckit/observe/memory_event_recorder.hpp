#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "concurrentqueue.h"

#include "asynckit/api/export.hpp"
#include "asynckit/observe/i_event_recorder.hpp"

namespace asynckit {
namespace observe {

struct RecordedEvent {
  std::uint64_t seq = 0;
  std::string name;
  EventAttributes attributes;

  // Empty string when the attribute is absent.
  std::string Attribute(const std::string& key) const {
    for (std::size_t i = 0; i < attributes.size(); ++i) {
      if (attributes[i].first == key) return attributes[i].second;
    }
    return std::string();
  }
};

// Lock-free in-memory recorder. Producers never block; Drain() hands events back in record order.
class ASYNCKIT_API MemoryEventRecorder : public IEventRecorder {
 public:
  explicit MemoryEventRecorder(std::size_t initial_capacity = 1024);
  ~MemoryEventRecorder() override {}

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  void RecordEvent(const std::string& name, const EventAttributes& attributes) override;

  std::vector<RecordedEvent> Drain();
  std::size_t ApproxSize() const;

 private:
  moodycamel::ConcurrentQueue<RecordedEvent> queue_;
  std::atomic<std::uint64_t> next_seq_;
  std::atomic<std::int64_t> size_;
};

}  // namespace observe
}  // namespace asynckit
