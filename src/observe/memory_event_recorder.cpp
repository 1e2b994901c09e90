#include "asynckit/observe/memory_event_recorder.hpp"

#include <algorithm>
#include <utility>

namespace asynckit {
namespace observe {

namespace {

class NullRecorder : public IEventRecorder {
 public:
  const char* Name() const override { return "asynckit.observe.null_recorder"; }
  std::uint32_t ApiVersion() const override { return api::kApiVersion; }
  void Release() override {}
  void RecordEvent(const std::string&, const EventAttributes&) override {}
};

bool SeqLess(const RecordedEvent& a, const RecordedEvent& b) { return a.seq < b.seq; }

}  // namespace

IEventRecorder* NullEventRecorder() {
  static NullRecorder recorder;
  return &recorder;
}

MemoryEventRecorder::MemoryEventRecorder(std::size_t initial_capacity)
    : queue_(initial_capacity == 0 ? 1024 : initial_capacity), next_seq_(0), size_(0) {}

const char* MemoryEventRecorder::Name() const { return "asynckit.observe.memory_recorder"; }
std::uint32_t MemoryEventRecorder::ApiVersion() const { return api::kApiVersion; }
void MemoryEventRecorder::Release() { delete this; }

void MemoryEventRecorder::RecordEvent(const std::string& name,
                                      const EventAttributes& attributes) {
  RecordedEvent event;
  event.seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
  event.name = name;
  event.attributes = attributes;
  if (queue_.enqueue(std::move(event))) {
    size_.fetch_add(1, std::memory_order_relaxed);
  }
}

std::vector<RecordedEvent> MemoryEventRecorder::Drain() {
  std::vector<RecordedEvent> out;
  RecordedEvent event;
  while (queue_.try_dequeue(event)) {
    size_.fetch_sub(1, std::memory_order_relaxed);
    out.push_back(std::move(event));
  }
  // Per-producer FIFO only; restore global record order.
  std::sort(out.begin(), out.end(), SeqLess);
  return out;
}

std::size_t MemoryEventRecorder::ApproxSize() const {
  const std::int64_t size = size_.load(std::memory_order_relaxed);
  return size < 0 ? 0 : static_cast<std::size_t>(size);
}

}  // namespace observe
}  // namespace asynckit
