#pragma once

#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "asynckit/api/export.hpp"
#include "asynckit/concurrent/cancellation.hpp"

namespace asynckit {
namespace stream {
namespace detail {

// Threads of one pipeline. Stage bodies are registered while the pipeline is built and started
// together on the first pull.
class ASYNCKIT_API StageGroup {
 public:
  StageGroup();
  // Cancels and joins.
  ~StageGroup();

  // `canceller` must make `body` return promptly (typically by cancelling its channels).
  void AddStage(const std::function<void()>& body, const std::function<void()>& canceller);

  // Starts every registered stage. Later calls are no-ops.
  void Start();

  void CancelAll();

  // Waits for every started stage thread.
  void JoinAll();

  concurrent::CancellationToken Token() const { return cancel_.Token(); }
  bool IsCancelled() const { return cancel_.IsCancelled(); }

 private:
  StageGroup(const StageGroup&);
  StageGroup& operator=(const StageGroup&);

  std::mutex mu_;
  std::vector<std::function<void()> > pending_;
  std::vector<std::function<void()> > cancellers_;
  std::vector<std::thread> threads_;
  concurrent::CancellationSource cancel_;
  bool started_;
};

}  // namespace detail
}  // namespace stream
}  // namespace asynckit
