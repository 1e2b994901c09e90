#include "asynckit/stream/stage_group.hpp"

#include <glog/logging.h>

namespace asynckit {
namespace stream {
namespace detail {

StageGroup::StageGroup() : started_(false) {}

StageGroup::~StageGroup() {
  CancelAll();
  JoinAll();
}

void StageGroup::AddStage(const std::function<void()>& body,
                          const std::function<void()>& canceller) {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_) {
    LOG(ERROR) << "stream stage added after the pipeline started, ignoring it";
    return;
  }
  if (body) pending_.push_back(body);
  if (canceller) cancellers_.push_back(canceller);
}

void StageGroup::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_) return;
  started_ = true;
  for (std::size_t i = 0; i < pending_.size(); ++i) {
    threads_.push_back(std::thread(pending_[i]));
  }
  pending_.clear();
  VLOG(1) << "stream pipeline started " << threads_.size() << " stage threads";
}

void StageGroup::CancelAll() {
  cancel_.Cancel();
  std::vector<std::function<void()> > cancellers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancellers = cancellers_;
  }
  for (std::size_t i = 0; i < cancellers.size(); ++i) cancellers[i]();
}

void StageGroup::JoinAll() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mu_);
    threads.swap(threads_);
  }
  for (std::size_t i = 0; i < threads.size(); ++i) {
    if (threads[i].get_id() == std::this_thread::get_id()) {
      LOG(ERROR) << "stream pipeline released from one of its own stages";
      threads[i].detach();
      continue;
    }
    if (threads[i].joinable()) threads[i].join();
  }
}

}  // namespace detail
}  // namespace stream
}  // namespace asynckit
