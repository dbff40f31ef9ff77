#include "pipeline_scheduler.hpp"

#include <algorithm>

namespace shopstack::pipeline {

void PipelineScheduler::Enqueue(const std::string& execution_id) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(execution_id);
  }
  cv_.notify_one();
}

std::optional<std::string> PipelineScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  std::string id = std::move(queue_.front());
  queue_.pop_front();
  return id;
}

bool PipelineScheduler::Remove(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  auto            it = std::find(queue_.begin(), queue_.end(), execution_id);
  if (it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

size_t PipelineScheduler::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void PipelineScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace shopstack::pipeline
