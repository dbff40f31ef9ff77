#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace shopstack::pipeline {

/*
  Thread-safe blocking FIFO of execution ids for one pipeline worker.
*/
class PipelineScheduler {
 public:
  void Enqueue(const std::string& execution_id);

  // blocking wait; nullopt once shut down
  std::optional<std::string> Dequeue();

  // Removes a queued id; false if it was not queued.
  bool Remove(const std::string& execution_id);

  size_t Size() const;

  void Shutdown();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool                    shutdown_ = false;
};

} // namespace shopstack::pipeline
