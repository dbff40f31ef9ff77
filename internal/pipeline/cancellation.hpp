#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace shopstack::pipeline {

enum class CancelReason : std::uint8_t {
  kNone = 0,
  kCancelled,
  kTimeout,
  // worker stopping; the execution is reported as interrupted
  kShutdown,
};

/*
  Cooperative cancellation flag shared between the orchestrator and the stage
  work it runs. Copies observe the same flag. The first reason wins.
*/
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<std::atomic<CancelReason>>(CancelReason::kNone)) {
  }

  // A token nobody can raise; handed to work that must not be interrupted.
  static CancellationToken Never() {
    return CancellationToken();
  }

  bool Cancel(CancelReason reason) const {
    auto expected = CancelReason::kNone;
    return state_->compare_exchange_strong(expected, reason);
  }

  bool IsCancelled() const {
    return state_->load() != CancelReason::kNone;
  }

  CancelReason Reason() const {
    return state_->load();
  }

 private:
  std::shared_ptr<std::atomic<CancelReason>> state_;
};

// Raised by stage work that stopped because its token was raised.
class OperationCancelled : public std::runtime_error {
 public:
  OperationCancelled(CancelReason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  CancelReason reason() const {
    return reason_;
  }

 private:
  CancelReason reason_;
};

inline void ThrowIfCancelled(const CancellationToken& token, const std::string& where) {
  if (token.IsCancelled()) {
    const auto reason = token.Reason();
    const char* prefix = reason == CancelReason::kTimeout    ? "timed out before "
                         : reason == CancelReason::kShutdown ? "stopped before "
                                                             : "cancelled before ";
    throw OperationCancelled(reason, prefix + where);
  }
}

} // namespace shopstack::pipeline
