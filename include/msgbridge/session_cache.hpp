#pragma once

#include <mutex>

#include "msgbridge/events.hpp"

namespace msgbridge {

// Last observed session status. Written by the status monitor (and the
// initializer), read by command handlers. No I/O happens under the lock.
class SessionCache {
 public:
  SessionCache() : status_(initializing_session_status()) {}
  explicit SessionCache(SessionStatus initial) : status_(std::move(initial)) {}

  SessionStatus get() const {
    std::lock_guard<std::mutex> lock(mu_);
    return status_;
  }

  void set(SessionStatus status) {
    std::lock_guard<std::mutex> lock(mu_);
    status_ = std::move(status);
  }

 private:
  mutable std::mutex mu_;
  SessionStatus status_;
};

}  // namespace msgbridge
