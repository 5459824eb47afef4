#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "msgbridge/common.hpp"

namespace msgbridge {

// Runs `tick` on a background thread every `interval` until stopped.
//
// Event callbacks are delivered from inside `tick`, so stop() may be reached
// on the worker thread itself. In that case it only requests the stop and the
// join happens on the owner's next stop() or in the destructor. The
// destructor must not run on the worker thread.
class PollingWorker {
 public:
  PollingWorker(std::string name, std::chrono::milliseconds interval)
      : name_(std::move(name)), interval_(interval) {}

  ~PollingWorker() { stop(); }

  PollingWorker(const PollingWorker&) = delete;
  PollingWorker& operator=(const PollingWorker&) = delete;

  // With tick_first the first tick runs immediately, otherwise after one
  // interval. Returns false if already running or called from the worker.
  bool start(std::function<void()> tick, bool tick_first) {
    if (on_worker_thread()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(join_mu_);
    if (running_.load()) {
      return false;
    }
    // A previous run may have been stopped from its own callback.
    if (worker_.joinable()) {
      worker_.join();
    }
    running_.store(true);
    worker_ = std::thread([this, tick = std::move(tick), tick_first]() { run(tick, tick_first); });
    return true;
  }

  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      running_.store(false);
    }
    cv_.notify_all();
  }

  void stop() {
    request_stop();
    if (on_worker_thread()) {
      return;
    }
    std::lock_guard<std::mutex> lock(join_mu_);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool running() const { return running_.load(); }

  bool on_worker_thread() const { return worker_id_.load() == std::this_thread::get_id(); }

 private:
  void run(const std::function<void()>& tick, bool tick_first) {
    worker_id_.store(std::this_thread::get_id());
    bool wait_first = !tick_first;
    while (running_.load()) {
      if (wait_first) {
        std::unique_lock<std::mutex> lock(wait_mu_);
        cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
        if (!running_.load()) {
          break;
        }
      }
      wait_first = true;

      try {
        tick();
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, name_ + " poll failed: " + e.what());
      }
    }
    worker_id_.store(std::thread::id{});
  }

  std::string name_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::atomic<std::thread::id> worker_id_{};
  std::thread worker_;
  std::mutex join_mu_;
  std::mutex wait_mu_;
  std::condition_variable cv_;
};

}  // namespace msgbridge
