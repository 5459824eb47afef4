#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "msgbridge/common.hpp"
#include "msgbridge/config.hpp"
#include "msgbridge/dispatcher.hpp"
#include "msgbridge/errors.hpp"
#include "msgbridge/event_bus.hpp"
#include "msgbridge/listener_registry.hpp"
#include "msgbridge/mailbox.hpp"
#include "msgbridge/session_cache.hpp"
#include "msgbridge/status_monitor.hpp"

namespace msgbridge {

// Process-scoped owner of the bridge. Construct once, subscribe on events(),
// then initialize(). Destruction stops every poller.
class AutomationBridge {
 public:
  explicit AutomationBridge(BridgeConfig config) : config_(std::move(config)) {}

  ~AutomationBridge() { shutdown(); }

  AutomationBridge(const AutomationBridge&) = delete;
  AutomationBridge& operator=(const AutomationBridge&) = delete;

  // Resolves the mailbox without starting anything.
  BridgeResult open() {
    std::lock_guard<std::mutex> lock(open_mu_);
    if (mailbox_) {
      return BridgeResult::success();
    }
    const auto data_dir = resolve_data_dir(config_);
    if (!data_dir) {
      return BridgeResult::failure(ErrorKind::kConfiguration, "Failed to get app data directory");
    }
    data_dir_ = *data_dir;
    mailbox_ = std::make_unique<Mailbox>(data_dir_ / config_.mailbox.dir);

    if (BridgeResult r = mailbox_->ensure_exists(); !r) {
      mailbox_.reset();
      return r;
    }
    mailbox_->export_to_environment();

    dispatcher_ = std::make_unique<OutboundDispatcher>(
        *mailbox_, &cache_,
        DispatchOptions{std::chrono::milliseconds(config_.dispatch.poll_interval_ms),
                        std::chrono::milliseconds(config_.dispatch.timeout_ms)});
    listeners_ = std::make_unique<ListenerRegistry>(*mailbox_, &bus_,
                                                    std::chrono::milliseconds(config_.listeners.interval_ms));
    monitor_ = std::make_unique<StatusMonitor>(*mailbox_, &cache_, &bus_,
                                               std::chrono::milliseconds(config_.monitor.interval_ms));
    return BridgeResult::success();
  }

  // open() plus the status monitor's initializer.
  BridgeResult initialize() {
    if (BridgeResult r = open(); !r) {
      Logger::log(Logger::Level::kError, "Failed to initialize WhatsApp bridge: " + r.message);
      return r;
    }
    return monitor_->initialize();
  }

  EventBus& events() { return bus_; }
  const BridgeConfig& config() const { return config_; }
  const fs::path& data_dir() const { return data_dir_; }
  const Mailbox* mailbox() const { return mailbox_.get(); }

  SessionStatus status() const { return cache_.get(); }

  // Reads status.txt now, bypassing the monitor. A missing file reports
  // "disconnected".
  BridgeResult refresh_status(SessionStatus* out = nullptr) {
    if (BridgeResult r = open(); !r) {
      return r;
    }
    const fs::path path = mailbox_->status_path();
    SessionStatus status;
    if (mailbox_->exists(path)) {
      const auto raw = mailbox_->read(path);
      if (!raw) {
        return BridgeResult::failure(ErrorKind::kIo, "Failed to read status file " + path.string());
      }
      std::string error;
      const auto parsed = parse_session_status_lenient(*raw, &error);
      if (!parsed) {
        return BridgeResult::failure(ErrorKind::kSerialization, "Failed to parse status JSON: " + error);
      }
      status = *parsed;
      cache_.set(status);
    } else {
      status = disconnected_session_status();
    }
    if (out) {
      *out = status;
    }
    return BridgeResult::success();
  }

  BridgeResult send_message(const std::string& phone_number, const std::string& message) {
    if (BridgeResult r = open(); !r) {
      return r;
    }
    return dispatcher_->send(phone_number, message);
  }

  BridgeResult listen(const std::string& id, const std::vector<std::string>& phone_numbers,
                      const std::string& command) {
    if (BridgeResult r = open(); !r) {
      return r;
    }
    return listeners_->register_listener(ListenerSubscription{id, phone_numbers, command});
  }

  BridgeResult stop_listener(const std::string& id) {
    if (BridgeResult r = open(); !r) {
      return r;
    }
    return listeners_->unregister_listener(id);
  }

  std::vector<std::string> active_listeners() const {
    return listeners_ ? listeners_->active_ids() : std::vector<std::string>{};
  }

  bool monitoring() const { return monitor_ && monitor_->running(); }

  // Safe to call from an event subscriber.
  void shutdown() {
    if (monitor_) {
      monitor_->stop();
    }
    if (listeners_) {
      listeners_->stop_all();
    }
  }

 private:
  BridgeConfig config_;
  std::mutex open_mu_;
  fs::path data_dir_;
  SessionCache cache_;
  EventBus bus_;
  std::unique_ptr<Mailbox> mailbox_;
  std::unique_ptr<OutboundDispatcher> dispatcher_;
  std::unique_ptr<ListenerRegistry> listeners_;
  std::unique_ptr<StatusMonitor> monitor_;
};

}  // namespace msgbridge
