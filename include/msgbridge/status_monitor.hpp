#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include "msgbridge/common.hpp"
#include "msgbridge/errors.hpp"
#include "msgbridge/event_bus.hpp"
#include "msgbridge/mailbox.hpp"
#include "msgbridge/session_cache.hpp"
#include "msgbridge/worker.hpp"

namespace msgbridge {

inline constexpr std::chrono::milliseconds kDefaultStatusPollInterval{500};

// Watches status.txt and qr.txt, keeps the session cache current and emits
// status-changed / qr-updated only when the observed value changes.
class StatusMonitor {
 public:
  StatusMonitor(Mailbox mailbox, SessionCache* cache, EventBus* bus,
                std::chrono::milliseconds interval = kDefaultStatusPollInterval)
      : mailbox_(std::move(mailbox)), cache_(cache), bus_(bus), worker_("Status monitor", interval) {}

  ~StatusMonitor() { stop(); }

  StatusMonitor(const StatusMonitor&) = delete;
  StatusMonitor& operator=(const StatusMonitor&) = delete;

  // Announces "initializing" to the service and the UI, then starts polling.
  BridgeResult initialize() {
    if (BridgeResult r = mailbox_.ensure_exists(); !r) {
      return r;
    }

    const SessionStatus init = initializing_session_status();
    const BridgeResult written = mailbox_.write(mailbox_.status_path(), init.to_json().dump(2), "status");
    if (!written) {
      Logger::log(Logger::Level::kWarn, written.message);
    }
    cache_->set(init);
    {
      std::lock_guard<std::mutex> lock(poll_mu_);
      last_status_ = init.status;
    }
    bus_->emit_status(init);

    start();
    return BridgeResult::success();
  }

  void start() {
    if (worker_.start([this]() { poll_once(); }, true)) {
      Logger::log(Logger::Level::kInfo, "Status monitor watching " + mailbox_.dir().string());
    }
  }

  // Safe to call from a status or QR subscriber.
  void stop() { worker_.stop(); }

  bool running() const { return worker_.running(); }

  // One observation cycle; the background loop is built on this.
  void poll_once() {
    std::lock_guard<std::mutex> lock(poll_mu_);
    poll_status();
    poll_qr();
  }

 private:
  void poll_status() {
    const auto raw = mailbox_.read(mailbox_.status_path());
    if (!raw) {
      return;
    }
    std::string error;
    const auto status = parse_session_status(*raw, &error);
    if (!status) {
      Logger::log(Logger::Level::kDebug, "Ignoring unreadable status file: " + error);
      return;
    }

    cache_->set(*status);
    if (status->status == last_status_) {
      return;
    }
    last_status_ = status->status;
    Logger::log(Logger::Level::kInfo, "Session status: " + status->status);
    bus_->emit_status(*status);
  }

  void poll_qr() {
    const auto raw = mailbox_.read(mailbox_.qr_path());
    if (!raw) {
      return;
    }
    const std::string qr = trim(*raw);
    if (qr == last_qr_) {
      return;
    }
    last_qr_ = qr;
    Logger::log(Logger::Level::kInfo, "Pairing QR code updated");
    bus_->emit_qr(qr);
  }

  Mailbox mailbox_;
  SessionCache* cache_;
  EventBus* bus_;

  std::mutex poll_mu_;
  std::string last_status_;
  std::string last_qr_;

  // Last member: stopped before the state it polls is destroyed.
  PollingWorker worker_;
};

}  // namespace msgbridge
