#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "msgbridge/common.hpp"
#include "msgbridge/events.hpp"
#include "msgbridge/metrics.hpp"

namespace msgbridge {

inline constexpr const char* kStatusChangedEvent = "status-changed";
inline constexpr const char* kQrUpdatedEvent = "qr-updated";
inline constexpr const char* kMessageReceivedEvent = "message-received";

// Outward signals to the UI layer. Callbacks run on the emitting poller's
// thread, outside the subscriber lock.
class EventBus {
 public:
  using StatusSubscriber = std::function<void(const SessionStatus&)>;
  using QrSubscriber = std::function<void(const std::string&)>;
  using MessageSubscriber = std::function<void(const std::string& listener_id, const InboundMessage&)>;

  void subscribe_status(StatusSubscriber cb) {
    std::lock_guard<std::mutex> lock(mu_);
    status_subscribers_.push_back(std::move(cb));
  }

  void subscribe_qr(QrSubscriber cb) {
    std::lock_guard<std::mutex> lock(mu_);
    qr_subscribers_.push_back(std::move(cb));
  }

  void subscribe_message(MessageSubscriber cb) {
    std::lock_guard<std::mutex> lock(mu_);
    message_subscribers_.push_back(std::move(cb));
  }

  void emit_status(const SessionStatus& status) {
    metrics().inc(std::string("events.") + kStatusChangedEvent);
    deliver(kStatusChangedEvent, snapshot(status_subscribers_),
            [&status](const StatusSubscriber& cb) { cb(status); });
  }

  void emit_qr(const std::string& qr) {
    metrics().inc(std::string("events.") + kQrUpdatedEvent);
    deliver(kQrUpdatedEvent, snapshot(qr_subscribers_), [&qr](const QrSubscriber& cb) { cb(qr); });
  }

  void emit_message(const std::string& listener_id, const InboundMessage& msg) {
    metrics().inc(std::string("events.") + kMessageReceivedEvent);
    deliver(kMessageReceivedEvent, snapshot(message_subscribers_),
            [&](const MessageSubscriber& cb) { cb(listener_id, msg); });
  }

 private:
  template <typename Callback>
  std::vector<Callback> snapshot(const std::vector<Callback>& subscribers) const {
    std::lock_guard<std::mutex> lock(mu_);
    return subscribers;
  }

  template <typename Callback, typename Invoke>
  static void deliver(const char* event, const std::vector<Callback>& subscribers, Invoke invoke) {
    for (const auto& cb : subscribers) {
      try {
        invoke(cb);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("Subscriber for ") + event + " failed: " + e.what());
      }
    }
  }

  mutable std::mutex mu_;
  std::vector<StatusSubscriber> status_subscribers_;
  std::vector<QrSubscriber> qr_subscribers_;
  std::vector<MessageSubscriber> message_subscribers_;
};

}  // namespace msgbridge
