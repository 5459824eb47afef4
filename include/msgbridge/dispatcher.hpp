#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include "msgbridge/common.hpp"
#include "msgbridge/errors.hpp"
#include "msgbridge/mailbox.hpp"
#include "msgbridge/metrics.hpp"
#include "msgbridge/session_cache.hpp"

namespace msgbridge {

struct DispatchOptions {
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds timeout{5000};
};

// Request/response over message.json and message_error.txt. Only one request
// file can exist in the mailbox, so exchanges from this process are
// serialized; other processes sharing the mailbox must serialize themselves.
class OutboundDispatcher {
 public:
  OutboundDispatcher(Mailbox mailbox, const SessionCache* cache, DispatchOptions options = {})
      : mailbox_(std::move(mailbox)), cache_(cache), options_(options) {}

  BridgeResult send(const std::string& phone_number, const std::string& message) {
    const SessionStatus status = cache_->get();
    if (!status.connected()) {
      metrics().inc("dispatch.rejected");
      const std::string err = "WhatsApp is not connected (status: " + status.status +
                              "). Please scan the QR code first.";
      Logger::log(Logger::Level::kWarn, err);
      return BridgeResult::failure(ErrorKind::kPrecondition, err);
    }

    const std::string phone = digits_only(phone_number);
    if (phone.empty()) {
      metrics().inc("dispatch.rejected");
      return BridgeResult::failure(ErrorKind::kInvalidArgument,
                                   "Phone number '" + phone_number + "' contains no digits");
    }

    std::lock_guard<std::mutex> lock(send_mu_);
    Logger::log(Logger::Level::kInfo, "Sending message to " + mask_phone_number(phone) + " (" +
                                          std::to_string(message.size()) + " chars)");

    if (BridgeResult r = mailbox_.ensure_exists(); !r) {
      return fail(r);
    }

    const fs::path message_path = mailbox_.message_path();
    const fs::path error_path = mailbox_.message_error_path();

    if (BridgeResult r = mailbox_.remove(error_path, "stale message error"); !r) {
      return fail(r);
    }

    std::string payload;
    try {
      payload = OutboundMessageRequest{phone, message}.to_json().dump(2);
    } catch (const json::exception& e) {
      return fail(BridgeResult::failure(ErrorKind::kSerialization,
                                        std::string("Failed to serialize message data: ") + e.what()));
    }
    if (BridgeResult r = mailbox_.write(message_path, payload, "message"); !r) {
      return fail(r);
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    for (;;) {
      std::this_thread::sleep_for(options_.poll_interval);

      if (mailbox_.exists(error_path)) {
        return take_service_error(error_path);
      }
      if (!mailbox_.exists(message_path)) {
        // The service may drop the request and report an error in one step.
        if (mailbox_.exists(error_path)) {
          return take_service_error(error_path);
        }
        metrics().inc("dispatch.sent");
        Logger::log(Logger::Level::kInfo, "Message to " + mask_phone_number(phone) + " delivered to service");
        return BridgeResult::success();
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        break;
      }
    }

    metrics().inc("dispatch.timeout");
    Logger::log(Logger::Level::kWarn, "Message sending timed out after " +
                                          std::to_string(options_.timeout.count()) + " ms");
    if (BridgeResult r = mailbox_.remove(message_path, "message"); !r) {
      Logger::log(Logger::Level::kError, r.message);
    }
    return BridgeResult::failure(ErrorKind::kTimeout, "Timeout while sending message");
  }

  const DispatchOptions& options() const { return options_; }

 private:
  BridgeResult take_service_error(const fs::path& error_path) {
    // The service is done with a request it reported on, readable or not.
    if (BridgeResult r = mailbox_.remove(mailbox_.message_path(), "message"); !r) {
      Logger::log(Logger::Level::kWarn, r.message);
    }
    const auto content = mailbox_.read(error_path);
    if (!content) {
      return fail(BridgeResult::failure(ErrorKind::kIo, "Failed to read error file " + error_path.string()));
    }
    if (BridgeResult r = mailbox_.remove(error_path, "message error"); !r) {
      Logger::log(Logger::Level::kWarn, r.message);
    }
    metrics().inc("dispatch.failed");
    Logger::log(Logger::Level::kWarn, "Error from WhatsApp service: " + trim(*content));
    return BridgeResult::failure(ErrorKind::kService, *content);
  }

  static BridgeResult fail(BridgeResult r) {
    metrics().inc("dispatch.failed");
    Logger::log(Logger::Level::kError, r.message);
    return r;
  }

  Mailbox mailbox_;
  const SessionCache* cache_;
  DispatchOptions options_;
  std::mutex send_mu_;
};

}  // namespace msgbridge
