#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "msgbridge/common.hpp"
#include "msgbridge/errors.hpp"
#include "msgbridge/event_bus.hpp"
#include "msgbridge/mailbox.hpp"
#include "msgbridge/metrics.hpp"
#include "msgbridge/worker.hpp"

namespace msgbridge {

inline constexpr std::chrono::milliseconds kDefaultListenerPollInterval{500};
inline constexpr std::size_t kMaxListenerIdLength = 128;

// Listener ids become part of a file name inside the mailbox.
inline bool is_valid_listener_id(const std::string& id) {
  if (id.empty() || id.size() > kMaxListenerIdLength || id == "." || id == "..") {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
  });
}

inline std::string strip_jid_domain(const std::string& s) {
  const auto p = s.find('@');
  return p == std::string::npos ? s : s.substr(0, p);
}

inline bool phone_matches(const std::string& allowed, const std::string& candidate) {
  const std::string a = trim(strip_jid_domain(allowed));
  const std::string c = trim(strip_jid_domain(candidate));
  if (a.empty()) {
    return false;
  }
  if (a == c) {
    return true;
  }
  const std::string da = digits_only(a);
  return !da.empty() && da == digits_only(c);
}

// Empty allow-list admits everything.
inline bool is_allowed_counterparty(const std::vector<std::string>& allow_list, const InboundMessage& msg) {
  if (allow_list.empty()) {
    return true;
  }
  const std::string& who = msg.counterparty();
  return std::any_of(allow_list.begin(), allow_list.end(),
                     [&who](const std::string& allowed) { return phone_matches(allowed, who); });
}

// Background poller for one subscription's received_<id>.json.
class ListenerPoller {
 public:
  ListenerPoller(Mailbox mailbox, std::string id, std::vector<std::string> phone_numbers, EventBus* bus,
                 std::chrono::milliseconds interval = kDefaultListenerPollInterval)
      : mailbox_(std::move(mailbox)),
        id_(std::move(id)),
        phone_numbers_(std::move(phone_numbers)),
        bus_(bus),
        last_seen_(mailbox_.modified_time(mailbox_.received_path(id_))),
        worker_("Listener " + id_, interval) {
    if (last_seen_) {
      Logger::log(Logger::Level::kDebug, "Listener " + id_ + ": leaving message file from an earlier session");
    }
  }

  ~ListenerPoller() { stop(); }

  ListenerPoller(const ListenerPoller&) = delete;
  ListenerPoller& operator=(const ListenerPoller&) = delete;

  const std::string& id() const { return id_; }

  void start() { worker_.start([this]() { poll_once(); }, false); }
  void stop() { worker_.stop(); }
  void request_stop() { worker_.request_stop(); }
  bool running() const { return worker_.running(); }
  bool on_worker_thread() const { return worker_.on_worker_thread(); }

  void set_phone_numbers(std::vector<std::string> phone_numbers) {
    std::lock_guard<std::mutex> lock(filter_mu_);
    phone_numbers_ = std::move(phone_numbers);
  }

  // Returns true when a message-received event was emitted. Only a file
  // modified after the newest one already seen counts; a file present when
  // the poller was created is the baseline and stays untouched.
  bool poll_once() {
    std::lock_guard<std::mutex> lock(poll_mu_);
    const fs::path path = mailbox_.received_path(id_);

    const auto modified = mailbox_.modified_time(path);
    if (!modified) {
      return false;
    }
    if (last_seen_ && *modified <= *last_seen_) {
      return false;
    }

    const auto raw = mailbox_.read(path);
    if (!raw) {
      // Retried next cycle.
      Logger::log(Logger::Level::kDebug, "Listener " + id_ + ": could not read " + path.string());
      return false;
    }
    last_seen_ = *modified;

    std::string error;
    const auto msg = parse_inbound_message(*raw, &error);
    if (!msg) {
      Logger::log(Logger::Level::kWarn, "Listener " + id_ + ": ignoring malformed message file: " + error);
      return false;
    }

    bool emitted = false;
    if (allowed(*msg)) {
      Logger::log(Logger::Level::kInfo, "Listener " + id_ + " received message from " +
                                            mask_phone_number(msg->from) + ": " + truncate_utf8(msg->content, 120));
      bus_->emit_message(id_, *msg);
      emitted = true;
    } else {
      metrics().inc("listeners.filtered");
      Logger::log(Logger::Level::kDebug,
                  "Listener " + id_ + " dropped message from " + mask_phone_number(msg->counterparty()));
    }

    if (BridgeResult r = mailbox_.remove(path, "received message"); !r) {
      Logger::log(Logger::Level::kWarn, r.message);
    }
    return emitted;
  }

 private:
  bool allowed(const InboundMessage& msg) {
    std::lock_guard<std::mutex> lock(filter_mu_);
    return is_allowed_counterparty(phone_numbers_, msg);
  }

  Mailbox mailbox_;
  std::string id_;
  std::mutex filter_mu_;
  std::vector<std::string> phone_numbers_;
  EventBus* bus_;

  std::mutex poll_mu_;
  std::optional<fs::file_time_type> last_seen_;

  PollingWorker worker_;
};

// Owns one poller per registered subscription. Removal requests are advisory:
// unregister_listener() tells the service, stop() ends the local poller.
class ListenerRegistry {
 public:
  ListenerRegistry(Mailbox mailbox, EventBus* bus, std::chrono::milliseconds interval = kDefaultListenerPollInterval)
      : mailbox_(std::move(mailbox)), bus_(bus), interval_(interval) {}

  ~ListenerRegistry() { stop_all(); }

  ListenerRegistry(const ListenerRegistry&) = delete;
  ListenerRegistry& operator=(const ListenerRegistry&) = delete;

  BridgeResult register_listener(const ListenerSubscription& sub) {
    if (!is_valid_listener_id(sub.id)) {
      return BridgeResult::failure(ErrorKind::kInvalidArgument,
                                   "Invalid listener id '" + sub.id + "' (allowed: letters, digits, '.', '_', '-')");
    }
    if (BridgeResult r = mailbox_.ensure_exists(); !r) {
      return r;
    }

    std::string descriptor;
    try {
      descriptor = sub.to_json().dump(2);
    } catch (const json::exception& e) {
      return BridgeResult::failure(ErrorKind::kSerialization,
                                   std::string("Failed to serialize listener: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (BridgeResult r = mailbox_.write(mailbox_.listeners_path(), descriptor, "listeners"); !r) {
      Logger::log(Logger::Level::kError, r.message);
      return r;
    }

    auto it = pollers_.find(sub.id);
    if (it != pollers_.end()) {
      it->second->set_phone_numbers(sub.phone_numbers);
      Logger::log(Logger::Level::kInfo, "Listener " + sub.id + " updated");
      return BridgeResult::success();
    }

    auto poller = std::make_unique<ListenerPoller>(mailbox_, sub.id, sub.phone_numbers, bus_, interval_);
    poller->start();
    pollers_.emplace(sub.id, std::move(poller));
    metrics().inc("listeners.registered");
    Logger::log(Logger::Level::kInfo, "Listener " + sub.id + " registered (" +
                                          std::to_string(sub.phone_numbers.size()) + " numbers)");
    return BridgeResult::success();
  }

  BridgeResult unregister_listener(const std::string& id) {
    if (trim(id).empty()) {
      return BridgeResult::failure(ErrorKind::kInvalidArgument, "Listener id is empty");
    }
    if (BridgeResult r = mailbox_.ensure_exists(); !r) {
      return r;
    }
    if (BridgeResult r = mailbox_.write(mailbox_.remove_listener_path(), id, "remove listener"); !r) {
      Logger::log(Logger::Level::kError, r.message);
      return r;
    }
    metrics().inc("listeners.unregistered");
    Logger::log(Logger::Level::kInfo, "Requested removal of listener " + id);
    return BridgeResult::success();
  }

  // Stops the local poller for `id`; false if none was running. May be called
  // from a message-received subscriber, including the poller's own.
  bool stop(const std::string& id) {
    std::unique_ptr<ListenerPoller> poller;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = pollers_.find(id);
      if (it == pollers_.end()) {
        return false;
      }
      poller = std::move(it->second);
      pollers_.erase(it);
    }
    retire(std::move(poller));
    return true;
  }

  void stop_all() {
    std::map<std::string, std::unique_ptr<ListenerPoller>> pollers;
    std::vector<std::unique_ptr<ListenerPoller>> retired;
    {
      std::lock_guard<std::mutex> lock(mu_);
      pollers.swap(pollers_);
      retired.swap(retired_);
    }
    for (auto& kv : pollers) {
      retire(std::move(kv.second));
    }
    for (auto& p : retired) {
      retire(std::move(p));
    }
  }

  std::vector<std::string> active_ids() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    out.reserve(pollers_.size());
    for (const auto& kv : pollers_) {
      out.push_back(kv.first);
    }
    return out;
  }

 private:
  Mailbox mailbox_;
  EventBus* bus_;
  std::chrono::milliseconds interval_;

  // A poller cannot join or destroy itself, so one stopped from its own
  // callback is parked here until a later stop()/stop_all() on another thread.
  void retire(std::unique_ptr<ListenerPoller> poller) {
    if (poller->on_worker_thread()) {
      poller->request_stop();
      std::lock_guard<std::mutex> lock(mu_);
      retired_.push_back(std::move(poller));
      return;
    }
    poller->stop();
  }

  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<ListenerPoller>> pollers_;
  std::vector<std::unique_ptr<ListenerPoller>> retired_;
};

}  // namespace msgbridge
