#pragma once

#include <optional>
#include <string>
#include <vector>

#include "msgbridge/common.hpp"

namespace msgbridge {

enum class SessionState { kDisconnected, kInitializing, kAuthenticatedPending, kReady };

inline const char* session_state_name(SessionState s) {
  switch (s) {
    case SessionState::kInitializing:
      return "initializing";
    case SessionState::kAuthenticatedPending:
      return "authenticated-pending";
    case SessionState::kReady:
      return "ready";
    case SessionState::kDisconnected:
    default:
      return "disconnected";
  }
}

inline std::optional<SessionState> parse_session_state(const std::string& raw) {
  const std::string s = to_lower(trim(raw));
  if (s == "disconnected") {
    return SessionState::kDisconnected;
  }
  if (s == "initializing") {
    return SessionState::kInitializing;
  }
  if (s == "authenticated-pending" || s == "authenticated_pending" || s == "authenticated") {
    return SessionState::kAuthenticatedPending;
  }
  if (s == "ready") {
    return SessionState::kReady;
  }
  return std::nullopt;
}

struct SessionStatus {
  // Text as written by the service; unknown values map to kDisconnected.
  std::string status{"disconnected"};
  SessionState state{SessionState::kDisconnected};
  std::string timestamp{"0"};
  bool is_authenticated{false};
  bool is_client_ready{false};
  bool is_initializing{false};

  bool connected() const { return is_authenticated && is_client_ready; }

  json to_json() const {
    return json{{"status", status},
                {"timestamp", timestamp},
                {"isAuthenticated", is_authenticated},
                {"isClientReady", is_client_ready},
                {"isInitializing", is_initializing}};
  }

  bool operator==(const SessionStatus& other) const = default;
};

inline SessionStatus initializing_session_status() {
  SessionStatus s;
  s.status = "initializing";
  s.state = SessionState::kInitializing;
  s.timestamp = now_iso8601();
  s.is_initializing = true;
  return s;
}

inline SessionStatus disconnected_session_status() {
  return SessionStatus{};
}

namespace detail {

inline bool read_timestamp(const json& j, std::string& out) {
  if (j.is_string()) {
    out = j.get<std::string>();
    return true;
  }
  if (j.is_number_integer()) {
    out = std::to_string(j.get<long long>());
    return true;
  }
  if (j.is_number()) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << j.get<double>();
    out = ss.str();
    return true;
  }
  return false;
}

inline bool set_error(std::string* error, const std::string& msg) {
  if (error) {
    *error = msg;
  }
  return false;
}

}  // namespace detail

// Strict parse used by the status monitor: every field must be present with
// the right type, and "ready" must carry both readiness flags.
inline std::optional<SessionStatus> parse_session_status(const std::string& raw,
                                                         std::string* error = nullptr) {
  try {
    const json j = json::parse(raw);
    if (!j.is_object()) {
      detail::set_error(error, "status is not a JSON object");
      return std::nullopt;
    }
    for (const char* key : {"isAuthenticated", "isClientReady", "isInitializing"}) {
      if (!j.contains(key) || !j[key].is_boolean()) {
        detail::set_error(error, std::string("missing or non-boolean field '") + key + "'");
        return std::nullopt;
      }
    }
    if (!j.contains("status") || !j["status"].is_string()) {
      detail::set_error(error, "missing or non-string field 'status'");
      return std::nullopt;
    }

    SessionStatus s;
    s.status = j["status"].get<std::string>();
    s.state = parse_session_state(s.status).value_or(SessionState::kDisconnected);
    if (!j.contains("timestamp") || !detail::read_timestamp(j["timestamp"], s.timestamp)) {
      detail::set_error(error, "missing or invalid field 'timestamp'");
      return std::nullopt;
    }
    s.is_authenticated = j["isAuthenticated"].get<bool>();
    s.is_client_ready = j["isClientReady"].get<bool>();
    s.is_initializing = j["isInitializing"].get<bool>();

    if (s.state == SessionState::kReady && !s.connected()) {
      detail::set_error(error, "status 'ready' without an authenticated, ready client");
      return std::nullopt;
    }
    return s;
  } catch (const std::exception& e) {
    detail::set_error(error, e.what());
    return std::nullopt;
  }
}

// Lenient parse for on-demand status queries: absent fields take defaults.
inline std::optional<SessionStatus> parse_session_status_lenient(const std::string& raw,
                                                                 std::string* error = nullptr) {
  try {
    const json j = json::parse(raw);
    if (!j.is_object()) {
      detail::set_error(error, "status is not a JSON object");
      return std::nullopt;
    }
    SessionStatus s;
    if (j.contains("status") && j["status"].is_string()) {
      s.status = j["status"].get<std::string>();
    }
    s.state = parse_session_state(s.status).value_or(SessionState::kDisconnected);
    if (j.contains("timestamp")) {
      detail::read_timestamp(j["timestamp"], s.timestamp);
    }
    auto flag = [&j](const char* key) {
      return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
    };
    s.is_authenticated = flag("isAuthenticated");
    s.is_client_ready = flag("isClientReady");
    s.is_initializing = flag("isInitializing");
    if (s.state == SessionState::kReady && !s.connected()) {
      s.state = s.is_authenticated ? SessionState::kAuthenticatedPending : SessionState::kDisconnected;
    }
    return s;
  } catch (const std::exception& e) {
    detail::set_error(error, e.what());
    return std::nullopt;
  }
}

struct InboundMessage {
  std::string from;
  std::string to;
  bool from_me{false};
  std::string content;
  std::string timestamp;

  // The other side of the conversation.
  const std::string& counterparty() const { return from_me ? to : from; }

  json to_json() const {
    return json{{"from", from}, {"to", to}, {"fromMe", from_me}, {"content", content}, {"timestamp", timestamp}};
  }
};

inline std::optional<InboundMessage> parse_inbound_message(const std::string& raw,
                                                           std::string* error = nullptr) {
  try {
    const json j = json::parse(raw);
    if (!j.is_object()) {
      detail::set_error(error, "message is not a JSON object");
      return std::nullopt;
    }
    for (const char* key : {"from", "to", "content"}) {
      if (!j.contains(key) || !j[key].is_string()) {
        detail::set_error(error, std::string("missing or non-string field '") + key + "'");
        return std::nullopt;
      }
    }
    if (!j.contains("fromMe") || !j["fromMe"].is_boolean()) {
      detail::set_error(error, "missing or non-boolean field 'fromMe'");
      return std::nullopt;
    }

    InboundMessage m;
    m.from = j["from"].get<std::string>();
    m.to = j["to"].get<std::string>();
    m.from_me = j["fromMe"].get<bool>();
    m.content = j["content"].get<std::string>();
    if (!j.contains("timestamp") || !detail::read_timestamp(j["timestamp"], m.timestamp)) {
      detail::set_error(error, "missing or invalid field 'timestamp'");
      return std::nullopt;
    }
    return m;
  } catch (const std::exception& e) {
    detail::set_error(error, e.what());
    return std::nullopt;
  }
}

struct OutboundMessageRequest {
  std::string phone_number;
  std::string message;

  json to_json() const { return json{{"phoneNumber", phone_number}, {"message", message}}; }
};

struct ListenerSubscription {
  std::string id;
  std::vector<std::string> phone_numbers;
  std::string command;

  json to_json() const { return json{{"id", id}, {"phoneNumbers", phone_numbers}, {"command", command}}; }
};

}  // namespace msgbridge
