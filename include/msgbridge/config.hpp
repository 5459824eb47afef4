#pragma once

#include <optional>
#include <string>

#include "msgbridge/common.hpp"

namespace msgbridge {

inline constexpr const char* kDefaultDataDir = "~/.msgbridge";
inline constexpr const char* kDataDirEnv = "MSGBRIDGE_DATA_DIR";
inline constexpr const char* kLogJsonEnv = "MSGBRIDGE_LOG_JSON";

struct MailboxConfig {
  std::string dir{"whatsapp"};
};

struct MonitorConfig {
  int interval_ms{500};
};

struct DispatchConfig {
  int poll_interval_ms{100};
  int timeout_ms{5000};
};

struct ListenersConfig {
  int interval_ms{500};
};

struct LoggingConfig {
  bool json{false};
  std::string level{"info"};
};

struct BridgeConfig {
  std::string data_dir{kDefaultDataDir};
  MailboxConfig mailbox{};
  MonitorConfig monitor{};
  DispatchConfig dispatch{};
  ListenersConfig listeners{};
  LoggingConfig logging{};
};

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

// Application data root: $MSGBRIDGE_DATA_DIR, else the configured dataDir.
inline std::optional<fs::path> resolve_data_dir(const BridgeConfig& cfg) {
  const char* env = std::getenv(kDataDirEnv);
  if (env && *env) {
    return expand_user_path(env);
  }
  const std::string configured = trim(resolve_env_ref(cfg.data_dir));
  if (configured.empty()) {
    return std::nullopt;
  }
  return expand_user_path(configured);
}

inline std::optional<fs::path> get_config_path() {
  const auto base = expand_user_path(kDefaultDataDir);
  if (!base) {
    return std::nullopt;
  }
  return *base / "config.json";
}

inline json default_config_json() {
  return json{{"dataDir", kDefaultDataDir},
              {"mailbox", {{"dir", "whatsapp"}}},
              {"monitor", {{"intervalMs", 500}}},
              {"dispatch", {{"pollIntervalMs", 100}, {"timeoutMs", 5000}}},
              {"listeners", {{"intervalMs", 500}}},
              {"logging", {{"json", false}, {"level", "info"}}}};
}

namespace detail {

inline int clamped_int(const json& obj, const char* key, int fallback, int min_value, int max_value) {
  if (!obj.contains(key) || !obj[key].is_number_integer()) {
    return fallback;
  }
  const json& v = obj[key];
  // Unsigned values above INT64_MAX do not fit a long long.
  if (v.is_number_unsigned() && v.get<unsigned long long>() > static_cast<unsigned long long>(max_value)) {
    return max_value;
  }
  return static_cast<int>(std::clamp<long long>(v.get<long long>(), min_value, max_value));
}

}  // namespace detail

inline BridgeConfig parse_config(const json& root) {
  BridgeConfig cfg{};
  if (!root.is_object()) {
    return cfg;
  }

  cfg.data_dir = root.value("dataDir", cfg.data_dir);

  if (root.contains("mailbox") && root["mailbox"].is_object()) {
    const std::string dir = trim(root["mailbox"].value("dir", cfg.mailbox.dir));
    if (!dir.empty()) {
      cfg.mailbox.dir = dir;
    }
  }
  if (root.contains("monitor") && root["monitor"].is_object()) {
    cfg.monitor.interval_ms = detail::clamped_int(root["monitor"], "intervalMs", cfg.monitor.interval_ms, 10, 60000);
  }
  if (root.contains("dispatch") && root["dispatch"].is_object()) {
    const auto& d = root["dispatch"];
    cfg.dispatch.poll_interval_ms = detail::clamped_int(d, "pollIntervalMs", cfg.dispatch.poll_interval_ms, 5, 10000);
    cfg.dispatch.timeout_ms = detail::clamped_int(d, "timeoutMs", cfg.dispatch.timeout_ms, 50, 600000);
  }
  if (root.contains("listeners") && root["listeners"].is_object()) {
    cfg.listeners.interval_ms =
        detail::clamped_int(root["listeners"], "intervalMs", cfg.listeners.interval_ms, 10, 60000);
  }
  if (root.contains("logging") && root["logging"].is_object()) {
    const auto& l = root["logging"];
    cfg.logging.json = l.value("json", cfg.logging.json);
    cfg.logging.level = l.value("level", cfg.logging.level);
  }
  return cfg;
}

inline BridgeConfig load_config(const fs::path& path) {
  const std::string raw = read_text_file(path);
  if (trim(raw).empty()) {
    return BridgeConfig{};
  }

  try {
    return parse_config(json::parse(raw));
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }
  return BridgeConfig{};
}

inline BridgeConfig load_config() {
  const auto path = get_config_path();
  return path ? load_config(*path) : BridgeConfig{};
}

inline bool save_default_config(const fs::path& path) {
  return write_text_file(path, default_config_json().dump(2));
}

// Applies config and environment to the process-wide logger.
inline void apply_logging(const LoggingConfig& logging) {
  bool json_mode = logging.json;
  const char* v = std::getenv(kLogJsonEnv);
  if (v && *v) {
    json_mode = std::string(v) != "0";
  }
  Logger::set_json(json_mode);

  if (const auto level = Logger::parse_level(logging.level)) {
    Logger::set_min_level(*level);
  } else {
    Logger::log(Logger::Level::kWarn, "Unknown logging.level '" + logging.level + "', using info");
    Logger::set_min_level(Logger::Level::kInfo);
  }
}

}  // namespace msgbridge
