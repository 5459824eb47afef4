#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace msgbridge {

using json = nlohmann::json;
namespace fs = std::filesystem;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string digits_only(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (const unsigned char c : s) {
    if (std::isdigit(c)) {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

// "***1234" for logs; short numbers are hidden entirely.
inline std::string mask_phone_number(const std::string& s) {
  const std::string digits = digits_only(s);
  if (digits.size() <= 4) {
    return "***";
  }
  return "***" + digits.substr(digits.size() - 4);
}

// At most max_bytes of s, cut back to a UTF-8 code point boundary.
inline std::string truncate_utf8(const std::string& s, std::size_t max_bytes) {
  if (s.size() <= max_bytes) {
    return s;
  }
  std::size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
    --end;
  }
  return s.substr(0, end);
}

inline std::optional<std::string> home_dir() {
#ifdef _WIN32
  const char* p = std::getenv("USERPROFILE");
  if (p && *p) {
    return std::string(p);
  }
  const char* drive = std::getenv("HOMEDRIVE");
  const char* path = std::getenv("HOMEPATH");
  if (drive && *drive && path && *path) {
    return std::string(drive) + std::string(path);
  }
  return std::nullopt;
#else
  const char* p = std::getenv("HOME");
  if (p && *p) {
    return std::string(p);
  }
  return std::nullopt;
#endif
}

// Expands a leading '~'. Returns nullopt when the home directory is unknown.
inline std::optional<fs::path> expand_user_path(const std::string& p) {
  if (!p.empty() && p[0] == '~') {
    const auto home = home_dir();
    if (!home) {
      return std::nullopt;
    }
    std::string suffix = p.substr(1);
    while (!suffix.empty() && (suffix.front() == '/' || suffix.front() == '\\')) {
      suffix.erase(suffix.begin());
    }
    return fs::path(*home) / suffix;
  }
  return fs::path(p);
}

inline std::optional<std::string> try_read_text_file(const fs::path& p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) {
    return std::nullopt;
  }
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

inline std::string read_text_file(const fs::path& p) {
  return try_read_text_file(p).value_or("");
}

inline std::string random_id(std::size_t n = 8) {
  static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> d(0, sizeof(alphabet) - 2);

  std::string out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(alphabet[d(rng)]);
  }
  return out;
}

// Writes to a sibling temp file and renames it over the target, so a reader
// polling for `p` sees either the old content, nothing, or the whole new file.
inline bool write_text_file(const fs::path& p, const std::string& content, std::error_code& ec) {
  ec.clear();
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      return false;
    }
  }

  fs::path tmp = p;
  tmp += ".tmp-" + random_id(6);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      ec = std::make_error_code(std::errc::permission_denied);
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      ec = std::make_error_code(std::errc::io_error);
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return false;
    }
  }

  fs::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  return write_text_file(p, content, ec);
}

inline std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms
     << 'Z';
  return ss.str();
}

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(level); }

  static std::optional<Level> parse_level(const std::string& name) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      return Level::kDebug;
    }
    if (n == "info") {
      return Level::kInfo;
    }
    if (n == "warn" || n == "warning") {
      return Level::kWarn;
    }
    if (n == "error") {
      return Level::kError;
    }
    return std::nullopt;
  }

  // One log line without the trailing newline. Message text that is not
  // valid UTF-8 is written with replacement characters in JSON mode.
  static std::string format(Level level, const std::string& msg) {
    if (!json_mode().load()) {
      return std::string("[") + level_name(level) + "] " + msg;
    }
    json j;
    j["time"] = now_iso8601();
    j["level"] = level_name(level);
    j["msg"] = msg;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
  }

  static void log(Level level, const std::string& msg) {
    if (level_rank(level) < level_rank(min_level().load())) {
      return;
    }
    const std::string line = format(level, msg);
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << line << "\n";
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static std::atomic<Level>& min_level() {
    static std::atomic<Level> v{Level::kInfo};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }
};

}  // namespace msgbridge
