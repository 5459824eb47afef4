#pragma once

#include <optional>
#include <string>

#include "msgbridge/common.hpp"
#include "msgbridge/errors.hpp"

namespace msgbridge {

// Environment variable through which the automation service learns where the
// mailbox lives.
inline constexpr const char* kServiceDataDirEnv = "WHATSAPP_DATA_DIR";

// The shared directory both processes read and write. Every file in it is a
// whole-file unit of state: presence, absence and complete content are the
// only signals.
class Mailbox {
 public:
  static constexpr const char* kStatusFile = "status.txt";
  static constexpr const char* kQrFile = "qr.txt";
  static constexpr const char* kMessageFile = "message.json";
  static constexpr const char* kMessageErrorFile = "message_error.txt";
  static constexpr const char* kListenersFile = "listeners.json";
  static constexpr const char* kRemoveListenerFile = "remove_listener.txt";

  explicit Mailbox(fs::path dir) : dir_(std::move(dir)) {}

  const fs::path& dir() const { return dir_; }

  fs::path status_path() const { return dir_ / kStatusFile; }
  fs::path qr_path() const { return dir_ / kQrFile; }
  fs::path message_path() const { return dir_ / kMessageFile; }
  fs::path message_error_path() const { return dir_ / kMessageErrorFile; }
  fs::path listeners_path() const { return dir_ / kListenersFile; }
  fs::path remove_listener_path() const { return dir_ / kRemoveListenerFile; }
  fs::path received_path(const std::string& listener_id) const {
    return dir_ / ("received_" + listener_id + ".json");
  }

  BridgeResult ensure_exists() const {
    std::error_code ec;
    if (fs::is_directory(dir_, ec)) {
      return BridgeResult::success();
    }
    fs::create_directories(dir_, ec);
    if (ec) {
      return BridgeResult::failure(ErrorKind::kIo, "Failed to create mailbox directory " + dir_.string() +
                                                       ": " + ec.message());
    }
    return BridgeResult::success();
  }

  bool exists(const fs::path& p) const {
    std::error_code ec;
    return fs::exists(p, ec);
  }

  // nullopt when the file is absent or unreadable.
  std::optional<std::string> read(const fs::path& p) const { return try_read_text_file(p); }

  BridgeResult write(const fs::path& p, const std::string& content, const std::string& what) const {
    std::error_code ec;
    if (!write_text_file(p, content, ec)) {
      return BridgeResult::failure(ErrorKind::kIo, "Failed to write " + what + " file " + p.string() + ": " +
                                                       ec.message());
    }
    return BridgeResult::success();
  }

  // Absent files count as removed.
  BridgeResult remove(const fs::path& p, const std::string& what) const {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
      return BridgeResult::failure(ErrorKind::kIo, "Failed to remove " + what + " file " + p.string() + ": " +
                                                       ec.message());
    }
    return BridgeResult::success();
  }

  std::optional<fs::file_time_type> modified_time(const fs::path& p) const {
    std::error_code ec;
    const auto t = fs::last_write_time(p, ec);
    if (ec) {
      return std::nullopt;
    }
    return t;
  }

  // Publishes the mailbox location to child processes spawned after this call.
  void export_to_environment() const {
#ifdef _WIN32
    _putenv_s(kServiceDataDirEnv, dir_.string().c_str());
#else
    setenv(kServiceDataDirEnv, dir_.string().c_str(), 1);
#endif
  }

 private:
  fs::path dir_;
};

}  // namespace msgbridge
