#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "msgbridge/common.hpp"
#include "msgbridge/errors.hpp"
#include "msgbridge/worker.hpp"

namespace msgbridge {

// Process-wide counters keyed "<area>.<name>", e.g. "dispatch.sent".
class Metrics {
 public:
  void inc(const std::string& key, std::uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  std::uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  // {"dispatch": {"sent": 2}, "events": {...}, "updatedAt": "..."}.
  // Keys without an area land under "other".
  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& kv : counters_) {
      const auto dot = kv.first.find('.');
      if (dot == std::string::npos || dot == 0 || dot + 1 == kv.first.size()) {
        j["other"][kv.first] = kv.second;
      } else {
        j[kv.first.substr(0, dot)][kv.first.substr(dot + 1)] = kv.second;
      }
    }
    j["updatedAt"] = now_iso8601();
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::uint64_t> counters_;
};

inline Metrics& metrics() {
  static Metrics m;
  return m;
}

inline fs::path metrics_path(const fs::path& data_dir) {
  return data_dir / "state" / "metrics.json";
}

inline BridgeResult write_metrics_snapshot(const fs::path& data_dir) {
  const fs::path path = metrics_path(data_dir);
  std::error_code ec;
  if (!write_text_file(path, metrics().to_json().dump(2), ec)) {
    return BridgeResult::failure(ErrorKind::kIo,
                                 "Failed to write metrics snapshot " + path.string() + ": " + ec.message());
  }
  return BridgeResult::success();
}

// Writes the snapshot for `data_dir` periodically and once more on stop().
class MetricsFlusher {
 public:
  explicit MetricsFlusher(fs::path data_dir, std::chrono::milliseconds interval = std::chrono::seconds(5))
      : data_dir_(std::move(data_dir)), worker_("Metrics flush", interval) {}

  ~MetricsFlusher() { stop(); }

  void start() {
    worker_.start([this]() { flush(); }, true);
  }

  void stop() {
    if (!worker_.running()) {
      return;
    }
    worker_.stop();
    flush();
  }

 private:
  void flush() {
    if (BridgeResult r = write_metrics_snapshot(data_dir_); !r) {
      Logger::log(Logger::Level::kWarn, r.message);
    }
  }

  fs::path data_dir_;
  PollingWorker worker_;
};

}  // namespace msgbridge
