#pragma once

#include <string>
#include <utility>

namespace msgbridge {

enum class ErrorKind {
  kNone,
  kConfiguration,    // application data directory cannot be resolved
  kPrecondition,     // e.g. dispatch while the session is not connected
  kInvalidArgument,  // caller input that cannot be turned into a mailbox file
  kSerialization,    // malformed JSON in a mailbox file
  kIo,               // create/read/write/delete failures
  kTimeout,          // dispatch deadline exceeded
  kService,          // failure reported by the automation service itself
};

inline const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kConfiguration:
      return "configuration";
    case ErrorKind::kPrecondition:
      return "precondition";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
    case ErrorKind::kSerialization:
      return "serialization";
    case ErrorKind::kIo:
      return "io";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kService:
    default:
      return "service";
  }
}

struct BridgeResult {
  bool ok{true};
  ErrorKind kind{ErrorKind::kNone};
  std::string message;

  static BridgeResult success() { return BridgeResult{}; }
  static BridgeResult failure(ErrorKind kind, std::string message) {
    return BridgeResult{false, kind, std::move(message)};
  }

  explicit operator bool() const { return ok; }
};

}  // namespace msgbridge
