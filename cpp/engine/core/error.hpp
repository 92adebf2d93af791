#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/engine/core/error.hpp

Purpose:
  - One exception type for the whole engine, carrying a stable ErrorCode plus
    the raise site (file/line/function).
  - Only structurally impossible states raise (cyclic HBOM links, depth guard,
    invalid configuration, unknown composite variable). Data faults are
    recovered locally and reported through diagnostics + logging.

Exit status:
  - exit_status() is the single mapping from ErrorCode to a process exit code,
    shared by every executable (0 ok, 1 args/config, 2 parse, 3 compute, 4 I/O).
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace clirisk {

enum class ErrorCode : int {
  kInvalidArgument = 1,  // caller passed something unusable (unknown hazard, bad CLI value)
  kOutOfRange      = 2,  // HBOM deeper than tree.max_depth
  kParseError      = 3,  // malformed JSON / schema mismatch
  kIoError         = 4,
  kInvariant       = 5,  // cyclic or self-referencing HBOM links
  kInvalidConfig   = 6,  // EngineSettings failed validate_or_throw()
  kInternal        = 7,
};

enum ExitStatus : int {
  kExitOk          = 0,
  kExitInvalidArgs = 1,
  kExitParseFailed = 2,
  kExitComputation = 3,
  kExitIoError     = 4,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kOutOfRange:      return "OutOfRange";
    case ErrorCode::kParseError:      return "ParseError";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInvariant:       return "Invariant";
    case ErrorCode::kInvalidConfig:   return "InvalidConfig";
    case ErrorCode::kInternal:        return "Internal";
    default:                          return "Unknown";
  }
}

inline int exit_status(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kInvalidConfig: return kExitInvalidArgs;
    case ErrorCode::kParseError:    return kExitParseFailed;
    case ErrorCode::kIoError:       return kExitIoError;
    default:                        return kExitComputation;
  }
}

struct RaiseSite final {
  const char* file = "";
  int line = 0;
  const char* function = "";
};

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, RaiseSite site = {})
      : std::runtime_error(describe(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }

  // Message without the code/site decoration of what().
  const std::string& message() const noexcept { return message_; }

  const RaiseSite& site() const noexcept { return site_; }

 private:
  static std::string describe(ErrorCode code, const std::string& msg, const RaiseSite& site) {
    std::ostringstream oss;
    oss << "[" << to_string(code) << "] " << msg;
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.function && *site.function) oss << " (" << site.function << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  RaiseSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, RaiseSite site) {
  throw Error(code, std::move(message), site);
}

}  // namespace clirisk

#define CLIRISK_RAISE_SITE ::clirisk::RaiseSite{__FILE__, __LINE__, __func__}

#define CLIRISK_THROW(CODE, MSG) ::clirisk::throw_error((CODE), (MSG), CLIRISK_RAISE_SITE)

// MSG is only built when EXPR fails.
#define CLIRISK_ENSURE(EXPR, CODE, MSG)                   \
  do {                                                    \
    if (!(EXPR)) CLIRISK_THROW((CODE), (MSG));            \
  } while (0)
