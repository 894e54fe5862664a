#pragma once

#include <string>

namespace dbtarget::db {

/*
  Portable lifecycle result codes.

  Flush() and Shutdown() report through these instead of throwing, so
  orchestration code can decide whether to retry the whole target.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  // target has not reached Ready yet
  NotStarted,
  TargetClosed,

  // a batch write failed (FlushError / ShutdownError)
  WriteFailed,
  // the connection could not be released cleanly on shutdown
  CloseFailed
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace dbtarget::db
