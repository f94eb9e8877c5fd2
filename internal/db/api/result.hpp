#pragma once

#include <string>
#include <string_view>

namespace aiknowsys::db {

// Outcome classes for the SQLite upsert helpers; sqlite3 return codes never leak past the adapter.
enum class ErrorCode {
  OK = 0,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InvalidArgument,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corrupt database";
    case ErrorCode::InvalidArgument:
      return "invalid record";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "invalid record: plan id must not be empty"
  std::string Describe() const {
    std::string out(ToString(code));
    if (!message.empty()) out += ": " + message;
    return out;
  }
};

} // namespace aiknowsys::db
