#pragma once

#include <string>
#include <string_view>

namespace fleet::db {

// Backend-neutral outcome of a repository write. SQLite result codes are
// mapped onto these before they leave the sqlite backend.
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  ConstraintViolation, // e.g. a scaling event for an unknown fleet
  Busy,
  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

struct [[nodiscard]] Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "<code>: <message>", or just the code when there is no message.
  std::string Describe() const {
    std::string out(ToString(code));
    if (!message.empty()) out += ": " + message;
    return out;
  }
};

} // namespace fleet::db
