#pragma once

#include <cstdint>
#include <string>

namespace handoff::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // rows touched by a conditional update; 0 means the guard did not match
  uint64_t rows_affected = 0;

  static Result Ok(uint64_t rows = 0) {
    Result r;
    r.rows_affected = rows;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

/*
  Request-path translation of a failed Result:
  NotFound -> util::NotFound, Conflict/AlreadyExists -> util::Conflict,
  Busy/SerializationFailure -> util::Aborted, anything else -> std::runtime_error. `context` prefixes the message.
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace handoff::db
