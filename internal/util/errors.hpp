#pragma once

#include <stdexcept>
#include <string>

namespace handoff::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed identifiers or missing required fields.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Role or team membership does not allow the operation.
class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Duplicate active transfer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The transaction lost a race with a concurrent writer; retrying may succeed.
class Aborted : public std::runtime_error {
 public:
  explicit Aborted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A state machine guard failed (e.g. resuming a transfer that is no longer active).
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace handoff::util
