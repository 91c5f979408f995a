#pragma once

#include <stdexcept>
#include <string>

namespace roster::util {

/*
  Central error types.

  Every rejected precondition maps to exactly one of these so callers can
  branch on the type. rosterctl turns them into exit codes.
*/

class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string field, const std::string& msg) : std::runtime_error(msg), field_(std::move(field)) {
  }

  const std::string& field() const noexcept {
    return field_;
  }

 private:
  std::string field_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& reason) : std::runtime_error(reason) {
  }
};

class CapacityExceeded : public std::runtime_error {
 public:
  explicit CapacityExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& reason) : std::runtime_error(reason) {
  }
};

} // namespace roster::util
