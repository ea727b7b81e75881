#pragma once

#include <stdexcept>
#include <string>

namespace quotecast::util {

/*
  Central error types.

  Thrown inside components; translated to Status at the ScheduleStore boundary.
*/

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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lost a race on a schedule (stale snapshot or pointer compare-and-swap mismatch).
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceFailure : public std::runtime_error {
 public:
  explicit PersistenceFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace quotecast::util
