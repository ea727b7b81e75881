#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace quotecast::util {

/*
  Outcome of a public ScheduleStore operation.

  `message` is meant for humans, `cause` carries the lower-level error text
  (sqlite message, exception what()) when there is one.
*/

enum class StatusCode {
  kOk = 0,

  kNotFound,
  kInvalidArgument,
  kAlreadyExists,
  kConflict,
  kPersistenceFailure,
  kInternal
};

std::string_view StatusCodeName(StatusCode code);

struct Status {
  StatusCode  code = StatusCode::kOk;
  std::string message;
  std::string cause;

  static Status Ok() {
    return {};
  }

  static Status Error(StatusCode c, std::string msg, std::string cause = {}) {
    return {c, std::move(msg), std::move(cause)};
  }

  bool ok() const {
    return code == StatusCode::kOk;
  }

  explicit operator bool() const {
    return ok();
  }

  std::string ToString() const;
};

template <typename T>
class StatusOr {
 public:
  StatusOr(T value) : value_(std::move(value)) {
  }

  StatusOr(Status status) : status_(std::move(status)) {
  }

  bool ok() const {
    return status_.ok() && value_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  const Status& status() const {
    return status_;
  }

  const T& value() const& {
    return *value_;
  }

  T& value() & {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  const T& operator*() const& {
    return *value_;
  }

  const T* operator->() const {
    return &*value_;
  }

 private:
  Status           status_;
  std::optional<T> value_;
};

// Maps the exception types of util/errors.hpp; anything else is kInternal.
Status ToStatus(const std::exception& e, std::string_view context = {});

} // namespace quotecast::util
