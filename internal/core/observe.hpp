#pragma once

#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/status.hpp"

namespace quotecast::core {

/*
  Runs one public operation and converts whatever it throws into a Status.

  fn returning void   -> util::Status
  fn returning T      -> util::StatusOr<T>

  Caller mistakes (NotFound, InvalidArgument, AlreadyExists) log at warn,
  everything else at error.
*/
template <typename Fn>
auto ObserveCall(std::string_view operation, Fn&& fn) {
  using R      = std::invoke_result_t<Fn>;
  using Return = std::conditional_t<std::is_void_v<R>, util::Status, util::StatusOr<R>>;

  try {
    if constexpr (std::is_void_v<R>) {
      fn();
      return Return(util::Status::Ok());
    } else {
      return Return(fn());
    }
  } catch (const std::exception& ex) {
    auto status = util::ToStatus(ex);

    const bool caller_error = status.code == util::StatusCode::kNotFound || status.code == util::StatusCode::kInvalidArgument ||
                              status.code == util::StatusCode::kAlreadyExists;
    observability::Log(caller_error ? spdlog::level::warn : spdlog::level::err, "operation failed",
                       {observability::StringField("operation", operation),
                        observability::StringField("code", util::StatusCodeName(status.code)),
                        observability::StringField("error", ex.what())});
    return Return(std::move(status));
  }
}

} // namespace quotecast::core
