
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace granville::net {

enum class StatusCode : int8_t {
  OK = 0,
  CANCELLED,
  UNKNOWN,
  INVALID_ARGUMENT,
  DEADLINE_EXCEEDED,
  NOT_FOUND,
  ALREADY_EXISTS,
  PERMISSION_DENIED,
  UNAUTHENTICATED,
  RESOURCE_EXHAUSTED,
  FAILED_PRECONDITION,
  ABORTED,
  OUT_OF_RANGE,
  UNIMPLEMENTED,
  INTERNAL,
  UNAVAILABLE,
  DATA_LOSS,
  DO_NOT_USE
};

constexpr std::string_view str(StatusCode code) {
#define CASE(x)                                                                                    \
  case StatusCode::x:                                                                              \
    return #x
  switch (code) {
    CASE(OK);
    CASE(CANCELLED);
    CASE(UNKNOWN);
    CASE(INVALID_ARGUMENT);
    CASE(DEADLINE_EXCEEDED);
    CASE(NOT_FOUND);
    CASE(ALREADY_EXISTS);
    CASE(PERMISSION_DENIED);
    CASE(UNAUTHENTICATED);
    CASE(RESOURCE_EXHAUSTED);
    CASE(FAILED_PRECONDITION);
    CASE(ABORTED);
    CASE(OUT_OF_RANGE);
    CASE(UNIMPLEMENTED);
    CASE(INTERNAL);
    CASE(UNAVAILABLE);
    CASE(DATA_LOSS);
    CASE(DO_NOT_USE);
  }
#undef CASE
  return "<unknown case>";
}

class Status {
private:
  std::string error_message_{};
  std::string error_details_{};
  StatusCode status_code_{StatusCode::OK};

public:
  Status(StatusCode status_code = StatusCode::OK, std::string error_message = "",
         std::string error_details = "")
      : error_message_{std::move(error_message)}, error_details_{std::move(error_details)},
        status_code_{status_code} {}

  StatusCode error_code() const { return status_code_; }
  std::string_view error_message() const { return error_message_; }
  std::string_view error_details() const { return error_details_; }
  bool ok() const { return status_code_ == StatusCode::OK; }

  /** @brief `CODE: message (details)`, for logs and exception messages */
  std::string to_string() const {
    std::string s{str(status_code_)};
    if (!error_message_.empty())
      s += ": " + error_message_;
    if (!error_details_.empty())
      s += " (" + error_details_ + ")";
    return s;
  }

  bool operator==(const Status& o) const {
    return (status_code_ == o.status_code_) && (error_message_ == o.error_message_) &&
           (error_details_ == o.error_details_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

/**
 * @brief Thrown for local rpc errors that have no completion to travel through
 *        (routing, duplicate ids, a client that is not connected), and stored in
 *        the future of a failed grain call.
 */
class RpcException : public std::runtime_error {
private:
  Status status_;

public:
  explicit RpcException(Status status)
      : std::runtime_error{status.to_string()}, status_{std::move(status)} {}

  const Status& status() const noexcept { return status_; }
  StatusCode error_code() const noexcept { return status_.error_code(); }
};

} // namespace granville::net
