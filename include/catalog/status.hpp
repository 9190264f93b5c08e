#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace catalog {

/**
 * Outcome of a catalog operation.
 *
 * Errors are distinguished by code, not by exception type. Each code maps to
 * a fixed HTTP status at the request boundary. ValidationFailed carries the
 * individual field messages in details().
 */
class Status {
 public:
  enum class Code {
    kOk = 0,
    kBadRequest,
    kUnauthorized,
    kForbidden,
    kNotFound,
    kConflict,
    kValidationFailed,
    kInternal,
  };

  Status() = default;

  static Status OK() { return Status(); }
  static Status BadRequest(std::string msg) {
    return Status(Code::kBadRequest, std::move(msg));
  }
  static Status Unauthorized(std::string msg) {
    return Status(Code::kUnauthorized, std::move(msg));
  }
  static Status Forbidden(std::string msg) {
    return Status(Code::kForbidden, std::move(msg));
  }
  static Status NotFound(std::string msg) {
    return Status(Code::kNotFound, std::move(msg));
  }
  static Status Conflict(std::string msg) {
    return Status(Code::kConflict, std::move(msg));
  }
  static Status ValidationFailed(std::string msg, std::vector<std::string> details) {
    return Status(Code::kValidationFailed, std::move(msg), std::move(details));
  }
  static Status Internal(std::string msg) {
    return Status(Code::kInternal, std::move(msg));
  }

  bool ok() const { return code_ == Code::kOk; }
  bool IsBadRequest() const { return code_ == Code::kBadRequest; }
  bool IsUnauthorized() const { return code_ == Code::kUnauthorized; }
  bool IsForbidden() const { return code_ == Code::kForbidden; }
  bool IsNotFound() const { return code_ == Code::kNotFound; }
  bool IsConflict() const { return code_ == Code::kConflict; }
  bool IsValidationFailed() const { return code_ == Code::kValidationFailed; }
  bool IsInternal() const { return code_ == Code::kInternal; }

  Code code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::vector<std::string>& details() const { return details_; }

  /** HTTP status code for this outcome (200 for OK). */
  int HttpStatus() const;

  /** Low-cardinality name of the code, e.g. "not_found". */
  std::string_view CodeName() const;

  /** "<code name>: <message>" plus details, for logs. */
  std::string ToString() const;

 private:
  Status(Code code, std::string msg, std::vector<std::string> details = {})
      : code_(code), message_(std::move(msg)), details_(std::move(details)) {}

  Code code_ = Code::kOk;
  std::string message_;
  std::vector<std::string> details_;
};

}  // namespace catalog
