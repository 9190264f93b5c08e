#include <catalog/status.hpp>

namespace catalog {

int Status::HttpStatus() const {
  switch (code_) {
    case Code::kOk:
      return 200;
    case Code::kBadRequest:
      return 400;
    case Code::kUnauthorized:
      return 401;
    case Code::kForbidden:
      return 403;
    case Code::kNotFound:
      return 404;
    case Code::kConflict:
      return 409;
    case Code::kValidationFailed:
      return 422;
    case Code::kInternal:
      return 500;
  }
  return 500;
}

std::string_view Status::CodeName() const {
  switch (code_) {
    case Code::kOk:
      return "ok";
    case Code::kBadRequest:
      return "bad_request";
    case Code::kUnauthorized:
      return "unauthorized";
    case Code::kForbidden:
      return "forbidden";
    case Code::kNotFound:
      return "not_found";
    case Code::kConflict:
      return "conflict";
    case Code::kValidationFailed:
      return "validation_failed";
    case Code::kInternal:
      return "internal_error";
  }
  return "internal_error";
}

std::string Status::ToString() const {
  if (ok()) return "OK";

  std::string out(CodeName());
  out += ": ";
  out += message_;
  for (size_t i = 0; i < details_.size(); ++i) {
    out += (i == 0) ? " [" : "; ";
    out += details_[i];
  }
  if (!details_.empty()) out += "]";
  return out;
}

}  // namespace catalog
