#include <catalog/server/validation.hpp>

#include <catalog/internal.hpp>
#include <catalog/query.hpp>

#include <optional>
#include <string>
#include <vector>

namespace catalog::server {

namespace {

constexpr const char* kValidationFailed = "Validation failed";
constexpr const char* kNotAnObject = "Request body must be a JSON object";

using Errors = std::vector<std::string>;

bool Present(const Json::Value& body, const char* field) {
  return body.isMember(field) && !body[field].isNull();
}

std::optional<std::string> CheckString(const Json::Value& v,
                                       const std::string& label,
                                       bool allow_empty,
                                       size_t max_len,
                                       Errors* errors) {
  if (!v.isString()) {
    errors->push_back(label + " must be a string");
    return std::nullopt;
  }
  std::string s = v.asString();
  std::string trimmed = internal::Trim(s);
  if (!allow_empty && trimmed.empty()) {
    errors->push_back(label + " cannot be empty");
    return std::nullopt;
  }
  if (internal::Utf8Length(trimmed) > max_len) {
    errors->push_back(label + " must be at most " + std::to_string(max_len) +
                      " characters");
    return std::nullopt;
  }
  return s;
}

std::optional<double> CheckPrice(const Json::Value& v, Errors* errors) {
  std::optional<double> price;
  if (v.isNumeric()) {
    price = v.asDouble();
  } else if (v.isString()) {
    price = query::ParseDouble(v.asString());
  }

  if (!price) {
    errors->push_back("Price must be a number");
    return std::nullopt;
  }
  if (*price <= 0) {
    errors->push_back("Price must be greater than 0");
    return std::nullopt;
  }
  return price;
}

std::optional<bool> CheckInStock(const Json::Value& v, Errors* errors) {
  if (v.isBool()) return v.asBool();
  if (v.isString()) {
    if (auto b = query::ParseBool(v.asString())) return b;
  } else if (v.isIntegral()) {
    // asInt64() throws outside the Int64 range; compare as double instead.
    double n = v.asDouble();
    if (n == 0 || n == 1) return n == 1;
  }
  errors->push_back("inStock must be a boolean");
  return std::nullopt;
}

Status Collect(Errors errors) {
  if (errors.empty()) return Status::OK();
  return Status::ValidationFailed(kValidationFailed, std::move(errors));
}

}  // namespace

Status ValidateProductCreate(const Json::Value& body,
                             ProductDraft* out,
                             const FieldLimits& limits) {
  if (!out) return Status::Internal("out is null");
  if (!body.isObject()) {
    return Status::ValidationFailed(kValidationFailed, {kNotAnObject});
  }

  Errors errors;
  ProductDraft draft;

  if (!Present(body, "name")) {
    errors.push_back("Name is required");
  } else if (auto v = CheckString(body["name"], "Name", false, limits.max_name, &errors)) {
    draft.name = *v;
  }

  if (!Present(body, "description")) {
    errors.push_back("Description is required");
  } else if (auto v = CheckString(body["description"], "Description", true,
                                  limits.max_description, &errors)) {
    draft.description = *v;
  }

  if (!Present(body, "price")) {
    errors.push_back("Price is required");
  } else if (auto v = CheckPrice(body["price"], &errors)) {
    draft.price = *v;
  }

  if (!Present(body, "category")) {
    errors.push_back("Category is required");
  } else if (auto v = CheckString(body["category"], "Category", false,
                                  limits.max_category, &errors)) {
    draft.category = *v;
  }

  if (!Present(body, "inStock")) {
    errors.push_back("inStock is required");
  } else if (auto v = CheckInStock(body["inStock"], &errors)) {
    draft.in_stock = *v;
  }

  Status s = Collect(std::move(errors));
  if (s.ok()) *out = std::move(draft);
  return s;
}

Status ValidateProductUpdate(const Json::Value& body,
                             ProductPatch* out,
                             const FieldLimits& limits) {
  if (!out) return Status::Internal("out is null");
  if (!body.isObject()) {
    return Status::ValidationFailed(kValidationFailed, {kNotAnObject});
  }

  Errors errors;
  ProductPatch patch;

  if (body.isMember("name")) {
    patch.name = CheckString(body["name"], "Name", false, limits.max_name, &errors);
  }
  if (body.isMember("description")) {
    patch.description = CheckString(body["description"], "Description", true,
                                     limits.max_description, &errors);
  }
  if (body.isMember("price")) {
    patch.price = CheckPrice(body["price"], &errors);
  }
  if (body.isMember("category")) {
    patch.category = CheckString(body["category"], "Category", false,
                                 limits.max_category, &errors);
  }
  if (body.isMember("inStock")) {
    patch.in_stock = CheckInStock(body["inStock"], &errors);
  }

  Status s = Collect(std::move(errors));
  if (s.ok()) *out = std::move(patch);
  return s;
}

}  // namespace catalog::server
