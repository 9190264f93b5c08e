#pragma once

#include <catalog/product.hpp>
#include <catalog/status.hpp>

#include <json/json.h>

#include <cstddef>

namespace catalog::server {

/** Length limits, in characters. */
struct FieldLimits {
  size_t max_name = 100;
  size_t max_description = 500;
  size_t max_category = 50;
};

/**
 * Check a create payload. All five fields are required:
 *   name, category: non-empty strings within their limits
 *   description:    string within its limit (may be empty)
 *   price:          number > 0, or a numeric string
 *   inStock:        boolean, "true"/"false", or 0/1
 * Every violation is collected into the returned ValidationFailed status.
 */
Status ValidateProductCreate(const Json::Value& body,
                             ProductDraft* out,
                             const FieldLimits& limits = FieldLimits{});

/**
 * Check an update payload. Any subset of the create fields; each is checked
 * only if present. An empty object is a valid no-op.
 */
Status ValidateProductUpdate(const Json::Value& body,
                             ProductPatch* out,
                             const FieldLimits& limits = FieldLimits{});

}  // namespace catalog::server
