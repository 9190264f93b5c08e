#pragma once

#include <catalog/product.hpp>
#include <catalog/product_ops.hpp>
#include <catalog/query.hpp>
#include <catalog/status.hpp>

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

namespace catalog::server {

// JSON views of catalog types. Field names follow the public API
// (camelCase), e.g. Product::in_stock is "inStock".

Json::Value ToJson(const Product& product);
Json::Value ToJson(const std::vector<Product>& products);
Json::Value ToJson(const query::PaginationMeta& meta);
Json::Value ToJson(const query::SortSpec& sort);
Json::Value ToJson(const ops::PriceStats& stats);
Json::Value ToJson(const ops::Statistics& stats);

/** The string, or null when absent. */
Json::Value StringOrNull(const std::optional<std::string>& value);

/**
 * Failure envelope:
 *   {"success": false, "status": 404, "error": "not_found",
 *    "message": "...", "errors": [...]}
 * "errors" is present only when the status carries details.
 */
Json::Value ErrorEnvelope(const Status& status);

}  // namespace catalog::server
