#pragma once

#include <catalog/product.hpp>
#include <catalog/query.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace catalog::ops {

// Pure list transforms. Each returns a new vector and preserves the relative
// order of the records it keeps. Filters whose argument is absent or
// unparseable return the input unchanged.

/** Case-insensitive exact match on category. */
std::vector<Product> FilterByCategory(const std::vector<Product>& products,
                                      const std::optional<std::string>& category);

/** Keeps records whose in_stock matches "true"/"false". */
std::vector<Product> FilterByStock(const std::vector<Product>& products,
                                   const std::optional<std::string>& in_stock);

/** Keeps price >= min_price and/or price <= max_price; each bound is optional. */
std::vector<Product> FilterByPriceRange(const std::vector<Product>& products,
                                        const std::optional<std::string>& min_price,
                                        const std::optional<std::string>& max_price);

/** Case-insensitive substring match against name and description. */
std::vector<Product> SearchByName(const std::vector<Product>& products,
                                  std::string_view query);

/**
 * Stable sort on a product field. id and price compare numerically, inStock
 * orders false before true, string fields compare case-insensitively.
 * An unknown field returns the input order.
 */
std::vector<Product> SortProducts(const std::vector<Product>& products,
                                  std::string_view field,
                                  query::SortOrder order);

/** Records [skip, skip + limit), clamped to the list. */
std::vector<Product> PaginateProducts(const std::vector<Product>& products,
                                      int64_t skip,
                                      int64_t limit);

struct PriceStats {
  int64_t total_products = 0;
  double total_value = 0.0;
  double average_price = 0.0;
  int64_t in_stock_count = 0;
  int64_t out_of_stock_count = 0;
  double min_price = 0.0;
  double max_price = 0.0;
};

struct Statistics {
  PriceStats overall;
  std::map<std::string, PriceStats> by_category;  // keyed by stored category
};

/** Aggregates over the list. An empty list yields all-zero stats. */
Statistics CalculateStatistics(const std::vector<Product>& products);

}  // namespace catalog::ops
