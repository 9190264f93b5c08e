#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace catalog::query {

/** Decoded query-string parameters (name -> value). */
using Params = std::map<std::string, std::string>;

struct PaginationDefaults {
  int64_t default_limit = 10;
  int64_t max_limit = 100;
};

struct Pagination {
  int64_t page = 1;
  int64_t limit = 10;
  int64_t skip = 0;
};

enum class SortOrder { kAsc, kDesc };

struct SortSpec {
  std::string field;
  SortOrder order = SortOrder::kAsc;
};

struct PaginationMeta {
  int64_t current_page = 1;
  int64_t total_pages = 0;
  int64_t total_items = 0;
  int64_t items_per_page = 0;
  bool has_next_page = false;
  bool has_prev_page = false;
  std::optional<int64_t> next_page;
  std::optional<int64_t> prev_page;
};

// ---------------------------------------------------------------------------
// Coercion. Every parser returns nullopt for unparseable input so callers can
// ignore the parameter instead of failing the request.
// ---------------------------------------------------------------------------

/** Value of a parameter, or nullopt if it was not supplied. */
std::optional<std::string> GetParam(const Params& params, std::string_view name);

/** Whole-string base-10 integer ("12", "-3"). "12abc" is rejected. */
std::optional<int64_t> ParseInt64(std::string_view s);

/** Whole-string finite decimal ("9.99", "1e3"). */
std::optional<double> ParseDouble(std::string_view s);

/** Exactly "true" or "false". */
std::optional<bool> ParseBool(std::string_view s);

// ---------------------------------------------------------------------------
// Pagination and sorting
// ---------------------------------------------------------------------------

/**
 * Read `page` and `limit`.
 * page: default 1, values < 1 become 1.
 * limit: default defaults.default_limit, values < 1 fall back to the default,
 * values above defaults.max_limit are clamped.
 */
Pagination ParsePagination(const Params& params,
                           const PaginationDefaults& defaults = PaginationDefaults{});

/**
 * Read `sort`. "price" sorts ascending, "-price" descending. Returns nullopt
 * when the parameter is absent or empty, or names a field products do not
 * have.
 */
std::optional<SortSpec> ParseSort(const Params& params);

/** True for id, name, description, price, category, inStock. */
bool IsSortableField(std::string_view field);

std::string_view SortOrderName(SortOrder order);

PaginationMeta CreatePaginationMeta(int64_t total_count, int64_t page, int64_t limit);

}  // namespace catalog::query
