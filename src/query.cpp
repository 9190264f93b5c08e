#include <catalog/query.hpp>

#include <catalog/internal.hpp>

#include <array>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace catalog::query {

namespace {

constexpr std::array<std::string_view, 6> kSortableFields = {
    "id", "name", "description", "price", "category", "inStock"};

}  // namespace

std::optional<std::string> GetParam(const Params& params, std::string_view name) {
  auto it = params.find(std::string(name));
  if (it == params.end()) return std::nullopt;
  return it->second;
}

std::optional<int64_t> ParseInt64(std::string_view s) {
  std::string trimmed = internal::Trim(s);
  if (trimmed.empty()) return std::nullopt;

  const char* begin = trimmed.data();
  const char* end = begin + trimmed.size();
  if (*begin == '+') ++begin;

  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return value;
}

std::optional<double> ParseDouble(std::string_view s) {
  std::string trimmed = internal::Trim(s);
  if (trimmed.empty()) return std::nullopt;

  errno = 0;
  char* end = nullptr;
  double value = std::strtod(trimmed.c_str(), &end);
  if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
    return std::nullopt;
  }
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

std::optional<bool> ParseBool(std::string_view s) {
  if (s == "true") return true;
  if (s == "false") return false;
  return std::nullopt;
}

Pagination ParsePagination(const Params& params, const PaginationDefaults& defaults) {
  Pagination p;

  p.page = 1;
  if (auto raw = GetParam(params, "page")) {
    if (auto v = ParseInt64(*raw); v && *v > 1) {
      p.page = *v;
    }
  }

  p.limit = defaults.default_limit;
  if (auto raw = GetParam(params, "limit")) {
    if (auto v = ParseInt64(*raw); v && *v >= 1) {
      p.limit = *v;
    }
  }
  if (p.limit > defaults.max_limit) p.limit = defaults.max_limit;
  if (p.limit < 1) p.limit = 1;

  // Saturate instead of overflowing on absurd page numbers; the slice is
  // empty either way.
  const int64_t max_skip = std::numeric_limits<int64_t>::max();
  if (p.page - 1 > max_skip / p.limit) {
    p.skip = max_skip;
  } else {
    p.skip = (p.page - 1) * p.limit;
  }
  return p;
}

bool IsSortableField(std::string_view field) {
  for (auto f : kSortableFields) {
    if (f == field) return true;
  }
  return false;
}

std::string_view SortOrderName(SortOrder order) {
  return order == SortOrder::kDesc ? "desc" : "asc";
}

std::optional<SortSpec> ParseSort(const Params& params) {
  auto raw = GetParam(params, "sort");
  if (!raw) return std::nullopt;

  std::string value = internal::Trim(*raw);
  if (value.empty()) return std::nullopt;

  SortSpec spec;
  if (value[0] == '-') {
    spec.order = SortOrder::kDesc;
    spec.field = value.substr(1);
  } else {
    spec.order = SortOrder::kAsc;
    spec.field = value;
  }

  if (!IsSortableField(spec.field)) return std::nullopt;
  return spec;
}

PaginationMeta CreatePaginationMeta(int64_t total_count, int64_t page, int64_t limit) {
  PaginationMeta meta;
  if (limit < 1) limit = 1;
  if (total_count < 0) total_count = 0;

  meta.current_page = page;
  meta.total_items = total_count;
  meta.items_per_page = limit;
  meta.total_pages = total_count / limit + (total_count % limit != 0 ? 1 : 0);
  meta.has_next_page = page < meta.total_pages;
  meta.has_prev_page = page > 1;
  if (meta.has_next_page) meta.next_page = page + 1;
  if (meta.has_prev_page) meta.prev_page = page - 1;
  return meta;
}

}  // namespace catalog::query
