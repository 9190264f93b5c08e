#include <catalog/product_ops.hpp>

#include <catalog/internal.hpp>

#include <algorithm>
#include <iterator>

namespace catalog::ops {

namespace {

template <typename Pred>
std::vector<Product> KeepIf(const std::vector<Product>& products, Pred pred) {
  std::vector<Product> out;
  out.reserve(products.size());
  std::copy_if(products.begin(), products.end(), std::back_inserter(out), pred);
  return out;
}

// Three-way comparison on a single field; 0 for unknown fields.
int CompareField(const Product& a, const Product& b, std::string_view field) {
  auto cmp = [](auto x, auto y) { return x < y ? -1 : (y < x ? 1 : 0); };

  if (field == "id") return cmp(a.id, b.id);
  if (field == "price") return cmp(a.price, b.price);
  if (field == "inStock") return cmp(a.in_stock, b.in_stock);
  if (field == "name") {
    return cmp(internal::ToLower(a.name), internal::ToLower(b.name));
  }
  if (field == "description") {
    return cmp(internal::ToLower(a.description), internal::ToLower(b.description));
  }
  if (field == "category") {
    return cmp(internal::ToLower(a.category), internal::ToLower(b.category));
  }
  return 0;
}

void Accumulate(PriceStats* s, const Product& p) {
  if (s->total_products == 0) {
    s->min_price = p.price;
    s->max_price = p.price;
  } else {
    s->min_price = std::min(s->min_price, p.price);
    s->max_price = std::max(s->max_price, p.price);
  }
  s->total_products++;
  s->total_value += p.price;
  if (p.in_stock) {
    s->in_stock_count++;
  } else {
    s->out_of_stock_count++;
  }
}

void Finish(PriceStats* s) {
  s->average_price = s->total_products > 0
                         ? s->total_value / static_cast<double>(s->total_products)
                         : 0.0;
}

}  // namespace

std::vector<Product> FilterByCategory(const std::vector<Product>& products,
                                      const std::optional<std::string>& category) {
  if (!category || category->empty()) return products;
  return KeepIf(products, [&](const Product& p) {
    return internal::EqualsIgnoreCase(p.category, *category);
  });
}

std::vector<Product> FilterByStock(const std::vector<Product>& products,
                                   const std::optional<std::string>& in_stock) {
  if (!in_stock) return products;
  auto wanted = query::ParseBool(*in_stock);
  if (!wanted) return products;
  return KeepIf(products, [&](const Product& p) { return p.in_stock == *wanted; });
}

std::vector<Product> FilterByPriceRange(const std::vector<Product>& products,
                                        const std::optional<std::string>& min_price,
                                        const std::optional<std::string>& max_price) {
  std::optional<double> lo = min_price ? query::ParseDouble(*min_price) : std::nullopt;
  std::optional<double> hi = max_price ? query::ParseDouble(*max_price) : std::nullopt;
  if (!lo && !hi) return products;

  return KeepIf(products, [&](const Product& p) {
    if (lo && p.price < *lo) return false;
    if (hi && p.price > *hi) return false;
    return true;
  });
}

std::vector<Product> SearchByName(const std::vector<Product>& products,
                                  std::string_view query) {
  std::string needle = internal::Trim(query);
  if (needle.empty()) return products;
  return KeepIf(products, [&](const Product& p) {
    return internal::ContainsIgnoreCase(p.name, needle) ||
           internal::ContainsIgnoreCase(p.description, needle);
  });
}

std::vector<Product> SortProducts(const std::vector<Product>& products,
                                  std::string_view field,
                                  query::SortOrder order) {
  std::vector<Product> out = products;
  if (!query::IsSortableField(field)) return out;

  const bool desc = order == query::SortOrder::kDesc;
  std::stable_sort(out.begin(), out.end(), [&](const Product& a, const Product& b) {
    int c = CompareField(a, b, field);
    return desc ? c > 0 : c < 0;
  });
  return out;
}

std::vector<Product> PaginateProducts(const std::vector<Product>& products,
                                      int64_t skip,
                                      int64_t limit) {
  const int64_t size = static_cast<int64_t>(products.size());
  if (skip < 0) skip = 0;
  if (limit <= 0 || skip >= size) return {};

  int64_t end = (limit > size - skip) ? size : skip + limit;
  return std::vector<Product>(products.begin() + skip, products.begin() + end);
}

Statistics CalculateStatistics(const std::vector<Product>& products) {
  Statistics stats;
  for (const auto& p : products) {
    Accumulate(&stats.overall, p);
    Accumulate(&stats.by_category[p.category], p);
  }
  Finish(&stats.overall);
  for (auto& entry : stats.by_category) {
    Finish(&entry.second);
  }
  return stats;
}

}  // namespace catalog::ops
