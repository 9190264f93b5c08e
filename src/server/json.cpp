#include <catalog/server/json.hpp>

namespace catalog::server {

Json::Value ToJson(const Product& product) {
  Json::Value json;
  json["id"] = static_cast<Json::Int64>(product.id);
  json["name"] = product.name;
  json["description"] = product.description;
  json["price"] = product.price;
  json["category"] = product.category;
  json["inStock"] = product.in_stock;
  return json;
}

Json::Value ToJson(const std::vector<Product>& products) {
  Json::Value json(Json::arrayValue);
  for (const auto& p : products) {
    json.append(ToJson(p));
  }
  return json;
}

Json::Value ToJson(const query::PaginationMeta& meta) {
  Json::Value json;
  json["currentPage"] = static_cast<Json::Int64>(meta.current_page);
  json["totalPages"] = static_cast<Json::Int64>(meta.total_pages);
  json["totalItems"] = static_cast<Json::Int64>(meta.total_items);
  json["itemsPerPage"] = static_cast<Json::Int64>(meta.items_per_page);
  json["hasNextPage"] = meta.has_next_page;
  json["hasPrevPage"] = meta.has_prev_page;
  json["nextPage"] = meta.next_page ? Json::Value(static_cast<Json::Int64>(*meta.next_page))
                                    : Json::Value(Json::nullValue);
  json["prevPage"] = meta.prev_page ? Json::Value(static_cast<Json::Int64>(*meta.prev_page))
                                    : Json::Value(Json::nullValue);
  return json;
}

Json::Value ToJson(const query::SortSpec& sort) {
  Json::Value json;
  json["field"] = sort.field;
  json["order"] = std::string(query::SortOrderName(sort.order));
  return json;
}

Json::Value ToJson(const ops::PriceStats& stats) {
  Json::Value json;
  json["totalProducts"] = static_cast<Json::Int64>(stats.total_products);
  json["totalValue"] = stats.total_value;
  json["averagePrice"] = stats.average_price;
  json["inStockCount"] = static_cast<Json::Int64>(stats.in_stock_count);
  json["outOfStockCount"] = static_cast<Json::Int64>(stats.out_of_stock_count);
  json["minPrice"] = stats.min_price;
  json["maxPrice"] = stats.max_price;
  return json;
}

Json::Value ToJson(const ops::Statistics& stats) {
  Json::Value json;
  json["overall"] = ToJson(stats.overall);

  Json::Value by_category(Json::objectValue);
  for (const auto& [category, s] : stats.by_category) {
    by_category[category] = ToJson(s);
  }
  json["byCategory"] = by_category;
  return json;
}

Json::Value StringOrNull(const std::optional<std::string>& value) {
  if (!value || value->empty()) return Json::Value(Json::nullValue);
  return Json::Value(*value);
}

Json::Value ErrorEnvelope(const Status& status) {
  Json::Value json;
  json["success"] = false;
  json["status"] = status.HttpStatus();
  json["error"] = std::string(status.CodeName());
  json["message"] = status.message();

  if (!status.details().empty()) {
    Json::Value errors(Json::arrayValue);
    for (const auto& d : status.details()) {
      errors.append(d);
    }
    json["errors"] = errors;
  }
  return json;
}

}  // namespace catalog::server
