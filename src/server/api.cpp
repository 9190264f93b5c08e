#include <catalog/server/api.hpp>

#include <catalog/internal.hpp>
#include <catalog/product_ops.hpp>
#include <catalog/server/json.hpp>
#include <catalog/version.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace catalog::server {

namespace {

constexpr const char* kInternalMessage = "Internal server error";

Json::Value SuccessEnvelope() {
  Json::Value json;
  json["success"] = true;
  return json;
}

Status BodyRequired() {
  return Status::ValidationFailed("Validation failed",
                                  {"Request body must be a JSON object"});
}

}  // namespace

ApiResponse ErrorResponse(const Status& status) {
  ApiResponse resp;
  resp.status = status.HttpStatus();
  resp.body = ErrorEnvelope(status);
  return resp;
}

Status ParseProductId(const std::string& raw, int64_t* id) {
  auto parsed = query::ParseInt64(raw);
  if (!parsed) {
    return Status::BadRequest("Product ID must be a valid number");
  }
  *id = *parsed;
  return Status::OK();
}

ProductApi::ProductApi(ProductStore* store, const Config& config)
    : store_(store),
      gate_(config.auth.api_keys, config.auth.header),
      environment_(config.server.environment) {
  pagination_.default_limit = config.pagination.default_limit;
  pagination_.max_limit = config.pagination.max_limit;
}

template <typename Fn>
ApiResponse ProductApi::Guarded(const char* op, Fn&& fn) const {
  ApiResponse resp;
  try {
    Status s = fn(&resp);
    if (s.ok()) return resp;

    if (s.IsInternal()) {
      LOG_ERROR << op << " failed: " << s.ToString();
      return ErrorResponse(Status::Internal(kInternalMessage));
    }
    LOG_DEBUG << op << " rejected: " << s.ToString();
    return ErrorResponse(s);
  } catch (const std::exception& e) {
    // Log the cause; the client only sees the generic message.
    LOG_ERROR << op << " threw: " << e.what();
    return ErrorResponse(Status::Internal(kInternalMessage));
  }
}

// ==========================================================================
// Public endpoints
// ==========================================================================

ApiResponse ProductApi::Root() const {
  ApiResponse resp;
  resp.is_text = true;
  resp.text = "Hello World";
  return resp;
}

ApiResponse ProductApi::Health() const {
  return Guarded("Health", [&](ApiResponse* resp) {
    Json::Value json = SuccessEnvelope();
    json["status"] = "healthy";
    json["message"] = "Server is running";
    json["timestamp"] = internal::FormatIso8601(internal::WallClockMillis());
    json["environment"] = environment_;
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::Describe() const {
  return Guarded("Describe", [&](ApiResponse* resp) {
    Json::Value products;
    products["listAll"] = "GET /api/products";
    products["getOne"] = "GET /api/products/:id";
    products["create"] = "POST /api/products";
    products["update"] = "PUT /api/products/:id";
    products["delete"] = "DELETE /api/products/:id";
    products["search"] = "GET /api/products/search";
    products["statistics"] = "GET /api/products/stats";

    Json::Value params;
    params["pagination"] = "?page=1&limit=" + std::to_string(pagination_.default_limit);
    params["filtering"] = "?category=Electronics&inStock=true&minPrice=50&maxPrice=500";
    params["sorting"] = "?sort=price (or ?sort=-price for descending)";
    params["search"] = "?q=laptop";

    Json::Value json = SuccessEnvelope();
    json["message"] = "Products API Documentation";
    json["version"] = Version();
    json["endpoints"]["products"] = products;
    json["endpoints"]["queryParameters"] = params;
    json["authentication"] = "Required: " + gate_.header() + " header";
    resp->body = json;
    return Status::OK();
  });
}

// ==========================================================================
// Products
// ==========================================================================

// Order matters: search -> filters -> sort -> count -> paginate, so that
// totalItems is the filtered size before the page is cut.
ApiResponse ProductApi::ListProducts(const ApiRequest& req) const {
  return Guarded("ListProducts", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;

    auto category = query::GetParam(req.params, "category");
    auto in_stock = query::GetParam(req.params, "inStock");
    auto min_price = query::GetParam(req.params, "minPrice");
    auto max_price = query::GetParam(req.params, "maxPrice");
    auto q = query::GetParam(req.params, "q");

    std::vector<Product> products = store_->List();
    if (q) {
      products = ops::SearchByName(products, *q);
    }
    products = ops::FilterByCategory(products, category);
    products = ops::FilterByStock(products, in_stock);
    products = ops::FilterByPriceRange(products, min_price, max_price);

    auto sort = query::ParseSort(req.params);
    if (sort) {
      products = ops::SortProducts(products, sort->field, sort->order);
    }

    const int64_t total = static_cast<int64_t>(products.size());
    auto page = query::ParsePagination(req.params, pagination_);
    auto data = ops::PaginateProducts(products, page.skip, page.limit);

    Json::Value filters;
    filters["category"] = StringOrNull(category);
    filters["inStock"] = StringOrNull(in_stock);
    filters["minPrice"] = StringOrNull(min_price);
    filters["maxPrice"] = StringOrNull(max_price);
    filters["search"] = StringOrNull(q);

    Json::Value json = SuccessEnvelope();
    json["filters"] = filters;
    json["sort"] = sort ? ToJson(*sort) : Json::Value(Json::nullValue);
    json["pagination"] = ToJson(query::CreatePaginationMeta(total, page.page, page.limit));
    json["data"] = ToJson(data);
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::SearchProducts(const ApiRequest& req) const {
  return Guarded("SearchProducts", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;

    auto q = query::GetParam(req.params, "q");
    if (!q || internal::Trim(*q).empty()) {
      return Status::BadRequest("Search query parameter \"q\" is required");
    }
    auto category = query::GetParam(req.params, "category");
    auto in_stock = query::GetParam(req.params, "inStock");

    std::vector<Product> results = ops::SearchByName(store_->List(), *q);
    results = ops::FilterByCategory(results, category);
    results = ops::FilterByStock(results, in_stock);

    const int64_t total = static_cast<int64_t>(results.size());
    auto page = query::ParsePagination(req.params, pagination_);
    auto data = ops::PaginateProducts(results, page.skip, page.limit);

    Json::Value filters;
    filters["category"] = StringOrNull(category);
    filters["inStock"] = StringOrNull(in_stock);

    Json::Value json = SuccessEnvelope();
    json["query"] = *q;
    json["filters"] = filters;
    json["pagination"] = ToJson(query::CreatePaginationMeta(total, page.page, page.limit));
    json["resultsCount"] = static_cast<Json::Int64>(total);
    json["data"] = ToJson(data);
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::ProductStats(const ApiRequest& req) const {
  return Guarded("ProductStats", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;

    auto category = query::GetParam(req.params, "category");
    const bool filtered = category && !category->empty();

    auto products = ops::FilterByCategory(store_->List(), category);
    auto stats = ops::CalculateStatistics(products);

    Json::Value json = SuccessEnvelope();
    if (filtered) {
      json["filter"]["category"] = *category;
    } else {
      json["filter"] = Json::Value(Json::nullValue);
    }
    json["statistics"] = ToJson(stats);
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::GetProduct(const ApiRequest& req, const std::string& id) const {
  return Guarded("GetProduct", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;

    int64_t product_id = 0;
    s = ParseProductId(id, &product_id);
    if (!s.ok()) return s;

    Product product;
    s = store_->Get(product_id, &product);
    if (!s.ok()) return s;

    Json::Value json = SuccessEnvelope();
    json["data"] = ToJson(product);
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::CreateProduct(const ApiRequest& req) {
  return Guarded("CreateProduct", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;
    if (!req.body) return BodyRequired();

    ProductDraft draft;
    s = ValidateProductCreate(*req.body, &draft, limits_);
    if (!s.ok()) return s;

    Product created;
    s = store_->Create(draft, &created);
    if (!s.ok()) return s;

    LOG_DEBUG << "Created product " << created.id << " (" << created.name << ")";

    Json::Value json = SuccessEnvelope();
    json["message"] = "Product created successfully";
    json["data"] = ToJson(created);
    resp->status = 201;
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::UpdateProduct(const ApiRequest& req, const std::string& id) {
  return Guarded("UpdateProduct", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;

    int64_t product_id = 0;
    s = ParseProductId(id, &product_id);
    if (!s.ok()) return s;

    // An absent body is an empty patch.
    const Json::Value empty(Json::objectValue);
    const Json::Value& body = req.body ? *req.body : empty;

    ProductPatch patch;
    s = ValidateProductUpdate(body, &patch, limits_);
    if (!s.ok()) return s;

    Product updated;
    s = store_->Update(product_id, patch, &updated);
    if (!s.ok()) return s;

    Json::Value json = SuccessEnvelope();
    json["message"] = "Product updated successfully";
    json["data"] = ToJson(updated);
    resp->body = json;
    return Status::OK();
  });
}

ApiResponse ProductApi::DeleteProduct(const ApiRequest& req, const std::string& id) {
  return Guarded("DeleteProduct", [&](ApiResponse* resp) {
    Status s = gate_.Check(req.api_key);
    if (!s.ok()) return s;

    int64_t product_id = 0;
    s = ParseProductId(id, &product_id);
    if (!s.ok()) return s;

    Product removed;
    s = store_->Delete(product_id, &removed);
    if (!s.ok()) return s;

    Json::Value json = SuccessEnvelope();
    json["message"] = "Product deleted successfully";
    json["data"] = ToJson(removed);
    resp->body = json;
    return Status::OK();
  });
}

// ==========================================================================
// Fallbacks
// ==========================================================================

ApiResponse ProductApi::RouteNotFound(const ApiRequest& req) const {
  return ErrorResponse(Status::NotFound("Cannot " + req.method + " " + req.path +
                                        " - Resource not found"));
}

ApiResponse ProductApi::TestError(const ApiRequest& req) const {
  return Guarded("TestError", [&](ApiResponse*) -> Status {
    throw std::runtime_error("This is a test error (" + req.path + ")");
  });
}

}  // namespace catalog::server
