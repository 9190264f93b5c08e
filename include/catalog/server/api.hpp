#pragma once

#include <catalog/query.hpp>
#include <catalog/server/auth.hpp>
#include <catalog/server/config.hpp>
#include <catalog/server/validation.hpp>
#include <catalog/status.hpp>
#include <catalog/store.hpp>

#include <json/json.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace catalog::server {

/**
 * Transport-independent view of an HTTP request.
 */
struct ApiRequest {
  std::string method = "GET";
  std::string path = "/";
  std::optional<std::string> api_key;  // nullopt when the header is absent
  query::Params params;
  std::shared_ptr<const Json::Value> body;  // null when absent or not JSON
};

/**
 * Status code plus either a JSON body or a plain-text body.
 */
struct ApiResponse {
  int status = 200;
  Json::Value body;
  bool is_text = false;
  std::string text;
};

/** Envelope response for a non-OK status. */
ApiResponse ErrorResponse(const Status& status);

/** Strict integer parse of a path id. BadRequest if malformed. */
Status ParseProductId(const std::string& raw, int64_t* id);

/**
 * The request pipeline for the products API.
 *
 * Each endpoint runs auth, then validation (for writes), then store access
 * and the query/product helpers, and serializes the result. Every method is
 * wrapped in one guard: a non-OK Status becomes the error envelope, and an
 * exception becomes a logged, generic 500.
 */
class ProductApi {
 public:
  ProductApi(ProductStore* store, const Config& config);

  ProductApi(const ProductApi&) = delete;
  ProductApi& operator=(const ProductApi&) = delete;

  // Public endpoints
  ApiResponse Root() const;
  ApiResponse Health() const;
  ApiResponse Describe() const;

  // Key-protected endpoints
  ApiResponse ListProducts(const ApiRequest& req) const;
  ApiResponse SearchProducts(const ApiRequest& req) const;
  ApiResponse ProductStats(const ApiRequest& req) const;
  ApiResponse GetProduct(const ApiRequest& req, const std::string& id) const;
  ApiResponse CreateProduct(const ApiRequest& req);
  ApiResponse UpdateProduct(const ApiRequest& req, const std::string& id);
  ApiResponse DeleteProduct(const ApiRequest& req, const std::string& id);

  /** Response for a route that matched nothing. */
  ApiResponse RouteNotFound(const ApiRequest& req) const;

  /** Development route that fails with an unexpected fault. */
  ApiResponse TestError(const ApiRequest& req) const;

  const ApiKeyGate& gate() const { return gate_; }

 private:
  template <typename Fn>
  ApiResponse Guarded(const char* op, Fn&& fn) const;

  ProductStore* store_;
  ApiKeyGate gate_;
  query::PaginationDefaults pagination_;
  FieldLimits limits_;
  std::string environment_;
};

}  // namespace catalog::server
