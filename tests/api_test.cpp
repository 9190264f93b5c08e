// Request pipeline tests for catalog/server/api.hpp
// Tests: auth, validation, store errors and envelopes, without a network

#include <gtest/gtest.h>

#include <catalog/server/api.hpp>
#include <catalog/version.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>

namespace catalog::server {
namespace {

constexpr const char* kKey = "your-secret-api-key-123";

class ProductApiTest : public ::testing::Test {
 protected:
  void SetUp() override {
    StoreOptions opt;
    opt.seed_sample_data = true;
    store_ = std::make_unique<ProductStore>(opt);
    api_ = std::make_unique<ProductApi>(store_.get(), config_);
  }

  static ApiRequest Request(const std::string& method,
                            const std::string& path,
                            query::Params params = {}) {
    ApiRequest req;
    req.method = method;
    req.path = path;
    req.api_key = std::string(kKey);
    req.params = std::move(params);
    return req;
  }

  static ApiRequest WithBody(ApiRequest req, const Json::Value& body) {
    req.body = std::make_shared<Json::Value>(body);
    return req;
  }

  static Json::Value NewProduct(const std::string& name) {
    Json::Value body;
    body["name"] = name;
    body["description"] = "Mechanical keyboard";
    body["price"] = 89.99;
    body["category"] = "Accessories";
    body["inStock"] = true;
    return body;
  }

  static void ExpectError(const ApiResponse& resp, int status, const std::string& error) {
    EXPECT_EQ(resp.status, status);
    EXPECT_FALSE(resp.body["success"].asBool());
    EXPECT_EQ(resp.body["status"].asInt(), status);
    EXPECT_EQ(resp.body["error"].asString(), error);
  }

  Config config_;
  std::unique_ptr<ProductStore> store_;
  std::unique_ptr<ProductApi> api_;
};

// =============================================================================
// Public endpoints
// =============================================================================

TEST_F(ProductApiTest, RootIsPlainText) {
  auto resp = api_->Root();
  EXPECT_EQ(resp.status, 200);
  EXPECT_TRUE(resp.is_text);
  EXPECT_EQ(resp.text, "Hello World");
}

TEST_F(ProductApiTest, Health) {
  auto resp = api_->Health();
  EXPECT_EQ(resp.status, 200);
  EXPECT_TRUE(resp.body["success"].asBool());
  EXPECT_EQ(resp.body["status"].asString(), "healthy");
  EXPECT_EQ(resp.body["environment"].asString(), "development");
  // 2024-01-01T00:00:00.000Z
  EXPECT_EQ(resp.body["timestamp"].asString().size(), 24u);
}

TEST_F(ProductApiTest, Describe) {
  auto resp = api_->Describe();
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["version"].asString(), Version());
  EXPECT_EQ(resp.body["endpoints"]["products"]["listAll"].asString(), "GET /api/products");
  EXPECT_NE(resp.body["authentication"].asString().find("x-api-key"), std::string::npos);
}

TEST_F(ProductApiTest, RouteNotFound) {
  auto resp = api_->RouteNotFound(Request("PATCH", "/api/unknown"));
  ExpectError(resp, 404, "not_found");
  EXPECT_EQ(resp.body["message"].asString(), "Cannot PATCH /api/unknown - Resource not found");
}

TEST_F(ProductApiTest, TestErrorIsGeneric500) {
  auto resp = api_->TestError(Request("GET", "/test-error"));
  ExpectError(resp, 500, "internal_error");
  EXPECT_EQ(resp.body["message"].asString(), "Internal server error");
}

// =============================================================================
// Authentication
// =============================================================================

TEST_F(ProductApiTest, MissingKeyIsUnauthorized) {
  auto req = Request("GET", "/api/products");
  req.api_key.reset();
  ExpectError(api_->ListProducts(req), 401, "unauthorized");
}

TEST_F(ProductApiTest, WrongKeyIsForbidden) {
  auto req = Request("GET", "/api/products");
  req.api_key = std::string("wrong-key");
  ExpectError(api_->ListProducts(req), 403, "forbidden");
}

TEST_F(ProductApiTest, EmptyKeyIsForbidden) {
  auto req = Request("GET", "/api/products/1");
  req.api_key = std::string("");
  ExpectError(api_->GetProduct(req, "1"), 403, "forbidden");
}

TEST_F(ProductApiTest, AuthRunsBeforeValidation) {
  auto req = WithBody(Request("POST", "/api/products"), Json::Value(Json::objectValue));
  req.api_key.reset();
  ExpectError(api_->CreateProduct(req), 401, "unauthorized");
  EXPECT_EQ(store_->Size(), 3u);
}

TEST_F(ProductApiTest, SecondConfiguredKeyAccepted) {
  auto req = Request("GET", "/api/products");
  req.api_key = std::string("another-valid-key-456");
  EXPECT_EQ(api_->ListProducts(req).status, 200);
}

// =============================================================================
// Listing
// =============================================================================

TEST_F(ProductApiTest, ListDefaults) {
  auto resp = api_->ListProducts(Request("GET", "/api/products"));
  ASSERT_EQ(resp.status, 200);
  EXPECT_TRUE(resp.body["success"].asBool());
  EXPECT_EQ(resp.body["data"].size(), 3u);
  EXPECT_EQ(resp.body["pagination"]["totalItems"].asInt(), 3);
  EXPECT_EQ(resp.body["pagination"]["itemsPerPage"].asInt(), 10);
  EXPECT_TRUE(resp.body["sort"].isNull());
  EXPECT_TRUE(resp.body["filters"]["category"].isNull());
}

TEST_F(ProductApiTest, ListFilteredAndPaged) {
  ASSERT_EQ(api_->CreateProduct(WithBody(Request("POST", "/api/products"),
                                         [] {
                                           Json::Value b;
                                           b["name"] = "Monitor";
                                           b["description"] = "27 inch";
                                           b["price"] = 299;
                                           b["category"] = "electronics";
                                           b["inStock"] = true;
                                           return b;
                                         }()))
                .status,
            201);

  auto resp = api_->ListProducts(Request(
      "GET", "/api/products",
      {{"category", "Electronics"}, {"inStock", "true"}, {"page", "1"}, {"limit", "1"}}));
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["data"].size(), 1u);
  EXPECT_EQ(resp.body["data"][0]["id"].asInt(), 1);
  EXPECT_EQ(resp.body["pagination"]["totalItems"].asInt(), 2);
  EXPECT_EQ(resp.body["pagination"]["totalPages"].asInt(), 2);
  EXPECT_TRUE(resp.body["pagination"]["hasNextPage"].asBool());
  EXPECT_EQ(resp.body["pagination"]["nextPage"].asInt(), 2);
  EXPECT_TRUE(resp.body["pagination"]["prevPage"].isNull());
  EXPECT_EQ(resp.body["filters"]["category"].asString(), "Electronics");
}

TEST_F(ProductApiTest, ListSortedDescending) {
  auto resp = api_->ListProducts(Request("GET", "/api/products", {{"sort", "-price"}}));
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["data"][0]["name"].asString(), "Laptop Pro");
  EXPECT_EQ(resp.body["data"][2]["name"].asString(), "Wireless Mouse");
  EXPECT_EQ(resp.body["sort"]["field"].asString(), "price");
  EXPECT_EQ(resp.body["sort"]["order"].asString(), "desc");
}

TEST_F(ProductApiTest, ListPageBeyondEnd) {
  auto resp = api_->ListProducts(Request("GET", "/api/products", {{"page", "5"}}));
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["data"].size(), 0u);
  EXPECT_EQ(resp.body["pagination"]["totalItems"].asInt(), 3);
  EXPECT_FALSE(resp.body["pagination"]["hasNextPage"].asBool());
}

TEST_F(ProductApiTest, ListLimitClamped) {
  auto resp = api_->ListProducts(Request("GET", "/api/products", {{"limit", "5000"}}));
  EXPECT_EQ(resp.body["pagination"]["itemsPerPage"].asInt(), 100);
}

// =============================================================================
// Search and statistics
// =============================================================================

TEST_F(ProductApiTest, SearchRequiresQuery) {
  auto resp = api_->SearchProducts(Request("GET", "/api/products/search"));
  ExpectError(resp, 400, "bad_request");
  EXPECT_EQ(resp.body["message"].asString(), "Search query parameter \"q\" is required");

  ExpectError(api_->SearchProducts(Request("GET", "/api/products/search", {{"q", "  "}})),
              400, "bad_request");
}

TEST_F(ProductApiTest, SearchFindsByNameAndDescription) {
  auto resp = api_->SearchProducts(Request("GET", "/api/products/search", {{"q", "ergonomic"}}));
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["query"].asString(), "ergonomic");
  EXPECT_EQ(resp.body["resultsCount"].asInt(), 1);
  EXPECT_EQ(resp.body["data"][0]["name"].asString(), "Wireless Mouse");
}

TEST_F(ProductApiTest, StatsOverall) {
  auto resp = api_->ProductStats(Request("GET", "/api/products/stats"));
  ASSERT_EQ(resp.status, 200);
  EXPECT_TRUE(resp.body["filter"].isNull());
  const auto& overall = resp.body["statistics"]["overall"];
  EXPECT_EQ(overall["totalProducts"].asInt(), 3);
  EXPECT_EQ(overall["inStockCount"].asInt(), 2);
  EXPECT_EQ(overall["outOfStockCount"].asInt(), 1);
  EXPECT_DOUBLE_EQ(overall["minPrice"].asDouble(), 24.50);
  EXPECT_DOUBLE_EQ(overall["maxPrice"].asDouble(), 1299.99);
  EXPECT_TRUE(resp.body["statistics"]["byCategory"].isMember("Home Goods"));
}

TEST_F(ProductApiTest, StatsForEmptyCategory) {
  auto resp = api_->ProductStats(
      Request("GET", "/api/products/stats", {{"category", "Garden"}}));
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["filter"]["category"].asString(), "Garden");
  EXPECT_EQ(resp.body["statistics"]["overall"]["totalProducts"].asInt(), 0);
  EXPECT_DOUBLE_EQ(resp.body["statistics"]["overall"]["averagePrice"].asDouble(), 0.0);
}

// =============================================================================
// Single product
// =============================================================================

TEST_F(ProductApiTest, GetExisting) {
  auto resp = api_->GetProduct(Request("GET", "/api/products/2"), "2");
  ASSERT_EQ(resp.status, 200);
  EXPECT_TRUE(resp.body["success"].asBool());
  EXPECT_EQ(resp.body["data"]["name"].asString(), "Wireless Mouse");
  EXPECT_TRUE(resp.body["data"]["inStock"].asBool());
}

TEST_F(ProductApiTest, GetMissingMentionsId) {
  auto resp = api_->GetProduct(Request("GET", "/api/products/999"), "999");
  ExpectError(resp, 404, "not_found");
  EXPECT_NE(resp.body["message"].asString().find("999"), std::string::npos);
}

TEST_F(ProductApiTest, MalformedIdIsBadRequest) {
  ExpectError(api_->GetProduct(Request("GET", "/api/products/abc"), "abc"), 400, "bad_request");
  ExpectError(api_->GetProduct(Request("GET", "/api/products/12abc"), "12abc"), 400,
              "bad_request");
  ExpectError(api_->DeleteProduct(Request("DELETE", "/api/products/x"), "x"), 400,
              "bad_request");
}

// =============================================================================
// Create / update / delete
// =============================================================================

TEST_F(ProductApiTest, CreateAssignsNextId) {
  auto resp = api_->CreateProduct(WithBody(Request("POST", "/api/products"),
                                           NewProduct("Keyboard")));
  ASSERT_EQ(resp.status, 201);
  EXPECT_EQ(resp.body["message"].asString(), "Product created successfully");
  EXPECT_EQ(resp.body["data"]["id"].asInt(), 4);
  EXPECT_EQ(store_->Size(), 4u);
}

TEST_F(ProductApiTest, CreateDuplicateNameConflicts) {
  auto resp = api_->CreateProduct(WithBody(Request("POST", "/api/products"),
                                           NewProduct("  laptop pro ")));
  ExpectError(resp, 409, "conflict");
  EXPECT_EQ(store_->Size(), 3u);
}

TEST_F(ProductApiTest, CreateInvalidListsErrors) {
  auto body = NewProduct("Keyboard");
  body["price"] = -1;
  body.removeMember("category");
  auto resp = api_->CreateProduct(WithBody(Request("POST", "/api/products"), body));
  ExpectError(resp, 422, "validation_failed");
  EXPECT_EQ(resp.body["message"].asString(), "Validation failed");
  ASSERT_TRUE(resp.body["errors"].isArray());
  EXPECT_EQ(resp.body["errors"].size(), 2u);
}

TEST_F(ProductApiTest, CreateOutOfRangeStockFlagIsValidationError) {
  auto body = NewProduct("Keyboard");
  body["inStock"] = Json::UInt64(std::numeric_limits<uint64_t>::max());
  body["price"] = 0;
  auto resp = api_->CreateProduct(WithBody(Request("POST", "/api/products"), body));
  ExpectError(resp, 422, "validation_failed");
  EXPECT_EQ(resp.body["errors"].size(), 2u);
  EXPECT_EQ(store_->Size(), 3u);
}

TEST_F(ProductApiTest, CreateWithoutBody) {
  ExpectError(api_->CreateProduct(Request("POST", "/api/products")), 422, "validation_failed");
}

TEST_F(ProductApiTest, UpdatePartial) {
  Json::Value body;
  body["price"] = 19.99;
  auto resp = api_->UpdateProduct(WithBody(Request("PUT", "/api/products/2"), body), "2");
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["message"].asString(), "Product updated successfully");
  EXPECT_DOUBLE_EQ(resp.body["data"]["price"].asDouble(), 19.99);
  EXPECT_EQ(resp.body["data"]["name"].asString(), "Wireless Mouse");
}

TEST_F(ProductApiTest, UpdateWithoutBodyIsNoOp) {
  auto resp = api_->UpdateProduct(Request("PUT", "/api/products/1"), "1");
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["data"]["name"].asString(), "Laptop Pro");
  EXPECT_DOUBLE_EQ(resp.body["data"]["price"].asDouble(), 1299.99);
}

TEST_F(ProductApiTest, UpdateOutOfRangeStockFlagIsValidationError) {
  Json::Value body;
  body["inStock"] = 1e19;
  ExpectError(api_->UpdateProduct(WithBody(Request("PUT", "/api/products/1"), body), "1"),
              422, "validation_failed");
}

TEST_F(ProductApiTest, UpdateToOtherNameConflicts) {
  Json::Value body;
  body["name"] = "Coffee Maker";
  ExpectError(api_->UpdateProduct(WithBody(Request("PUT", "/api/products/1"), body), "1"),
              409, "conflict");
}

TEST_F(ProductApiTest, UpdateMissing) {
  Json::Value body;
  body["price"] = 5;
  ExpectError(api_->UpdateProduct(WithBody(Request("PUT", "/api/products/42"), body), "42"),
              404, "not_found");
}

TEST_F(ProductApiTest, DeleteTwice) {
  auto first = api_->DeleteProduct(Request("DELETE", "/api/products/3"), "3");
  ASSERT_EQ(first.status, 200);
  EXPECT_EQ(first.body["message"].asString(), "Product deleted successfully");
  EXPECT_EQ(first.body["data"]["name"].asString(), "Coffee Maker");

  ExpectError(api_->DeleteProduct(Request("DELETE", "/api/products/3"), "3"), 404,
              "not_found");
  ExpectError(api_->GetProduct(Request("GET", "/api/products/3"), "3"), 404, "not_found");
}

}  // namespace
}  // namespace catalog::server
