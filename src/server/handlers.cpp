#include <catalog/server/handlers.hpp>

#include <catalog/internal.hpp>

#include <drogon/drogon.h>
#include <json/json.h>

#include <functional>
#include <sstream>
#include <string>

namespace catalog::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

// Time the request, log one line for it and hand the response to Drogon.
template <typename Fn>
void Respond(const std::shared_ptr<PrometheusMetrics>& metrics,
             const drogon::HttpRequestPtr& req,
             const std::string& route,
             const Callback& callback,
             Fn&& fn) {
  RequestTimer timer(metrics, std::string(req->getMethodString()), route);
  ApiResponse resp = fn();
  timer.SetStatusCode(resp.status);

  LOG_INFO << req->getMethodString() << " " << req->path() << " " << resp.status
           << " " << timer.ElapsedMs() << "ms";

  callback(ToHttpResponse(resp));
}

std::shared_ptr<const Json::Value> ParseBody(const drogon::HttpRequestPtr& req) {
  if (auto json = req->getJsonObject()) {
    return json;
  }

  // Content-Type may be missing or wrong; try the raw body before giving up.
  std::string body_str(req->body());
  if (internal::Trim(body_str).empty()) return nullptr;

  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream(body_str);
  if (!Json::parseFromStream(builder, stream, &parsed, &errors)) {
    LOG_DEBUG << "Ignoring unparseable request body: " << errors;
    return nullptr;
  }
  return std::make_shared<const Json::Value>(std::move(parsed));
}

}  // namespace

ApiRequest ToApiRequest(const drogon::HttpRequestPtr& req, const AuthConfig& auth) {
  ApiRequest out;
  out.method = req->getMethodString();
  out.path = req->path();

  // Drogon stores header names lowercased.
  const auto& headers = req->headers();
  auto it = headers.find(internal::ToLower(auth.header));
  if (it != headers.end()) {
    out.api_key = it->second;
  }

  for (const auto& [name, value] : req->getParameters()) {
    out.params[name] = value;
  }

  out.body = ParseBody(req);
  return out;
}

drogon::HttpResponsePtr ToHttpResponse(const ApiResponse& resp) {
  drogon::HttpResponsePtr http;
  if (resp.is_text) {
    http = drogon::HttpResponse::newHttpResponse();
    http->setBody(resp.text);
    http->setContentTypeCode(drogon::CT_TEXT_PLAIN);
  } else {
    http = drogon::HttpResponse::newHttpJsonResponse(resp.body);
  }
  http->setStatusCode(static_cast<drogon::HttpStatusCode>(resp.status));
  return http;
}

// --- Handler Registration ---

void RegisterHandlers(ProductApi* api,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics) {
  auto& app = drogon::app();
  const AuthConfig auth = config.auth;

  // ==========================================================================
  // Public Endpoints
  // ==========================================================================

  // GET / - Liveness text
  app.registerHandler(
      "/",
      [api, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/", callback, [&] { return api->Root(); });
      },
      {drogon::Get});

  // GET /health - Status, timestamp and environment
  app.registerHandler(
      "/health",
      [api, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/health", callback, [&] { return api->Health(); });
      },
      {drogon::Get});

  // GET /api - Endpoint catalog
  app.registerHandler(
      "/api",
      [api, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/api", callback, [&] { return api->Describe(); });
      },
      {drogon::Get});

  // ==========================================================================
  // Product Endpoints
  //
  // The fixed paths are registered before /api/products/{id} so that
  // "search" and "stats" are never taken for an id.
  // ==========================================================================

  // GET /api/products/search - Search by name/description, q required
  app.registerHandler(
      "/api/products/search",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/api/products/search", callback, [&] {
          return api->SearchProducts(ToApiRequest(req, auth));
        });
      },
      {drogon::Get});

  // GET /api/products/stats - Aggregate statistics
  app.registerHandler(
      "/api/products/stats",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/api/products/stats", callback, [&] {
          return api->ProductStats(ToApiRequest(req, auth));
        });
      },
      {drogon::Get});

  // GET /api/products - Filtered, sorted, paginated listing
  app.registerHandler(
      "/api/products",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/api/products", callback, [&] {
          return api->ListProducts(ToApiRequest(req, auth));
        });
      },
      {drogon::Get});

  // POST /api/products - Create
  app.registerHandler(
      "/api/products",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "/api/products", callback, [&] {
          return api->CreateProduct(ToApiRequest(req, auth));
        });
      },
      {drogon::Post});

  // GET /api/products/{id} - Single product
  app.registerHandler(
      "/api/products/{id}",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback,
                           const std::string& id) {
        Respond(metrics, req, "/api/products/{id}", callback, [&] {
          return api->GetProduct(ToApiRequest(req, auth), id);
        });
      },
      {drogon::Get});

  // PUT /api/products/{id} - Partial update
  app.registerHandler(
      "/api/products/{id}",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback,
                           const std::string& id) {
        Respond(metrics, req, "/api/products/{id}", callback, [&] {
          return api->UpdateProduct(ToApiRequest(req, auth), id);
        });
      },
      {drogon::Put});

  // DELETE /api/products/{id} - Remove
  app.registerHandler(
      "/api/products/{id}",
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback,
                           const std::string& id) {
        Respond(metrics, req, "/api/products/{id}", callback, [&] {
          return api->DeleteProduct(ToApiRequest(req, auth), id);
        });
      },
      {drogon::Delete});

  // ==========================================================================
  // Diagnostics
  // ==========================================================================

  if (config.server.environment == "development") {
    // GET /test-error - Exercises the internal-error path
    app.registerHandler(
        "/test-error",
        [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback) {
          Respond(metrics, req, "/test-error", callback, [&] {
            return api->TestError(ToApiRequest(req, auth));
          });
        },
        {drogon::Get});
  }

  // ==========================================================================
  // Boundaries
  // ==========================================================================

  // Anything unmatched
  app.setDefaultHandler(
      [api, metrics, auth](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Respond(metrics, req, "(unmatched)", callback, [&] {
          return api->RouteNotFound(ToApiRequest(req, auth));
        });
      });

  // Last resort for exceptions thrown outside the pipeline guard
  app.setExceptionHandler(
      [](const std::exception& e, const drogon::HttpRequestPtr& req,
         Callback&& callback) {
        LOG_ERROR << "Unhandled exception on " << req->getMethodString() << " "
                  << req->path() << ": " << e.what();
        callback(ToHttpResponse(ErrorResponse(Status::Internal("Internal server error"))));
      });
}

}  // namespace catalog::server
