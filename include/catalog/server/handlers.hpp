#pragma once

#include <catalog/server/api.hpp>
#include <catalog/server/config.hpp>
#include <catalog/server/metrics.hpp>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

#include <memory>

namespace catalog::server {

/**
 * Build the transport-independent request: API key header (if present),
 * query parameters and the JSON body (if it parses).
 */
ApiRequest ToApiRequest(const drogon::HttpRequestPtr& req, const AuthConfig& auth);

/**
 * Convert a pipeline response into a Drogon response.
 */
drogon::HttpResponsePtr ToHttpResponse(const ApiResponse& resp);

/**
 * Register all catalog routes, the unmatched-route handler and the
 * exception boundary with the Drogon app. metrics may be null.
 * Uses lambda handlers to capture the api pointer.
 */
void RegisterHandlers(ProductApi* api,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics);

}  // namespace catalog::server
