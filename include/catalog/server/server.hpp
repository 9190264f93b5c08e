#pragma once

#include <catalog/server/api.hpp>
#include <catalog/server/config.hpp>
#include <catalog/server/metrics.hpp>
#include <catalog/store.hpp>

#include <memory>

namespace catalog::server {

/**
 * Catalog HTTP Server.
 *
 * Owns the product store, the request pipeline and the metrics sink, and
 * serves them over Drogon.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async).
   */
  void Shutdown();

  ProductStore* GetStore() { return store_.get(); }
  const ProductStore* GetStore() const { return store_.get(); }

 private:
  void SetupLogging();
  void SetupRoutes();
  void SetupShutdown();
  void LogBanner(uint32_t threads) const;

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::unique_ptr<ProductStore> store_;
  std::unique_ptr<ProductApi> api_;
  bool running_ = false;
};

}  // namespace catalog::server
