#include <catalog/server/server.hpp>
#include <catalog/server/handlers.hpp>
#include <catalog/version.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <thread>

namespace catalog::server {

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  config_.Validate();

  // Metrics are wired into the store so mutations are counted.
  StoreOptions opt;
  opt.seed_sample_data = config_.catalog.seed_sample_data;
  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
    opt.metrics = metrics_;
  }

  store_ = std::make_unique<ProductStore>(opt);
  api_ = std::make_unique<ProductApi>(store_.get(), config_);
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::SetupLogging() {
  trantor::Logger::setLogLevel(ToLogLevel(config_.server.log_level));
}

void Server::SetupRoutes() {
  RegisterHandlers(api_.get(), config_, metrics_);

  if (config_.metrics.enabled && metrics_) {
    RegisterMetricsHandler(metrics_, store_.get(), config_.metrics.path);
  }
}

void Server::SetupShutdown() {
  auto& app = drogon::app();
  app.setTermSignalHandler([]() {
    LOG_INFO << "SIGTERM received. Shutting down gracefully...";
    drogon::app().quit();
  });
  app.setIntSignalHandler([]() {
    LOG_INFO << "SIGINT received. Shutting down gracefully...";
    drogon::app().quit();
  });
}

void Server::LogBanner(uint32_t threads) const {
  LOG_INFO << "Catalog server " << Version() << " running on http://"
           << config_.server.host << ":" << config_.server.port << " with "
           << threads << " threads";
  LOG_INFO << "Environment: " << config_.server.environment;
  LOG_INFO << "Products loaded: " << store_->Size();
  LOG_INFO << "Endpoints:";
  LOG_INFO << "  GET    /api                   (documentation)";
  LOG_INFO << "  GET    /api/products          (requires API key)";
  LOG_INFO << "  GET    /api/products/search   (requires API key, ?q=)";
  LOG_INFO << "  GET    /api/products/stats    (requires API key)";
  LOG_INFO << "  GET    /api/products/:id      (requires API key)";
  LOG_INFO << "  POST   /api/products          (requires API key + validation)";
  LOG_INFO << "  PUT    /api/products/:id      (requires API key + validation)";
  LOG_INFO << "  DELETE /api/products/:id      (requires API key)";
  if (config_.metrics.enabled) {
    LOG_INFO << "  GET    " << config_.metrics.path;
  }
  LOG_INFO << "API keys configured: " << config_.auth.api_keys.size()
           << " (header " << config_.auth.header << ")";
}

void Server::Run() {
  running_ = true;

  SetupLogging();

  auto& app = drogon::app();
  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  // Configure timeouts and limits
  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);

  // Disable session support (not needed for API server)
  app.disableSession();

  SetupRoutes();
  SetupShutdown();
  LogBanner(threads);

  // Run Drogon (blocking)
  app.run();

  running_ = false;
  LOG_INFO << "Process terminated";
}

void Server::Shutdown() {
  if (running_) {
    drogon::app().quit();
  }
}

}  // namespace catalog::server
