#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace catalog::server {

/**
 * Server configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 3000;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
  std::string environment = "development";
};

/**
 * API-key authentication.
 */
struct AuthConfig {
  std::string header = "x-api-key";
  std::vector<std::string> api_keys = {"your-secret-api-key-123",
                                       "another-valid-key-456"};
};

/**
 * Pagination limits for list and search endpoints.
 */
struct PaginationConfig {
  int64_t default_limit = 10;
  int64_t max_limit = 100;
};

/**
 * Catalog contents at startup.
 */
struct CatalogConfig {
  bool seed_sample_data = true;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  AuthConfig auth;
  PaginationConfig pagination;
  CatalogConfig catalog;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * Precedence: defaults < config file < environment < flags.
   * @param argc Argument count
   * @param argv Argument values
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Apply CATALOG_ENV and CATALOG_API_KEYS if they are set.
   */
  void ApplyEnvironment();

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

/** Split "a, b,c" into {"a", "b", "c"}; empty items are dropped. */
std::vector<std::string> SplitList(const std::string& value);

}  // namespace catalog::server
