#pragma once

#include <catalog/status.hpp>

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace catalog::server {

/**
 * Static API-key check.
 *
 * A missing key is Unauthorized; a key that is present but not on the
 * allow-list is Forbidden.
 */
class ApiKeyGate {
 public:
  explicit ApiKeyGate(const std::vector<std::string>& api_keys,
                      std::string header = "x-api-key");

  Status Check(const std::optional<std::string>& api_key) const;

  const std::string& header() const { return header_; }
  size_t size() const { return keys_.size(); }

 private:
  std::unordered_set<std::string> keys_;
  std::string header_;
};

}  // namespace catalog::server
