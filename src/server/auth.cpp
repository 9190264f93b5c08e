#include <catalog/server/auth.hpp>

#include <utility>

namespace catalog::server {

ApiKeyGate::ApiKeyGate(const std::vector<std::string>& api_keys, std::string header)
    : keys_(api_keys.begin(), api_keys.end()), header_(std::move(header)) {}

Status ApiKeyGate::Check(const std::optional<std::string>& api_key) const {
  if (!api_key) {
    return Status::Unauthorized("API key is missing. Provide it in the " + header_ +
                                " header");
  }
  if (keys_.count(*api_key) == 0) {
    return Status::Forbidden("Invalid API key");
  }
  return Status::OK();
}

}  // namespace catalog::server
