#include "secret.hpp"
#include "util.hpp"

#include <cstdlib>
#include <utility>

namespace signing {

std::string derive_secret(std::string_view installation_key) {
  if (installation_key.empty()) return {};
  return util::percent_encode(util::base64_encode(installation_key));
}

StaticSecretProvider::StaticSecretProvider(std::string secret) : secret_(std::move(secret)) {}

std::string StaticSecretProvider::shared_secret() const {
  return secret_;
}

EnvSecretProvider::EnvSecretProvider(std::string var_name) : var_name_(std::move(var_name)) {}

std::string EnvSecretProvider::shared_secret() const {
  const char* v = std::getenv(var_name_.c_str());
  if (!v) return {};
  return derive_secret(v);
}

} // namespace signing
