#pragma once

#include <string>
#include <string_view>

namespace signing {

// Source of the installation-wide signing key. Read on every sign and
// verify call; rotating the underlying value invalidates issued tokens.
class SecretProvider {
public:
  virtual ~SecretProvider() = default;
  virtual std::string shared_secret() const = 0;
};

// Signing secret derived from an installation key: percent_encode(base64(key)).
// Empty key -> empty secret.
std::string derive_secret(std::string_view installation_key);

class StaticSecretProvider final : public SecretProvider {
public:
  explicit StaticSecretProvider(std::string secret);

  std::string shared_secret() const override;

private:
  std::string secret_;
};

// Reads the installation key from an environment variable on each call.
class EnvSecretProvider final : public SecretProvider {
public:
  explicit EnvSecretProvider(std::string var_name);

  std::string shared_secret() const override;

private:
  std::string var_name_;
};

} // namespace signing
