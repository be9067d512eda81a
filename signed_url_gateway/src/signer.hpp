#pragma once

#include "binders.hpp"
#include "context.hpp"
#include "options.hpp"
#include "secret.hpp"
#include "util.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace signing {

struct SigningRequest {
  std::string base_url; // query, if any, is merged under query_params
  util::QueryParams query_params;
  Options options;
};

struct SignedUrl {
  std::string url; // base_url?visible-params&token=...
  std::string token;
};

// Signs and verifies URLs with HMAC-SHA256 over the canonical string.
//
// The "o" parameter names the contextual bindings (client address, user
// agent, custom flags). Binders turn those into hidden pairs that take part
// in the digest but never appear in the URL, so a URL signed with o=ip only
// verifies for the client address it was issued to.
//
// All operations fail closed when the secret provider returns an empty secret.
class UrlSigner {
public:
  explicit UrlSigner(std::shared_ptr<const SecretProvider> secrets,
                     BinderList binders = default_binders());

  // Appended binders run after the ones already registered.
  void add_binder(std::shared_ptr<const AttributeBinder> binder);

  // Token for path + params; any "token" entry in params is ignored.
  // std::nullopt when a visible parameter has the name of a bound attribute.
  std::optional<std::string> token_for(std::string_view path,
                                       const util::QueryParams& params,
                                       const ContextProvider& ctx) const;

  std::optional<SignedUrl> sign(const SigningRequest& req, const ContextProvider& ctx) const;

  // Sets extra on url (replacing same-named parameters), drops any existing
  // token and returns the URL with a fresh token appended.
  std::optional<std::string> sign_url(std::string_view url,
                                      const util::QueryParams& extra,
                                      const ContextProvider& ctx) const;

  // True only when url carries a token equal to the one recomputed for it.
  bool verify(std::string_view url, const ContextProvider& ctx) const;

private:
  std::shared_ptr<const SecretProvider> secrets_;
  BinderList binders_;
};

} // namespace signing
