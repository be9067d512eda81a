#include "signer.hpp"
#include "canonical.hpp"
#include "url.hpp"

#include <utility>

namespace signing {

UrlSigner::UrlSigner(std::shared_ptr<const SecretProvider> secrets, BinderList binders)
  : secrets_(std::move(secrets)), binders_(std::move(binders)) {}

void UrlSigner::add_binder(std::shared_ptr<const AttributeBinder> binder) {
  if (binder) binders_.push_back(std::move(binder));
}

std::optional<std::string> UrlSigner::token_for(std::string_view path,
                                                const util::QueryParams& params,
                                                const ContextProvider& ctx) const {
  const std::string secret = secrets_ ? secrets_->shared_secret() : std::string();
  if (secret.empty()) return std::nullopt;

  util::QueryParams digest_params = params;
  util::query_remove(&digest_params, kTokenParam);

  Options options;
  if (auto o = util::query_get(digest_params, kOptionsParam)) {
    options = Options::parse(*o);
  }

  util::QueryParams bound;
  for (const auto& binder : binders_) {
    for (auto& kv : binder->bind(ctx, options)) {
      util::query_set(&bound, kv.first, std::move(kv.second));
    }
  }
  // A visible parameter may not share a name with a bound attribute: under
  // sorted canonicalization the two values could trade places unnoticed.
  for (auto& kv : bound) {
    if (util::query_get(digest_params, kv.first)) return std::nullopt;
    digest_params.push_back(std::move(kv));
  }

  auto mac = util::hmac_sha256(secret, canonicalize(path, digest_params));
  if (!mac) return std::nullopt;
  return util::hex_lower(*mac);
}

std::optional<SignedUrl> UrlSigner::sign(const SigningRequest& req, const ContextProvider& ctx) const {
  const util::ParsedUrl base = util::parse_url(req.base_url);

  util::QueryParams params = util::parse_query(base.query);
  for (const auto& kv : req.query_params) {
    util::query_set(&params, kv.first, kv.second);
  }
  util::query_remove(&params, kTokenParam);
  if (!req.options.empty()) {
    util::query_set(&params, kOptionsParam, req.options.encode());
  }

  auto token = token_for(base.path, params, ctx);
  if (!token) return std::nullopt;

  params.emplace_back(std::string(kTokenParam), *token);

  SignedUrl out;
  out.url = util::with_query(base.base, params);
  out.token = std::move(*token);
  return out;
}

std::optional<std::string> UrlSigner::sign_url(std::string_view url,
                                               const util::QueryParams& extra,
                                               const ContextProvider& ctx) const {
  SigningRequest req;
  req.base_url = std::string(url);
  req.query_params = extra;
  auto signed_url = sign(req, ctx);
  if (!signed_url) return std::nullopt;
  return std::move(signed_url->url);
}

bool UrlSigner::verify(std::string_view url, const ContextProvider& ctx) const {
  const util::ParsedUrl pu = util::parse_url(url);
  if (!pu.has_query) return false;

  const util::QueryParams params = util::parse_query(pu.query);
  auto presented = util::query_get(params, kTokenParam);
  if (!presented) return false;

  auto expected = token_for(pu.path, params, ctx);
  if (!expected) return false;
  return util::constant_time_equal(*expected, *presented);
}

} // namespace signing
