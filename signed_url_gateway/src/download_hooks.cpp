#include "download_hooks.hpp"
#include "canonical.hpp"
#include "descriptor.hpp"
#include "url.hpp"

#include <charconv>
#include <utility>

namespace downloads {

static bool parse_u64(std::string_view s, std::uint64_t* out) {
  if (s.empty()) return false;
  std::uint64_t val = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), val);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return false;
  *out = val;
  return true;
}

// The storefront ships "expire" URL-encoded base64; ttl carries the raw value.
static std::optional<std::string> decode_expire(const std::string& expire) {
  auto unescaped = util::percent_decode(expire);
  return util::base64_decode(unescaped ? *unescaped : expire);
}

DownloadHooks::DownloadHooks(const signing::UrlSigner* signer,
                             const storage::PaymentStore* payments,
                             std::string home_url)
  : signer_(signer), payments_(payments), home_url_(std::move(home_url)) {}

std::optional<DownloadArgs> DownloadHooks::signed_file_url_args(const DownloadArgs& args,
                                                                const signing::Options& options,
                                                                const signing::ContextProvider& ctx,
                                                                std::string* err) const {
  auto purchase_key = util::query_get(args, "download_key");
  if (!purchase_key || purchase_key->empty()) return std::nullopt;

  auto payment_id = payments_->find_payment_id(*purchase_key, err);
  if (!payment_id) return std::nullopt;

  signing::DownloadDescriptor d;
  d.payment_id = *payment_id;
  auto download = util::query_get(args, "download");
  if (!download || !parse_u64(*download, &d.download_id)) return std::nullopt;
  d.file_key = util::query_get(args, "file").value_or("");
  if (!signing::valid_file_key(d.file_key)) return std::nullopt;

  signing::SigningRequest req;
  req.base_url = home_url_;
  req.options = options;
  req.query_params.emplace_back(std::string(signing::kDescriptorParam), d.str());
  if (auto expire = util::query_get(args, "expire")) {
    if (auto ttl = decode_expire(*expire)) {
      req.query_params.emplace_back("ttl", std::move(*ttl));
    }
  }
  for (const auto& f : filters_) {
    f->filter(&req.query_params, d.payment_id, args);
  }
  util::query_remove(&req.query_params, signing::kTokenParam);
  util::query_remove(&req.query_params, signing::kOptionsParam);

  auto signed_url = signer_->sign(req, ctx);
  if (!signed_url) return std::nullopt;

  DownloadArgs out = std::move(req.query_params);
  if (!options.empty()) {
    out.emplace_back(std::string(signing::kOptionsParam), options.encode());
  }
  out.emplace_back(std::string(signing::kTokenParam), std::move(signed_url->token));
  return out;
}

DownloadArgs DownloadHooks::file_url_args(const DownloadArgs& args,
                                          const signing::Options& options,
                                          const signing::ContextProvider& ctx,
                                          std::string* err) const {
  if (auto signed_args = signed_file_url_args(args, options, ctx, err)) {
    return std::move(*signed_args);
  }
  return args;
}

std::string DownloadHooks::file_url(const DownloadArgs& args,
                                    const signing::Options& options,
                                    const signing::ContextProvider& ctx,
                                    std::string* err) const {
  return url_for(file_url_args(args, options, ctx, err));
}

std::string DownloadHooks::url_for(const DownloadArgs& args) const {
  const util::ParsedUrl home = util::parse_url(home_url_);
  util::QueryParams params = util::parse_query(home.query);
  for (const auto& kv : args) {
    util::query_set(&params, kv.first, kv.second);
  }
  return util::with_query(home.base, params);
}

DispatchDecision DownloadHooks::process_download_args(const DownloadArgs& args,
                                                      std::string_view request_query,
                                                      const signing::ContextProvider& ctx,
                                                      std::string* err) const {
  DispatchDecision out;
  out.args = args;

  const util::QueryParams request_params = util::parse_query(request_query);
  if (!util::query_get(request_params, signing::kDescriptorParam) ||
      !util::query_get(request_params, "ttl") ||
      !util::query_get(request_params, signing::kTokenParam)) {
    return out;
  }

  // Rebuild the URL the token was issued for: home_url plus the request's query.
  const util::ParsedUrl home = util::parse_url(home_url_);
  util::QueryParams params = util::parse_query(home.query);
  for (const auto& kv : request_params) {
    util::query_set(&params, kv.first, kv.second);
  }
  out.checked_url = util::with_query(home.base, params);

  out.decision = Decision::Invalid;
  if (!signer_->verify(out.checked_url, ctx)) return out;

  // parse_query already decoded the value once.
  auto d = signing::parse_descriptor(util::query_get(params, signing::kDescriptorParam).value_or(""));
  if (!d) return out;

  auto payment = payments_->find_payment(d->payment_id, err);
  if (!payment) return out;

  util::query_set(&out.args, "download", std::to_string(d->download_id));
  util::query_set(&out.args, "email", payment->email);
  util::query_set(&out.args, "expire", util::query_get(params, "ttl").value_or(""));
  util::query_set(&out.args, "file_key", d->file_key);
  util::query_set(&out.args, "key", payment->purchase_key);
  out.decision = Decision::Valid;
  for (const auto& o : observers_) {
    o->on_valid_download(out.checked_url, out.args);
  }
  return out;
}

void DownloadHooks::add_url_args_filter(std::shared_ptr<const UrlArgsFilter> filter) {
  if (filter) filters_.push_back(std::move(filter));
}

void DownloadHooks::add_observer(std::shared_ptr<const DownloadObserver> observer) {
  if (observer) observers_.push_back(std::move(observer));
}

} // namespace downloads
