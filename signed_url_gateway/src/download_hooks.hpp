#pragma once

#include "context.hpp"
#include "options.hpp"
#include "payments.hpp"
#include "signer.hpp"
#include "util.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace downloads {

// Storefront download arguments, e.g. download_key/download/file/expire on
// the way out and download/email/expire/file_key/key on the way in.
using DownloadArgs = util::QueryParams;

enum class Decision {
  NotApplicable, // not a signed download request; args untouched
  Valid,         // token verified; args rewritten from the descriptor
  Invalid        // token or descriptor rejected; args untouched
};

struct DispatchDecision {
  Decision decision = Decision::NotApplicable;
  DownloadArgs args;
  std::string checked_url; // URL the token was checked against
};

// Adjusts the visible args of a link before it is signed, e.g. to add a
// campaign tag. Runs after eddfile/ttl are set; token and o are applied
// afterwards and cannot be overridden.
class UrlArgsFilter {
public:
  virtual ~UrlArgsFilter() = default;
  virtual void filter(DownloadArgs* signed_args,
                      std::uint64_t payment_id,
                      const DownloadArgs& source_args) const = 0;
};

// Notified once per request that passed the pre-dispatch check.
class DownloadObserver {
public:
  virtual ~DownloadObserver() = default;
  virtual void on_valid_download(std::string_view checked_url, const DownloadArgs& args) const = 0;
};

// The two storefront integration points: replacing verbose download links
// with compact signed ones, and validating those links before dispatch.
// Signed links always point at home_url; the request path a link arrives on
// plays no part in verification.
class DownloadHooks {
public:
  DownloadHooks(const signing::UrlSigner* signer,
                const storage::PaymentStore* payments,
                std::string home_url);

  // {eddfile, [ttl], [filtered args], [o], token} for args carrying
  // download_key, download, file and optionally a base64 "expire".
  // std::nullopt when the purchase key is missing or unknown, the ids are
  // malformed, the file key is not a valid descriptor file key, or nothing
  // can be signed.
  // Storage failures are reported through *err.
  std::optional<DownloadArgs> signed_file_url_args(const DownloadArgs& args,
                                                   const signing::Options& options,
                                                   const signing::ContextProvider& ctx,
                                                   std::string* err = nullptr) const;

  // Signed args, or args unchanged when signing is skipped.
  DownloadArgs file_url_args(const DownloadArgs& args,
                             const signing::Options& options,
                             const signing::ContextProvider& ctx,
                             std::string* err = nullptr) const;

  // home_url with file_url_args() as its query.
  std::string file_url(const DownloadArgs& args,
                       const signing::Options& options,
                       const signing::ContextProvider& ctx,
                       std::string* err = nullptr) const;

  // home_url with args merged into its query.
  std::string url_for(const DownloadArgs& args) const;

  // Pre-dispatch check of an incoming request's raw query string. Only
  // storage failures are reported through *err; every other rejection is a
  // plain Decision::Invalid.
  DispatchDecision process_download_args(const DownloadArgs& args,
                                         std::string_view request_query,
                                         const signing::ContextProvider& ctx,
                                         std::string* err = nullptr) const;

  // Filters run in registration order.
  void add_url_args_filter(std::shared_ptr<const UrlArgsFilter> filter);
  void add_observer(std::shared_ptr<const DownloadObserver> observer);

  const std::string& home_url() const { return home_url_; }

private:
  const signing::UrlSigner* signer_;
  const storage::PaymentStore* payments_;
  std::string home_url_;
  std::vector<std::shared_ptr<const UrlArgsFilter>> filters_;
  std::vector<std::shared_ptr<const DownloadObserver>> observers_;
};

} // namespace downloads
