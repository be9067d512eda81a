#include "api.hpp"
#include "canonical.hpp"
#include "context.hpp"
#include "url.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace gateway {
namespace http = boost::beast::http;

static std::string_view header_value(const Request& req, std::string_view name) {
  auto it = req.find(boost::beast::string_view(name.data(), name.size()));
  if (it == req.end()) return {};
  return std::string_view(it->value().data(), it->value().size());
}

static std::string first_forwarded_for(std::string_view xff) {
  size_t comma = xff.find(',');
  std::string_view first = (comma == std::string_view::npos) ? xff : xff.substr(0, comma);
  while (!first.empty() && std::isspace(static_cast<unsigned char>(first.front()))) first.remove_prefix(1);
  while (!first.empty() && std::isspace(static_cast<unsigned char>(first.back()))) first.remove_suffix(1);
  return std::string(first);
}

static Response make_text_response(http::status st,
                                   std::string_view content_type,
                                   std::string_view body,
                                   bool keep_alive,
                                   unsigned version) {
  Response res{st, version};
  res.set(http::field::server, "signed_url_gateway");
  res.set(http::field::content_type, std::string(content_type));
  res.set(http::field::cache_control, "no-store");
  res.keep_alive(keep_alive);
  res.body().assign(body.begin(), body.end());
  res.content_length(res.body().size());
  return res;
}

static Response make_error(http::status st, std::string_view message, bool keep_alive, unsigned version) {
  std::string body(message);
  body.push_back('\n');
  return make_text_response(st, "text/plain", body, keep_alive, version);
}

Api::Api(const downloads::DownloadHooks* hooks, Config cfg, server::Metrics* metrics)
  : hooks_(hooks), cfg_(std::move(cfg)), metrics_(metrics) {}

Response Api::handle(const Request& req, std::string_view remote_address) {
  const bool keep_alive = req.keep_alive();
  const unsigned version = req.version();

  if (req.method() != http::verb::get) {
    Response res = make_error(http::status::method_not_allowed, "Unsupported method", keep_alive, version);
    res.set(http::field::allow, "GET");
    return res;
  }

  std::string client_address(remote_address);
  if (cfg_.trust_forwarded_for) {
    std::string forwarded = first_forwarded_for(header_value(req, "X-Forwarded-For"));
    if (!forwarded.empty()) client_address = std::move(forwarded);
  }
  const signing::RequestContext ctx(std::move(client_address),
                                    std::string(header_value(req, "User-Agent")));

  const util::ParsedUrl target =
    util::parse_url(std::string_view(req.target().data(), req.target().size()));

  if (target.path == cfg_.url_endpoint) {
    util::QueryParams args = util::parse_query(target.query);
    signing::Options options = cfg_.default_options;
    if (auto o = util::query_get(args, signing::kOptionsParam)) {
      for (const auto& name : signing::Options::parse(*o).names()) options.add(name);
    }

    std::string err;
    auto signed_args = hooks_->signed_file_url_args(args, options, ctx, &err);
    if (!err.empty()) {
      if (metrics_) metrics_->ObserveSign(server::Metrics::SignOutcome::Error);
      std::cerr << "payment lookup failed: " << err << "\n";
      return make_error(http::status::internal_server_error, "Internal error", keep_alive, version);
    }
    if (!signed_args) {
      if (metrics_) metrics_->ObserveSign(server::Metrics::SignOutcome::Skipped);
      return make_error(http::status::not_found, "No download available for this purchase", keep_alive, version);
    }
    if (metrics_) metrics_->ObserveSign(server::Metrics::SignOutcome::Issued);
    return make_text_response(http::status::ok, "text/plain", hooks_->url_for(*signed_args) + "\n",
                              keep_alive, version);
  }

  std::string err;
  downloads::DispatchDecision dd = hooks_->process_download_args({}, target.query, ctx, &err);
  switch (dd.decision) {
    case downloads::Decision::NotApplicable:
      if (metrics_) metrics_->ObserveVerify(server::Metrics::VerifyOutcome::NotApplicable);
      return make_error(http::status::bad_request, "Not a signed download request", keep_alive, version);

    case downloads::Decision::Invalid:
      if (!err.empty()) {
        if (metrics_) metrics_->ObserveVerify(server::Metrics::VerifyOutcome::Error);
        std::cerr << "payment lookup failed: " << err << "\n";
        return make_error(http::status::internal_server_error, "Internal error", keep_alive, version);
      }
      if (metrics_) metrics_->ObserveVerify(server::Metrics::VerifyOutcome::Invalid);
      std::cerr << "invalid download request from " << ctx.client_address()
                << ": " << dd.checked_url << "\n";
      return make_error(http::status::forbidden, "Invalid download request", keep_alive, version);

    case downloads::Decision::Valid:
      break;
  }

  if (metrics_) metrics_->ObserveVerify(server::Metrics::VerifyOutcome::Valid);
  return make_text_response(http::status::ok, "application/x-www-form-urlencoded",
                            util::encode_query(dd.args), keep_alive, version);
}

} // namespace gateway
