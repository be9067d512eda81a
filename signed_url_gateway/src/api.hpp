#pragma once

#include "download_hooks.hpp"
#include "metrics.hpp"
#include "options.hpp"

#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace gateway {

namespace http = boost::beast::http;

struct Config {
  signing::Options default_options;         // bindings applied to every issued URL
  bool trust_forwarded_for = false;         // client address from X-Forwarded-For
  std::string url_endpoint = "/download-url";
};

using Request = http::request<http::vector_body<char>>;
using Response = http::response<http::vector_body<char>>;

// GET <url_endpoint>?download_key=..&download=..&file=..[&expire=..][&o=..]
//   -> signed download URL (text/plain), 404 when nothing could be signed.
// GET <any path>?eddfile=..&ttl=..&token=..
//   -> rewritten dispatch args (form-encoded), 403 on an invalid request.
class Api {
public:
  Api(const downloads::DownloadHooks* hooks, Config cfg, server::Metrics* metrics = nullptr);

  Response handle(const Request& req, std::string_view remote_address);

private:
  const downloads::DownloadHooks* hooks_;
  Config cfg_;
  server::Metrics* metrics_;
};

} // namespace gateway
