#include "../src/api.hpp"
#include "../src/http_server.hpp"
#include "../src/payments.hpp"
#include "../src/url.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace http = boost::beast::http;

static std::string make_tmp_dir() {
  std::string tmpl = "/tmp/surlgw_test_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  char* dir = mkdtemp(buf.data());
  if (!dir) return "/tmp/surlgw_test_fallback";
  return std::string(dir);
}

// Every lookup fails as if the database were unreachable.
class UnreachablePaymentStore final : public storage::PaymentStore {
public:
  std::optional<std::uint64_t> find_payment_id(std::string_view, std::string* err) const override {
    if (err) *err = "IO error: unreachable";
    return std::nullopt;
  }
  std::optional<storage::PaymentRecord> find_payment(std::uint64_t, std::string* err) const override {
    if (err) *err = "IO error: unreachable";
    return std::nullopt;
  }
};

static gateway::Request get(const std::string& target) {
  gateway::Request req{http::verb::get, target, 11};
  req.set(http::field::host, "shop.example.com");
  req.set(http::field::user_agent, "Mozilla/5.0");
  return req;
}

static std::string body_of(const gateway::Response& res) {
  return std::string(res.body().begin(), res.body().end());
}

// "http://shop.example.com/download?...\n" -> "/download?..."
static std::string target_of(std::string url) {
  while (!url.empty() && url.back() == '\n') url.pop_back();
  auto pu = util::parse_url(url);
  return pu.path + "?" + pu.query;
}

int main() {
  std::string dir = make_tmp_dir();
  std::filesystem::create_directories(dir);

  rocksdb::Options opts;
  opts.create_if_missing = true;
  rocksdb::DB* db = nullptr;
  auto st = rocksdb::DB::Open(opts, dir, &db);
  assert(st.ok());

  {
    server::Metrics metrics;
    storage::RocksPaymentStore store(db, rocksdb::WriteOptions{}, &metrics);
    std::string err;
    assert(store.put_payment({42, "buyer@example.com", "abc123"}, &err));

    signing::UrlSigner signer(std::make_shared<signing::StaticSecretProvider>(signing::derive_secret("installation-key")));
    downloads::DownloadHooks hooks(&signer, &store, "http://shop.example.com/download");
    gateway::Api api(&hooks, gateway::Config{}, &metrics);

    // Issue a link
    auto issued = api.handle(get("/download-url?download_key=abc123&download=7&file=3&expire=MTcwMDAwMDAwMA%3D%3D"),
                             "203.0.113.7");
    assert(issued.result() == http::status::ok);
    const std::string url = body_of(issued);
    assert(url.rfind("http://shop.example.com/download?eddfile=42%3A7%3A3&ttl=1700000000&token=", 0) == 0);

    // Redeem it
    auto redeemed = api.handle(get(target_of(url)), "198.51.100.9");
    assert(redeemed.result() == http::status::ok);
    assert(body_of(redeemed) == "download=7&email=buyer%40example.com&expire=1700000000&file_key=3&key=abc123");

    // Tampered
    std::string tampered = target_of(url);
    tampered.replace(tampered.find("ttl=1700000000"), 14, "ttl=1900000000");
    auto rejected = api.handle(get(tampered), "203.0.113.7");
    assert(rejected.result() == http::status::forbidden);

    // Not a signed download request
    assert(api.handle(get("/download?download=7"), "203.0.113.7").result() == http::status::bad_request);

    // Unknown purchase key
    assert(api.handle(get("/download-url?download_key=zzz&download=7&file=3"), "203.0.113.7").result() ==
           http::status::not_found);

    // Only GET
    gateway::Request post{http::verb::post, "/download-url", 11};
    assert(api.handle(post, "203.0.113.7").result() == http::status::method_not_allowed);

    std::string prom = metrics.RenderPrometheus();
    assert(prom.find("surlgw_sign_total{outcome=\"issued\"} 1") != std::string::npos);
    assert(prom.find("surlgw_sign_total{outcome=\"skipped\"} 1") != std::string::npos);
    assert(prom.find("surlgw_verify_total{outcome=\"valid\"} 1") != std::string::npos);
    assert(prom.find("surlgw_verify_total{outcome=\"invalid\"} 1") != std::string::npos);
    assert(prom.find("surlgw_verify_total{outcome=\"not_applicable\"} 1") != std::string::npos);

    // Requests the server answers before the Api
    gateway::Response local;
    assert(server::serve_local(get("/healthz"), &metrics, &local));
    assert(local.result() == http::status::ok && body_of(local) == "ok\n");
    assert(server::serve_local(get("/metrics"), &metrics, &local));
    assert(body_of(local).find("surlgw_verify_total{outcome=\"valid\"} 1") != std::string::npos);
    assert(!server::serve_local(get("/metrics?x=1"), &metrics, &local));
    assert(!server::serve_local(get("/download-url?download_key=abc123"), &metrics, &local));
    gateway::Request post_metrics{http::verb::post, "/metrics", 11};
    assert(!server::serve_local(post_metrics, &metrics, &local));

    // IP-bound links behind a proxy
    gateway::Config proxied;
    proxied.trust_forwarded_for = true;
    proxied.default_options = signing::Options::parse("ip");
    gateway::Api behind_proxy(&hooks, proxied);

    auto req = get("/download-url?download_key=abc123&download=7&file=3&expire=MTcwMDAwMDAwMA%3D%3D");
    req.set("X-Forwarded-For", "192.0.2.1, 10.0.0.2");
    auto bound = behind_proxy.handle(req, "10.0.0.1");
    assert(bound.result() == http::status::ok);
    const std::string bound_url = body_of(bound);
    assert(bound_url.find("&o=ip&token=") != std::string::npos);

    auto same_client = get(target_of(bound_url));
    same_client.set("X-Forwarded-For", "192.0.2.1");
    assert(behind_proxy.handle(same_client, "10.0.0.1").result() == http::status::ok);

    auto other_client = get(target_of(bound_url));
    other_client.set("X-Forwarded-For", "192.0.2.99");
    assert(behind_proxy.handle(other_client, "10.0.0.1").result() == http::status::forbidden);

    // Without trusting the header the proxy address is what counts
    assert(api.handle(same_client, "10.0.0.1").result() == http::status::forbidden);
    assert(api.handle(same_client, "192.0.2.1").result() == http::status::ok);

    // Bindings can also be requested per link
    auto ua_bound = api.handle(get("/download-url?download_key=abc123&download=7&file=3&expire=MTcwMDAwMDAwMA%3D%3D&o=ua"),
                               "203.0.113.7");
    assert(ua_bound.result() == http::status::ok);
    auto other_agent = get(target_of(body_of(ua_bound)));
    other_agent.set(http::field::user_agent, "curl/8.5.0");
    assert(api.handle(other_agent, "203.0.113.7").result() == http::status::forbidden);
    assert(api.handle(get(target_of(body_of(ua_bound))), "198.51.100.9").result() == http::status::ok);

    // Storage failures answer 500 and are counted apart from rejected tokens
    UnreachablePaymentStore unreachable;
    downloads::DownloadHooks broken_hooks(&signer, &unreachable, "http://shop.example.com/download");
    server::Metrics broken_metrics;
    gateway::Api broken(&broken_hooks, gateway::Config{}, &broken_metrics);
    assert(broken.handle(get("/download-url?download_key=abc123&download=7&file=3"), "203.0.113.7").result() ==
           http::status::internal_server_error);
    assert(broken.handle(get(target_of(url)), "203.0.113.7").result() == http::status::internal_server_error);
    std::string broken_prom = broken_metrics.RenderPrometheus();
    assert(broken_prom.find("surlgw_sign_total{outcome=\"error\"} 1") != std::string::npos);
    assert(broken_prom.find("surlgw_sign_total{outcome=\"skipped\"} 0") != std::string::npos);
    assert(broken_prom.find("surlgw_verify_total{outcome=\"error\"} 1") != std::string::npos);
    assert(broken_prom.find("surlgw_verify_total{outcome=\"invalid\"} 0") != std::string::npos);
  }

  delete db;
  std::filesystem::remove_all(dir);

  std::cout << "test_api passed\n";
  return 0;
}
