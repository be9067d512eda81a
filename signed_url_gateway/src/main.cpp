#include "api.hpp"
#include "download_hooks.hpp"
#include "http_server.hpp"
#include "metrics.hpp"
#include "payments.hpp"
#include "secret.hpp"
#include "signer.hpp"
#include "url.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include <rocksdb/options.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class LogDownloads final : public downloads::DownloadObserver {
public:
  void on_valid_download(std::string_view, const downloads::DownloadArgs& args) const override {
    std::cout << "download granted: payment key " << util::query_get(args, "key").value_or("?")
              << " download " << util::query_get(args, "download").value_or("?")
              << " file " << util::query_get(args, "file_key").value_or("?") << "\n";
  }
};

int main(int argc, char** argv) {
  std::string listen = "0.0.0.0:9100";
  std::string db_path = "./signed_url_payments";
  std::string home_url = "http://localhost:9100/";
  int threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  std::string secret;
  std::string secret_env = "SIGNED_URL_SECRET";
  std::string bind;
  std::string import_payments;
  int max_body_kb = 64;
  int read_timeout_s = 30;
  bool trust_forwarded_for = false;
  bool log_downloads = false;

  po::options_description desc("signed_url_gateway options");
  desc.add_options()
    ("help,h", "Show help")
    ("listen", po::value<std::string>(&listen)->default_value(listen), "Listen address host:port")
    ("threads", po::value<int>(&threads)->default_value(threads), "Worker threads")
    ("db_path", po::value<std::string>(&db_path)->default_value(db_path), "RocksDB payment store path")
    ("home_url", po::value<std::string>(&home_url)->default_value(home_url), "Base URL signed download links point at")
    ("secret", po::value<std::string>(&secret), "Installation key used to derive the signing secret")
    ("secret_env", po::value<std::string>(&secret_env)->default_value(secret_env), "Environment variable holding the installation key when --secret is not given")
    ("bind", po::value<std::string>(&bind)->default_value(bind), "Bindings for every issued URL, colon-separated: ip, ua")
    ("trust_forwarded_for", po::bool_switch(&trust_forwarded_for)->default_value(trust_forwarded_for), "Take the client address from X-Forwarded-For")
    ("log_downloads", po::bool_switch(&log_downloads)->default_value(log_downloads), "Log every granted download")
    ("import_payments", po::value<std::string>(&import_payments), "CSV of payment_id,email,purchase_key to load at startup")
    ("max_body_kb", po::value<int>(&max_body_kb)->default_value(max_body_kb), "Max request body (KiB)")
    ("read_timeout_s", po::value<int>(&read_timeout_s)->default_value(read_timeout_s), "Close connections idle for this many seconds");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << "Argument error: " << e.what() << "\n\n" << desc << "\n";
    return 2;
  }

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }

  // Parse listen
  auto colon = listen.rfind(':');
  if (colon == std::string::npos) {
    std::cerr << "--listen must be host:port\n";
    return 2;
  }
  std::string host = listen.substr(0, colon);
  int port_i = std::atoi(listen.substr(colon + 1).c_str());
  if (port_i <= 0 || port_i > 65535) {
    std::cerr << "Invalid port\n";
    return 2;
  }

  std::shared_ptr<const signing::SecretProvider> secrets;
  if (!secret.empty()) {
    secrets = std::make_shared<signing::StaticSecretProvider>(signing::derive_secret(secret));
  } else {
    secrets = std::make_shared<signing::EnvSecretProvider>(secret_env);
  }
  if (secrets->shared_secret().empty()) {
    std::cerr << "No signing secret: pass --secret or set " << secret_env << "\n";
    return 2;
  }

  rocksdb::Options opt;
  opt.create_if_missing = true;
  opt.IncreaseParallelism();

  std::unique_ptr<rocksdb::DB> db;
  rocksdb::DB* raw = nullptr;
  auto st = rocksdb::DB::Open(opt, db_path, &raw);
  if (!st.ok()) {
    std::cerr << "Failed to open RocksDB at " << db_path << ": " << st.ToString() << "\n";
    return 1;
  }
  db.reset(raw);

  server::Metrics metrics;
  storage::RocksPaymentStore payments(db.get(), rocksdb::WriteOptions{}, &metrics);

  if (!import_payments.empty()) {
    std::ifstream in(import_payments);
    if (!in) {
      std::cerr << "Cannot open " << import_payments << "\n";
      return 1;
    }
    std::string err;
    long n = payments.import_csv(in, &err);
    if (n < 0) {
      std::cerr << "Payment import failed: " << err << "\n";
      return 1;
    }
    std::cout << "Imported " << n << " payments from " << import_payments << "\n";
  }

  signing::UrlSigner signer(secrets);
  downloads::DownloadHooks hooks(&signer, &payments, home_url);
  if (log_downloads) hooks.add_observer(std::make_shared<LogDownloads>());

  gateway::Config gcfg;
  gcfg.default_options = signing::Options::parse(bind);
  gcfg.trust_forwarded_for = trust_forwarded_for;
  gateway::Api api(&hooks, gcfg, &metrics);

  asio::io_context ioc{static_cast<int>(std::max(1, threads))};

  boost::system::error_code ec;
  auto address = asio::ip::make_address(host, ec);
  if (ec) {
    std::cerr << "Invalid listen host " << host << ": " << ec.message() << "\n";
    return 2;
  }
  tcp::endpoint endpoint{address, static_cast<unsigned short>(port_i)};
  server::Config scfg;
  scfg.listen_host = host;
  scfg.listen_port = static_cast<unsigned short>(port_i);
  scfg.max_request_body_bytes = static_cast<std::size_t>(std::max(1, max_body_kb)) * 1024u;
  scfg.read_timeout = std::chrono::seconds(std::max(1, read_timeout_s));
  scfg.metrics = &metrics;

  auto listener = std::make_shared<server::Listener>(ioc, endpoint, api, scfg);
  if (!listener->ok()) return 1;
  listener->run();
  std::cout << "signed_url_gateway listening on " << endpoint << ", links for " << home_url << "\n";

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&ioc]{ ioc.run(); });
  }

  for (auto& t : workers) t.join();
  return 0;
}
