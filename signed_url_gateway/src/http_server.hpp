#pragma once

#include "api.hpp"
#include "metrics.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct Config {
  std::string listen_host = "0.0.0.0";
  unsigned short listen_port = 9100;
  std::size_t max_request_body_bytes = 64u * 1024u;
  std::chrono::seconds read_timeout{30}; // idle keep-alive connections are closed after this
  Metrics* metrics = nullptr;
};

// Requests the gateway answers itself, before they reach the Api:
//   GET /metrics  Prometheus text
//   GET /healthz  "ok"
// Returns false for everything else.
bool serve_local(const gateway::Request& req, const Metrics* metrics, gateway::Response* res);

class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(asio::io_context& ioc, tcp::endpoint endpoint, gateway::Api& api, Config cfg);

  // False when the endpoint could not be opened, bound or listened on.
  bool ok() const { return ok_; }

  void run();

private:
  void do_accept();
  void on_accept(boost::system::error_code ec, tcp::socket socket);

  asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  gateway::Api& api_;
  Config cfg_;
  bool ok_ = false;
};

} // namespace server
