#include "http_server.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <iostream>
#include <optional>
#include <string_view>
#include <utility>

namespace server {

namespace beast = boost::beast;
namespace http = beast::http;

static gateway::Response plain_response(http::status st, unsigned version, bool keep_alive,
                                        std::string_view content_type, std::string_view body) {
  gateway::Response res{st, version};
  res.set(http::field::server, "signed_url_gateway");
  res.set(http::field::content_type, std::string(content_type));
  res.keep_alive(keep_alive);
  res.body().assign(body.begin(), body.end());
  res.prepare_payload();
  return res;
}

bool serve_local(const gateway::Request& req, const Metrics* metrics, gateway::Response* res) {
  if (req.method() != http::verb::get) return false;
  const std::string_view target(req.target().data(), req.target().size());
  if (target == "/metrics") {
    const std::string body = metrics ? metrics->RenderPrometheus() : std::string();
    *res = plain_response(http::status::ok, req.version(), req.keep_alive(),
                          "text/plain; version=0.0.4", body);
    return true;
  }
  if (target == "/healthz") {
    *res = plain_response(http::status::ok, req.version(), req.keep_alive(), "text/plain", "ok\n");
    return true;
  }
  return false;
}

// One client connection: read a request, answer it, repeat while keep-alive.
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, std::string peer, gateway::Api& api, const Config& cfg)
    : stream_(std::move(socket)), peer_(std::move(peer)), api_(api), cfg_(cfg) {}

  void start() {
    beast::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);
    read_next();
  }

private:
  void read_next() {
    parser_.emplace();
    parser_->body_limit(cfg_.max_request_body_bytes);
    stream_.expires_after(cfg_.read_timeout);
    http::async_read(stream_, buffer_, *parser_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        self->on_request(ec);
      });
  }

  void on_request(beast::error_code ec) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) return close();
    if (ec == http::error::body_limit) {
      return reply(plain_response(http::status::payload_too_large, 11, false, "text/plain",
                                  "Request body too large\n"), "OTHER", 0);
    }
    if (ec) {
      // Unparseable request: answer once, then hang up. Socket errors just drop.
      if (ec.category() == http::make_error_code(http::error::bad_target).category()) {
        return reply(plain_response(http::status::bad_request, 11, false, "text/plain",
                                    "Malformed request\n"), "OTHER", 0);
      }
      return;
    }

    started_ = std::chrono::steady_clock::now();
    if (cfg_.metrics) cfg_.metrics->IncInFlight();

    const gateway::Request& req = parser_->get();
    gateway::Response res;
    if (!serve_local(req, cfg_.metrics, &res)) {
      res = api_.handle(req, peer_);
    }
    reply(std::move(res), std::string(req.method_string().data(), req.method_string().size()),
          req.body().size());
  }

  void reply(gateway::Response res, std::string method, std::size_t req_bytes) {
    res_ = std::move(res);
    method_ = std::move(method);
    req_bytes_ = req_bytes;
    stream_.expires_never();
    http::async_write(stream_, res_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        self->on_sent(ec);
      });
  }

  void on_sent(beast::error_code ec) {
    if (cfg_.metrics && started_) {
      const double latency_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - *started_).count();
      cfg_.metrics->Observe(method_, res_.result_int(), req_bytes_, res_.body().size(), latency_ms);
      cfg_.metrics->DecInFlight();
    }
    started_.reset();
    if (ec) return;
    if (!res_.keep_alive()) return close();
    read_next();
  }

  void close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::string peer_;
  gateway::Api& api_;
  const Config& cfg_;
  std::optional<http::request_parser<gateway::Request::body_type>> parser_;
  gateway::Response res_;
  std::string method_;
  std::size_t req_bytes_ = 0;
  std::optional<std::chrono::steady_clock::time_point> started_;
};

Listener::Listener(asio::io_context& ioc, tcp::endpoint endpoint, gateway::Api& api, Config cfg)
  : ioc_(ioc), acceptor_(ioc), api_(api), cfg_(std::move(cfg)) {
  beast::error_code ec;
  const char* step = "open";
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    step = "set_option";
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    step = "bind";
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    step = "listen";
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    std::cerr << "listener " << step << " " << endpoint << ": " << ec.message() << "\n";
    return;
  }
  ok_ = true;
}

void Listener::run() {
  do_accept();
}

void Listener::do_accept() {
  acceptor_.async_accept(asio::make_strand(ioc_),
    [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
      self->on_accept(ec, std::move(socket));
    });
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    std::cerr << "accept: " << ec.message() << "\n";
  } else {
    beast::error_code peer_ec;
    auto peer = socket.remote_endpoint(peer_ec);
    // A peer that is already gone gets an empty address; ip-bound links fail for it.
    std::string address = peer_ec ? std::string() : peer.address().to_string();
    std::make_shared<Session>(std::move(socket), std::move(address), api_, cfg_)->start();
  }
  do_accept();
}

} // namespace server
