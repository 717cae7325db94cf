#pragma once

#include "../common.hpp"

namespace relay {

namespace discord {

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Sends one fully prepared HTTP request.
class Transport {
public:
  using Handler = std::function<void(const beast::error_code& ec, HttpResponse response)>;

  virtual ~Transport() = default;

  virtual void send(HttpRequest request, Handler handler) = 0;
};

// A single request over its own TLS connection.
class Request : public std::enable_shared_from_this<Request> {
  tcp::resolver resolver;
  beast::ssl_stream<beast::tcp_stream> stream;
  beast::flat_buffer buffer;
  HttpRequest request;
  HttpResponse response;
  std::string host;
  std::string port;
  Transport::Handler handler;

public:
  explicit Request(asio::any_io_executor ex, ssl::context& ctx, std::string host, std::string port = "443")
    : resolver(ex)
    , stream(ex, ctx)
    , host(std::move(host))
    , port(std::move(port))
  {}

  void run(HttpRequest request, Transport::Handler handler);

private:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results);
  void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint);
  void onHandshake(beast::error_code ec);
  void onWrite(beast::error_code ec, std::size_t bytes);
  void onRead(beast::error_code ec, std::size_t bytes);
  void onShutdown(beast::error_code ec);

};

class HttpsTransport : public Transport {
  asio::any_io_executor ex;
  ssl::context& ctx;
  std::string host;

public:
  HttpsTransport(asio::any_io_executor ex, ssl::context& ctx, std::string host)
    : ex(std::move(ex))
    , ctx(ctx)
    , host(std::move(host))
  {}

  void send(HttpRequest request, Handler handler) override;
};

} // namespace discord

} // namespace relay
