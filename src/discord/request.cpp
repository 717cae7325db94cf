#include "request.hpp"

namespace relay {

namespace discord {

void HttpsTransport::send(HttpRequest request, Handler handler) {
  std::make_shared<Request>(asio::make_strand(ex), ctx, host)->run(std::move(request), std::move(handler));
}

void Request::run(HttpRequest r, Transport::Handler h) {
  request = std::move(r);
  handler = std::move(h);

  if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
    beast::error_code ec{ static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category() };
    std::cerr << "[Http] SSL Error: " << ec.message() << '\n';
    return handler(ec, {});
  }

  resolver.async_resolve(host, port,
      beast::bind_front_handler(&Request::onResolve, shared_from_this()));
}

void Request::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
  if (ec)
    return handler(ec, {});

  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));

  beast::get_lowest_layer(stream).async_connect(results,
      beast::bind_front_handler(&Request::onConnect, shared_from_this()));
}

void Request::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
  boost::ignore_unused(endpoint);

  if (ec)
    return handler(ec, {});

  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));

  stream.async_handshake(ssl::stream_base::client,
      beast::bind_front_handler(&Request::onHandshake, shared_from_this()));
}

void Request::onHandshake(beast::error_code ec) {
  if (ec)
    return handler(ec, {});

  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));

  http::async_write(stream, request,
      beast::bind_front_handler(&Request::onWrite, shared_from_this()));
}

void Request::onWrite(beast::error_code ec, std::size_t bytes) {
  boost::ignore_unused(bytes);

  if (ec)
    return handler(ec, {});

  http::async_read(stream, buffer, response,
      beast::bind_front_handler(&Request::onRead, shared_from_this()));
}

void Request::onRead(beast::error_code ec, std::size_t bytes) {
  boost::ignore_unused(bytes);

  if (ec)
    return handler(ec, {});

  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));

  stream.async_shutdown(
      beast::bind_front_handler(&Request::onShutdown, shared_from_this()));

  handler(ec, std::move(response));
}

void Request::onShutdown(beast::error_code ec) {
  if (ec == asio::error::eof || ec == ssl::error::stream_truncated) {
    ec = {};
  }

  if (ec) {
    std::cerr << "[Http] Request shutdown failed: " << ec.message() << '\n';
    return;
  }
}

} // namespace discord

} // namespace relay
