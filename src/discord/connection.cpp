#include "connection.hpp"
#include "gateway.hpp"

namespace relay {

namespace discord {

void WebSocketConnection::connect(const std::string& url, Handler handler) {
  connectHandler = std::move(handler);

  auto parts = parseUrl(url);
  host = parts.host;
  port = parts.port;
  target = parts.target;

  std::cout << "[Gateway] Connecting to: " << host << target << '\n';

  resolver.async_resolve(host, port,
      beast::bind_front_handler(&WebSocketConnection::onResolve, shared_from_this()));
}

void WebSocketConnection::read(ReadHandler handler) {
  readHandler = std::move(handler);

  ws.async_read(buffer,
      beast::bind_front_handler(&WebSocketConnection::onRead, shared_from_this()));
}

void WebSocketConnection::write(std::string payload, Handler handler) {
  outgoing = std::move(payload);
  writeHandler = std::move(handler);

  ws.text(true);
  ws.async_write(asio::buffer(outgoing),
      beast::bind_front_handler(&WebSocketConnection::onWrite, shared_from_this()));
}

void WebSocketConnection::close(std::uint16_t code, Handler handler) {
  ws.async_close(ws::close_reason(code),
      [self = shared_from_this(), handler = std::move(handler)](beast::error_code ec) {
        if (ec == ssl::error::stream_truncated)
          ec = {};

        if (ec)
          std::cerr << "[Gateway] Close failed: " << ec.message() << '\n';

        handler(ec);
      });
}

std::uint16_t WebSocketConnection::closeCode() const {
  return static_cast<std::uint16_t>(ws.reason().code);
}

void WebSocketConnection::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
  if (ec) {
    std::cerr << "[Gateway] Resolve failed: " << ec.message() << '\n';
    return connectHandler(ec);
  }

  beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(30));

  beast::get_lowest_layer(ws).async_connect(results,
      beast::bind_front_handler(&WebSocketConnection::onConnect, shared_from_this()));
}

void WebSocketConnection::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
  boost::ignore_unused(endpoint);

  if (ec) {
    std::cerr << "[Gateway] Connect failed: " << ec.message() << '\n';
    return connectHandler(ec);
  }

  beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(30));

  if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
    ec = beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
    std::cerr << "[Gateway] SSL Error: " << ec.message() << '\n';
    return connectHandler(ec);
  }

  ws.next_layer().async_handshake(ssl::stream_base::client,
      beast::bind_front_handler(&WebSocketConnection::onSslHandshake, shared_from_this()));
}

void WebSocketConnection::onSslHandshake(beast::error_code ec) {
  if (ec) {
    std::cerr << "[Gateway] SSL Handshake failed: " << ec.message() << '\n';
    return connectHandler(ec);
  }

  beast::get_lowest_layer(ws).expires_never();

  ws.set_option(ws::stream_base::timeout::suggested(beast::role_type::client));

  ws.set_option(ws::stream_base::decorator(
        [agent = userAgent](ws::request_type& req) {
          req.set(http::field::user_agent, agent);
        }
  ));

  ws.read_message_max(0);

  ws.async_handshake(host + ':' + port, target,
      beast::bind_front_handler(&WebSocketConnection::onHandshake, shared_from_this()));
}

void WebSocketConnection::onHandshake(beast::error_code ec) {
  if (ec)
    std::cerr << "[Gateway] Handshake failed: " << ec.message() << '\n';

  connectHandler(ec);
}

void WebSocketConnection::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    buffer.clear();
    return readHandler(ec, {}, false);
  }

  auto payload = beast::buffers_to_string(buffer.data());
  buffer.clear();

  readHandler(ec, std::move(payload), ws.got_binary());
}

void WebSocketConnection::onWrite(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec)
    std::cerr << "[Gateway] Write failed: " << ec.message() << '\n';

  writeHandler(ec);
}

} // namespace discord

} // namespace relay
