#pragma once

#include "../common.hpp"

namespace relay {

namespace discord {

/*
 * One websocket to the gateway. Only one read and one write may be
 * outstanding at a time; the session above serializes both.
 */
class Connection {
public:
  using Handler = std::function<void(const beast::error_code& ec)>;
  using ReadHandler = std::function<void(const beast::error_code& ec, std::string payload, bool binary)>;

  virtual ~Connection() = default;

  virtual void connect(const std::string& url, Handler handler) = 0;
  virtual void read(ReadHandler handler) = 0;
  virtual void write(std::string payload, Handler handler) = 0;
  virtual void close(std::uint16_t code, Handler handler) = 0;

  // Close code sent by the peer, 0 while none was received.
  virtual std::uint16_t closeCode() const = 0;
};

using ConnectionFactory = std::function<std::shared_ptr<Connection>()>;

class WebSocketConnection : public Connection, public std::enable_shared_from_this<WebSocketConnection> {
  using Stream = ws::stream<beast::ssl_stream<beast::tcp_stream>>;

  tcp::resolver resolver;
  Stream ws;
  beast::flat_buffer buffer;
  std::string host;
  std::string port;
  std::string target;
  std::string userAgent;
  Handler connectHandler;
  ReadHandler readHandler;
  Handler writeHandler;
  std::string outgoing;

public:
  explicit WebSocketConnection(asio::any_io_executor ex, ssl::context& ctx, std::string userAgent)
    : resolver(ex)
    , ws(ex, ctx)
    , userAgent(std::move(userAgent))
  {}

  void connect(const std::string& url, Handler handler) override;
  void read(ReadHandler handler) override;
  void write(std::string payload, Handler handler) override;
  void close(std::uint16_t code, Handler handler) override;
  std::uint16_t closeCode() const override;

private:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results);
  void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint);
  void onSslHandshake(beast::error_code ec);
  void onHandshake(beast::error_code ec);
  void onRead(beast::error_code ec, std::size_t bytes);
  void onWrite(beast::error_code ec, std::size_t bytes);
};

} // namespace discord

} // namespace relay
