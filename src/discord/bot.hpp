#pragma once

#include "http.hpp"
#include "session.hpp"

namespace relay {

namespace discord {

struct Settings {
  bool enabled;
  std::string token;
  HttpSettings http;
  SessionSettings gateway;
};

Settings tag_invoke(json::value_to_tag<Settings>, const json::value& jv);

class Bot {
public:
  using Listener = std::function<void(const json::value& data)>;
  using FailureHandler = std::function<void(const beast::error_code& ec)>;

private:
  asio::io_context& io;
  Settings settings;
  std::shared_ptr<Http> http;
  ConnectionFactory connections;
  std::shared_ptr<Session> session;
  std::optional<GatewayBot> gateway;
  asio::steady_timer startDelay;
  std::unordered_map<std::string, std::vector<Listener>> listeners;
  FailureHandler failureHandler;
  bool stopped{ false };

public:
  Bot(asio::io_context& io, ssl::context& ctx, const Settings& settings);
  Bot(asio::io_context& io, const Settings& settings,
      std::shared_ptr<Transport> transport, ConnectionFactory connections);

  void run();
  void stop();

  // Calls `listener` with the data of every dispatch named `event`, e.g. "MESSAGE_CREATE".
  void on(const std::string& event, Listener listener);

  // Called once the gateway session ends with a non-recoverable error.
  void onFailure(FailureHandler handler);

  void createMessage(const std::string& channelId, const std::string& content, Http::Handler handler = {});
  void editMessage(const std::string& channelId, const std::string& messageId,
      const std::string& content, Http::Handler handler = {});
  void deleteChannel(const std::string& channelId, Http::Handler handler = {});

  Http& rest() { return *http; }
  std::shared_ptr<Session> getSession() const { return session; }

private:
  void onGatewayUpdated(const beast::error_code& ec, const GatewayBot& gateway);
  void connect();
  void poll();
  void onDispatch(const beast::error_code& ec, Dispatch dispatch);

  static Http::Handler logged(const std::string& what, Http::Handler handler);
};

} // namespace discord

} // namespace relay
