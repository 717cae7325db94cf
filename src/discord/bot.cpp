#include "bot.hpp"

namespace relay {

namespace discord {

Settings tag_invoke(json::value_to_tag<Settings>, const json::value& jv) {
  Settings s;
  const auto& object = jv.as_object();
  extract(object, s.enabled, "enabled");
  extract(object, s.token, "token");
  s.http.token = s.token;
  s.gateway.token = s.token;

  extract_maybe(object, s.gateway.intents, "intents", s.gateway.intents);
  extract_maybe(object, s.gateway.largeThreshold, "large_threshold", 250);
  extract_maybe(object, s.gateway.compress, "compress", false);
  extract_maybe(object, s.gateway.transportCompression, "transport_compression", true);

  int version;
  extract_maybe(object, version, "api_version", 10);
  s.gateway.version = version;
  s.http.version = version;

  std::optional<std::vector<int>> shard;
  extract_optional(object, shard, "shard");
  if (shard) {
    if (shard->size() != 2 || (*shard)[0] < 0 || (*shard)[0] >= (*shard)[1])
      throw std::invalid_argument("shard must be [shard_id, shard_count]");
    s.gateway.shard = Shard{ (*shard)[0], (*shard)[1] };
  }

  if (auto it = object.find("http"); it != object.end()) {
    const auto& h = it->value().as_object();
    extract_maybe(h, s.http.host, "host", s.http.host);
    extract_maybe(h, s.http.maxAttempts, "max_attempts", s.http.maxAttempts);
    extract_maybe(h, s.http.maxRateLimitRetries, "max_rate_limit_retries", s.http.maxRateLimitRetries);

    std::int64_t backoff;
    extract_maybe(h, backoff, "retry_backoff_ms", std::int64_t{ s.http.retryBackoff.count() });
    s.http.retryBackoff = std::chrono::milliseconds(backoff);
  }

  if (auto it = object.find("gateway"); it != object.end()) {
    const auto& g = it->value().as_object();

    std::optional<std::vector<int>> codes;
    extract_optional(g, codes, "fatal_close_codes");
    if (codes)
      s.gateway.fatalCloseCodes = std::set<std::uint16_t>(codes->begin(), codes->end());

    extract_maybe(g, s.gateway.resumeCloseCode, "resume_close_code", s.gateway.resumeCloseCode);
    extract_maybe(g, s.gateway.maxReconnectAttempts, "max_reconnect_attempts", s.gateway.maxReconnectAttempts);
  }

  return s;
}

Bot::Bot(asio::io_context& io, ssl::context& ctx, const Settings& s)
  : Bot(io, s,
      std::make_shared<HttpsTransport>(io.get_executor(), ctx, s.http.host),
      [&io, &ctx, agent = s.http.userAgent] {
        return std::make_shared<WebSocketConnection>(asio::make_strand(io), ctx, agent);
      })
{}

Bot::Bot(asio::io_context& io, const Settings& s,
    std::shared_ptr<Transport> transport, ConnectionFactory factory)
  : io(io)
  , settings(s)
  , http(std::make_shared<Http>(io.get_executor(), s.http, std::move(transport)))
  , connections(std::move(factory))
  , startDelay(io)
{}

void Bot::run() {
  using boost::placeholders::_1;
  using boost::placeholders::_2;

  if (!settings.enabled)
    return;

  if (!gateway)
    http->getGatewayBot(boost::bind(&Bot::onGatewayUpdated, this, _1, _2));
  else
    connect();
}

void Bot::stop() {
  if (stopped)
    return;

  std::cout << "[Discord] Stopping\n";

  stopped = true;
  startDelay.cancel();
  if (session)
    session->close();
  http->shutdown();
}

void Bot::on(const std::string& event, Listener listener) {
  listeners[event].push_back(std::move(listener));
}

void Bot::onFailure(FailureHandler handler) {
  failureHandler = std::move(handler);
}

void Bot::createMessage(const std::string& channelId, const std::string& content, Http::Handler handler) {
  json::object payload{
    { "content", content }
  };

  http->request(
      Route{ http::verb::post, "/channels/{channel_id}/messages", {{ "channel_id", channelId }} },
      payload, logged("create message", std::move(handler)));
}

void Bot::editMessage(const std::string& channelId, const std::string& messageId,
    const std::string& content, Http::Handler handler) {
  json::object payload{
    { "content", content }
  };

  http->request(
      Route{ http::verb::patch, "/channels/{channel_id}/messages/{message_id}",
        {{ "channel_id", channelId }, { "message_id", messageId }} },
      payload, logged("edit message", std::move(handler)));
}

void Bot::deleteChannel(const std::string& channelId, Http::Handler handler) {
  http->request(
      Route{ http::verb::delete_, "/channels/{channel_id}", {{ "channel_id", channelId }} },
      logged("delete channel", std::move(handler)));
}

void Bot::onGatewayUpdated(const beast::error_code& ec, const GatewayBot& g) {
  if (stopped)
    return;

  if (ec) {
    std::cerr << "[Discord] Failed to get gateway: " << ec.message() << '\n';
    if (failureHandler)
      failureHandler(ec);
    return;
  }

  gateway = g;

  std::cout << "[Discord] Gateway: " << gateway->url << ", shards: " << gateway->shards << '\n';
  std::cout << "[Discord] SessionStartLimit ["
    << "total: " << gateway->sessionStartLimit.total << ", "
    << "remaining: " << gateway->sessionStartLimit.remaining << ", "
    << "resetAfter: " << gateway->sessionStartLimit.resetAfter << ", "
    << "maxConcurrency: " << gateway->sessionStartLimit.maxConcurrency << "]\n";

  if (gateway->sessionStartLimit.remaining > 0)
    return connect();

  std::cout << "[Discord] Session start limit reached, waiting "
    << gateway->sessionStartLimit.resetAfter << "ms\n";

  startDelay.expires_after(std::chrono::milliseconds(gateway->sessionStartLimit.resetAfter));
  startDelay.async_wait(
      [this](const beast::error_code& ec) {
        if (ec || stopped)
          return;

        connect();
      });
}

void Bot::connect() {
  session = std::make_shared<Session>(io.get_executor(), settings.gateway, connections);
  session->start(gatewayUrl(gateway->url, settings.gateway.version, settings.gateway.transportCompression));

  poll();
}

void Bot::poll() {
  using boost::placeholders::_1;
  using boost::placeholders::_2;

  session->next(boost::bind(&Bot::onDispatch, this, _1, _2));
}

void Bot::onDispatch(const beast::error_code& ec, Dispatch dispatch) {
  if (ec) {
    if (ec == asio::error::operation_aborted)
      return;

    std::cerr << "[Discord] Gateway session ended: " << ec.message()
      << " [" << ec.category().name() << ':' << ec.value() << "]\n";
    if (failureHandler)
      failureHandler(ec);
    return;
  }

  auto it = listeners.find(dispatch.type);
  if (it != listeners.end()) {
    for (const auto& listener: it->second) {
      try {
        listener(dispatch.data);
      } catch (const std::exception& e) {
        std::cerr << "[Discord] Listener for `" << dispatch.type << "` failed: " << e.what() << '\n';
      }
    }
  }

  if (!stopped)
    poll();
}

Http::Handler Bot::logged(const std::string& what, Http::Handler handler) {
  return [what, handler = std::move(handler)](const beast::error_code& ec, const Response& response) {
    if (ec)
      std::cerr << "[Discord] Failed to " << what << ": " << ec.message()
        << " [status: " << response.status() << "]\n";

    if (handler)
      handler(ec, response);
  };
}

} // namespace discord

} // namespace relay
