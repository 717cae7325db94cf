#pragma once

#include "../common.hpp"
#include "bucket.hpp"
#include "gateway.hpp"
#include "global_gate.hpp"
#include "request.hpp"
#include "route.hpp"

#include <unordered_set>

namespace relay {

namespace discord {

struct HttpSettings {
  std::string token;
  std::string host{ "discord.com" };
  int version{ 10 };
  std::string userAgent{ "DiscordBot (https://github.com/relay, 1.0)" };
  int maxAttempts{ 3 };
  std::chrono::milliseconds retryBackoff{ 1000 };
  int maxRateLimitRetries{ 5 };
};

struct Response {
  HttpResponse raw;
  json::value data;

  unsigned status() const { return raw.result_int(); }
};

class Call;

/*
 * Rate limited REST executor. Requests sharing a bucket run strictly one at
 * a time; a global 429 holds back every bucket until it expires.
 *
 * Failures complete the handler with an HttpError (or the transport's error)
 * together with whatever response was last received.
 */
class Http : public std::enable_shared_from_this<Http> {
public:
  using Handler = std::function<void(const beast::error_code& ec, const Response& response)>;
  using GatewayHandler = std::function<void(const beast::error_code& ec, const GatewayBot& gateway)>;

private:
  friend class Call;

  asio::strand<asio::any_io_executor> strand;
  HttpSettings settings;
  std::shared_ptr<Transport> transport;
  std::shared_ptr<BucketRegistry> registry;
  GlobalGate gate;
  std::unordered_set<std::shared_ptr<Call>> calls;
  bool stopped{ false };

public:
  Http(asio::any_io_executor ex, HttpSettings settings, std::shared_ptr<Transport> transport);

  // Throws std::invalid_argument when the route is missing a parameter.
  void request(const Route& route, Handler handler);
  void request(const Route& route, const json::value& body, Handler handler);

  // GET /gateway/bot
  void getGatewayBot(GatewayHandler handler);

  // Aborts every pending call and timer. New requests fail with operation_aborted.
  void shutdown();

  // Inspection, meant for the executor's own strand.
  const BucketRegistry& buckets() const { return *registry; }
  const GlobalGate& globalGate() const { return gate; }

private:
  HttpRequest prepare(const Route& route, const json::value& body) const;
};

} // namespace discord

} // namespace relay
