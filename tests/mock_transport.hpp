#pragma once

#include "discord/request.hpp"

namespace relay {

namespace test {

// Holds every request until the test answers it.
class MockTransport : public discord::Transport {
  asio::any_io_executor ex;

public:
  struct Exchange {
    discord::HttpRequest request;
    Handler handler;
  };

  std::deque<Exchange> pending;
  std::vector<discord::HttpRequest> history;
  int inFlight{ 0 };
  int maxInFlight{ 0 };

  explicit MockTransport(asio::any_io_executor ex)
    : ex(std::move(ex))
  {}

  void send(discord::HttpRequest request, Handler handler) override {
    history.push_back(request);
    pending.push_back({ std::move(request), std::move(handler) });
    maxInFlight = std::max(maxInFlight, ++inFlight);
  }

  int sent() const { return static_cast<int>(history.size()); }

  // Answers the oldest pending request.
  void respond(unsigned status, const json::value& body = nullptr,
      std::vector<std::pair<std::string, std::string>> headers = {}) {
    auto exchange = std::move(pending.front());
    pending.pop_front();
    --inFlight;

    discord::HttpResponse response{ static_cast<http::status>(status), 11 };
    for (const auto& header: headers)
      response.set(header.first, header.second);

    if (!body.is_null()) {
      response.set(http::field::content_type, "application/json");
      response.body() = json::serialize(body);
    }
    response.prepare_payload();

    asio::post(ex, [handler = std::move(exchange.handler), response = std::move(response)]() mutable {
      handler({}, std::move(response));
    });
  }

  void fail(const beast::error_code& ec) {
    auto exchange = std::move(pending.front());
    pending.pop_front();
    --inFlight;

    asio::post(ex, [handler = std::move(exchange.handler), ec] { handler(ec, {}); });
  }
};

} // namespace test

} // namespace relay
