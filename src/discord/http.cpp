#include "http.hpp"
#include "errors.hpp"

namespace relay {

namespace discord {

namespace {

json::value decodeBody(const HttpResponse& raw) {
  if (raw.body().empty())
    return nullptr;

  auto type = raw[http::field::content_type];
  if (type.substr(0, 16) == "application/json") {
    beast::error_code ec;
    auto value = json::parse(raw.body(), ec);
    if (!ec)
      return value;
  }

  return json::string(raw.body());
}

double retryAfter(const Response& response, const RateLimitHeaders& headers) {
  if (response.data.is_object()) {
    const auto& object = response.data.get_object();
    auto it = object.find("retry_after");
    if (it != object.end() && it->value().is_number())
      return it->value().to_number<double>();
  }

  auto header = response.raw.find(http::field::retry_after);
  double seconds;
  if (header != response.raw.end() &&
      boost::conversion::try_lexical_convert(header->value().data(), header->value().size(), seconds))
    return seconds;

  return headers.resetAfter.value_or(1.0);
}

bool globalBody(const Response& response) {
  if (!response.data.is_object())
    return false;

  const auto& object = response.data.get_object();
  auto it = object.find("global");
  return it != object.end() && it->value().is_bool() && it->value().get_bool();
}

} // namespace

// One logical request: holds its bucket across every attempt.
class Call : public std::enable_shared_from_this<Call> {
  std::shared_ptr<Http> http;
  HttpRequest request;
  std::string routeKey;
  MajorParameters major;
  bool global;
  Http::Handler handler;
  std::shared_ptr<Bucket> bucket;
  asio::steady_timer timer;
  bool holding{ false };
  bool done{ false };
  int attempt{ 0 };
  int rateLimited{ 0 };

public:
  Call(std::shared_ptr<Http> http, HttpRequest request, std::string routeKey,
      MajorParameters major, bool global, Http::Handler handler)
    : http(std::move(http))
    , request(std::move(request))
    , routeKey(std::move(routeKey))
    , major(std::move(major))
    , global(global)
    , handler(std::move(handler))
    , timer(this->http->strand)
  {}

  void start() {
    bucket = http->registry->resolve(routeKey, major);
    bucket->acquire(
        [self = shared_from_this()](const beast::error_code& ec) {
          self->onAcquired(ec);
        });
  }

  void cancel() {
    finish(asio::error::operation_aborted, {});
  }

private:
  void onAcquired(const beast::error_code& ec) {
    if (ec || done)
      return finish(ec ? ec : beast::error_code(asio::error::operation_aborted), {});

    // Waiters handed over by a merged bucket are granted by its successor.
    while (auto successor = bucket->successor())
      bucket = successor;

    holding = true;
    next();
  }

  void next() {
    if (auto successor = bucket->successor())
      return requeue(std::move(successor));

    auto wait = bucket->exhausted() ? bucket->delay() : Bucket::clock::duration::zero();
    if (wait == Bucket::clock::duration::zero())
      return waitForGate();

    timer.expires_after(wait);
    timer.async_wait(
        [self = shared_from_this()](const beast::error_code& ec) {
          if (ec || self->done)
            return;

          self->waitForGate();
        });
  }

  void waitForGate() {
    if (!global)
      return send();

    http->gate.wait(
        [self = shared_from_this()](const beast::error_code& ec) {
          if (self->done)
            return;

          if (ec)
            return self->finish(ec, {});

          // A global 429 handled since the wait was queued closes the gate again.
          if (self->http->gate.isClosed())
            return self->waitForGate();

          self->send();
        });
  }

  // The bucket was merged into the one tracked under its id; retry from there.
  void requeue(std::shared_ptr<Bucket> successor) {
    holding = false;
    bucket->release();
    bucket = std::move(successor);
    bucket->acquire(
        [self = shared_from_this()](const beast::error_code& ec) {
          self->onAcquired(ec);
        });
  }

  void send() {
    http->transport->send(request,
        [self = shared_from_this()](const beast::error_code& ec, HttpResponse response) {
          asio::post(self->http->strand,
              [self, ec, response = std::move(response)]() mutable {
                self->onResponse(ec, std::move(response));
              });
        });
  }

  void onResponse(const beast::error_code& ec, HttpResponse raw) {
    if (done)
      return;

    if (ec) {
      std::cerr << "[Http] " << request.method_string() << ' ' << request.target()
        << " failed: " << ec.message() << '\n';
      return finish(ec, {});
    }

    Response response;
    response.raw = std::move(raw);
    response.data = decodeBody(response.raw);

    auto headers = parseRateLimitHeaders(response.raw.base());
    bucket->update(headers);
    if (headers.bucket)
      http->registry->learn(*bucket, *headers.bucket);

    auto status = response.status();

    if (status >= 200 && status < 300)
      return finish({}, response);

    if (status == 429)
      return onRateLimited(headers, response);

    if (status == 500 || status == 502 || status == 504) {
      if (attempt + 1 >= http->settings.maxAttempts)
        return finish(HttpError::server_error, response);

      auto wait = http->settings.retryBackoff * (1 + attempt);
      ++attempt;

      std::cerr << "[Http] " << request.method_string() << ' ' << request.target()
        << " returned " << status << ", retrying in " << wait.count() << "ms\n";

      timer.expires_after(wait);
      timer.async_wait(
          [self = shared_from_this()](const beast::error_code& ec) {
            if (ec || self->done)
              return;

            self->next();
          });
      return;
    }

    finish(classify_status(status), response);
  }

  void onRateLimited(const RateLimitHeaders& headers, const Response& response) {
    if (++rateLimited > http->settings.maxRateLimitRetries)
      return finish(HttpError::http_error, response);

    auto seconds = retryAfter(response, headers);
    auto wait = std::chrono::duration_cast<Bucket::clock::duration>(std::chrono::duration<double>(seconds));
    const bool globalLimit = headers.global && globalBody(response);

    std::cerr << "[Http] Rate limited on " << routeKey << (globalLimit ? " (global)" : "")
      << ", retrying in " << seconds << "s\n";

    if (globalLimit) {
      http->gate.closeFor(wait);
      if (global)
        return next();
    }

    timer.expires_after(wait);
    timer.async_wait(
        [self = shared_from_this()](const beast::error_code& ec) {
          if (ec || self->done)
            return;

          self->next();
        });
  }

  void finish(const beast::error_code& ec, const Response& response) {
    if (done)
      return;

    done = true;
    timer.cancel();

    if (holding && !http->stopped) {
      if (bucket->exhausted())
        bucket->releaseLater();
      else
        bucket->release();
    }
    holding = false;

    auto self = shared_from_this();
    http->calls.erase(self);

    asio::post(http->strand, [handler = std::move(handler), ec, response] {
      handler(ec, response);
    });
  }
};

Http::Http(asio::any_io_executor ex, HttpSettings s, std::shared_ptr<Transport> t)
  : strand(asio::make_strand(ex))
  , settings(std::move(s))
  , transport(std::move(t))
  , registry(std::make_shared<BucketRegistry>(strand))
  , gate(strand)
{}

void Http::request(const Route& route, Handler handler) {
  request(route, nullptr, std::move(handler));
}

void Http::request(const Route& route, const json::value& body, Handler handler) {
  auto prepared = prepare(route, body);

  asio::dispatch(strand,
      [self = shared_from_this(), prepared = std::move(prepared), key = route.key(),
       major = route.major(), global = route.global, handler = std::move(handler)]() mutable {
        if (self->stopped) {
          asio::post(self->strand, [handler = std::move(handler)] {
            handler(asio::error::operation_aborted, {});
          });
          return;
        }

        auto call = std::make_shared<Call>(self, std::move(prepared), std::move(key),
            std::move(major), global, std::move(handler));
        self->calls.insert(call);
        call->start();
      });
}

void Http::getGatewayBot(GatewayHandler handler) {
  request(Route{ http::verb::get, "/gateway/bot" },
      [handler = std::move(handler)](const beast::error_code& ec, const Response& response) {
        if (ec)
          return handler(ec, {});

        std::optional<GatewayBot> gateway;
        try {
          gateway = json::value_to<GatewayBot>(response.data);
        } catch (const std::exception& e) {
          std::cerr << "[Http] Unexpected gateway payload: " << e.what() << '\n';
        }

        if (!gateway)
          return handler(HttpError::invalid_payload, {});

        handler({}, *gateway);
      });
}

void Http::shutdown() {
  asio::dispatch(strand, [self = shared_from_this()] {
    if (self->stopped)
      return;

    self->stopped = true;

    auto pending = std::move(self->calls);
    self->calls.clear();
    for (auto& call: pending)
      call->cancel();

    self->registry->cancel();
    self->gate.cancel();
  });
}

HttpRequest Http::prepare(const Route& route, const json::value& body) const {
  HttpRequest request{ route.method, "/api/v" + std::to_string(settings.version) + route.target(), 11 };
  request.set(http::field::host, settings.host);
  request.set(http::field::user_agent, settings.userAgent);
  request.set(http::field::authorization, "Bot " + settings.token);

  if (!body.is_null()) {
    request.set(http::field::content_type, "application/json");
    request.body() = json::serialize(body);
  }

  request.prepare_payload();
  return request;
}

} // namespace discord

} // namespace relay
