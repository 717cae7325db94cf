#include "session.hpp"
#include "errors.hpp"
#include "event.hpp"

#include <algorithm>

namespace relay {

namespace discord {

Session::Session(asio::any_io_executor ex, SessionSettings s, ConnectionFactory f)
  : strand(asio::make_strand(ex))
  , settings(std::move(s))
  , factory(std::move(f))
  , heartbeat(strand)
  , delay(strand)
  , limiter(settings.sendLimit, settings.sendPeriod)
  , sendTimer(strand)
{}

void Session::start(const std::string& gatewayUrl) {
  asio::dispatch(strand, [self = shared_from_this(), gatewayUrl] {
    if (self->state != State::Idle)
      return;

    self->url = gatewayUrl;
    self->open(gatewayUrl);
  });
}

void Session::next(DispatchHandler handler) {
  asio::dispatch(strand, [self = shared_from_this(), handler = std::move(handler)]() mutable {
    if (self->pending) {
      asio::post(self->strand, [handler = std::move(handler)] {
        handler(asio::error::already_started, {});
      });
      return;
    }

    self->pending = std::move(handler);
    self->deliver();
  });
}

void Session::requestGuildMembers(const GuildMembersRequest& request) {
  json::object data{
    { "guild_id", request.guildId },
    { "limit", request.limit },
  };

  if (request.presences)
    data["presences"] = true;
  if (request.nonce)
    data["nonce"] = *request.nonce;
  if (!request.userIds.empty()) {
    json::array ids;
    for (const auto& id: request.userIds)
      ids.emplace_back(id);
    data["user_ids"] = std::move(ids);
  }
  if (request.query)
    data["query"] = *request.query;
  else if (request.userIds.empty())
    data["query"] = "";

  asio::dispatch(strand, [self = shared_from_this(), data = std::move(data)] {
    if (self->state != State::Ready) {
      std::cerr << "[Gateway] Session is not ready, dropping guild members request\n";
      return;
    }

    self->send(OpCode::RequestGuildMembers, data);
  });
}

void Session::close() {
  asio::dispatch(strand, [self = shared_from_this()] {
    if (self->state == State::Closed)
      return;

    std::cout << "[Gateway] Closing session\n";
    self->fail(asio::error::operation_aborted, true);
  });
}

void Session::open(const std::string& target) {
  ++generation;

  heartbeat.cancel();
  delay.cancel();
  sendTimer.cancel();
  writeQueue.clear();
  writing = false;
  limiter = SendLimiter(settings.sendLimit, settings.sendPeriod);
  codec = std::make_unique<FrameCodec>();
  lastHeartbeatAcked = true;
  state = State::Connecting;

  socket = factory();
  socket->connect(target,
      [self = shared_from_this(), gen = generation](const beast::error_code& ec) {
        asio::post(self->strand, [self, gen, ec] { self->onConnect(gen, ec); });
      });
}

void Session::reconnect(bool closeSocket) {
  heartbeat.cancel();
  delay.cancel();

  auto old = std::move(socket);
  auto gen = ++generation;

  if (closeSocket && old)
    old->close(settings.resumeCloseCode, [old](const beast::error_code&) {});

  if (state != State::Ready)
    ++failedConnects;

  if (failedConnects > settings.maxReconnectAttempts)
    return fail(GatewayError::reconnect_failed, false);

  const bool resuming = canResume();
  const auto& target = resuming && !resumeUrl.empty() ? resumeUrl : url;

  std::cout << "[Gateway] Reconnecting to " << (resuming ? "resume" : "identify")
    << " [attempt: " << failedConnects << "]\n";

  state = State::Connecting;

  if (failedConnects == 0)
    return open(target);

  auto wait = settings.reconnectDelay * (1 << std::min(failedConnects - 1, 16));
  delay.expires_after(std::min<std::chrono::milliseconds>(wait, settings.maxReconnectDelay));
  delay.async_wait(
      [self = shared_from_this(), gen, target](const beast::error_code& ec) {
        if (ec || gen != self->generation || self->state == State::Closed)
          return;

        self->open(target);
      });
}

void Session::fail(const beast::error_code& ec, bool closeSocket) {
  if (state == State::Closed)
    return;

  if (ec != asio::error::operation_aborted)
    std::cerr << "[Gateway] Session failed: " << ec.message() << '\n';

  state = State::Closed;
  fatal = ec;
  ++generation;

  heartbeat.cancel();
  delay.cancel();
  sendTimer.cancel();
  writeQueue.clear();

  if (closeSocket && socket)
    socket->close(static_cast<std::uint16_t>(ws::close_code::normal),
        [socket = socket](const beast::error_code&) {});

  deliver();
}

bool Session::canResume() const {
  return sessionId.has_value() && sequence.has_value();
}

void Session::onConnect(std::uint64_t gen, const beast::error_code& ec) {
  if (gen != generation || state == State::Closed)
    return;

  if (ec) {
    std::cerr << "[Gateway] Connect failed: " << ec.message() << '\n';
    return reconnect(false);
  }

  state = State::AwaitingHello;
  doRead(gen);
}

void Session::doRead(std::uint64_t gen) {
  socket->read(
      [self = shared_from_this(), gen](const beast::error_code& ec, std::string payload, bool binary) {
        asio::post(self->strand, [self, gen, ec, payload = std::move(payload), binary] {
          self->onRead(gen, ec, payload, binary);
        });
      });
}

void Session::onRead(std::uint64_t gen, const beast::error_code& ec, const std::string& payload, bool binary) {
  if (gen != generation || state == State::Closed)
    return;

  if (ec)
    return onClosed(ec);

  beast::error_code decodeError;
  auto value = codec->feed(payload, binary, decodeError);
  if (decodeError)
    return fail(decodeError, true);

  if (value)
    handleFrame(*value);

  if (gen == generation && state != State::Closed)
    doRead(gen);
}

void Session::onClosed(const beast::error_code& ec) {
  auto code = socket->closeCode();

  std::cerr << "[Gateway] Connection closed [code: " << code << "]: " << ec.message() << '\n';

  if (settings.fatalCloseCodes.count(code))
    return fail(make_close_error(code), false);

  reconnect(false);
}

void Session::handleFrame(const json::value& value) {
  try {
    const auto& object = value.as_object();
    if (!object.contains("op"))
      return fail(GatewayError::unknown_message, true);

    auto frame = json::value_to<Frame>(value);

    if (frame.s)
      sequence = *frame.s;

    switch (frame.op) {
      case OpCode::Dispatch: {
        onDispatch(frame);
      } break;
      case OpCode::Heartbeat: {
        sendHeartbeat();
      } break;
      case OpCode::Reconnect: {
        std::cout << "[Gateway] Reconnect requested\n";
        reconnect(true);
      } break;
      case OpCode::InvalidSession: {
        onInvalidSession(frame.d.is_bool() && frame.d.get_bool());
      } break;
      case OpCode::Hello: {
        onHello(frame.d);
      } break;
      case OpCode::HeartbeatAck: {
        lastHeartbeatAcked = true;
      } break;
      default: {
        std::cout << "[Gateway] Unexpected opcode: " << static_cast<int>(frame.op)
          << ", payload: " << value << '\n';
      } break;
    }
  } catch (const std::exception& e) {
    std::cerr << "[Gateway] Malformed frame: " << e.what() << ", payload: " << value << '\n';
    fail(GatewayError::decode_failed, true);
  }
}

void Session::onDispatch(const Frame& frame) {
  std::string type = frame.t.value_or("");

  switch (toEvent(type)) {
    case Event::Ready: {
      const auto& data = frame.d.as_object();
      sessionId = json::value_to<std::string>(data.at("session_id"));

      std::optional<std::string> resume;
      extract_optional(data, resume, "resume_gateway_url");
      if (resume)
        resumeUrl = gatewayUrl(*resume, settings.version, settings.transportCompression);

      state = State::Ready;
      failedConnects = 0;
      std::cout << "[Gateway] Ready [session: " << *sessionId << "]\n";
    } break;
    case Event::Resumed: {
      state = State::Ready;
      failedConnects = 0;
      std::cout << "[Gateway] Resumed [sequence: " << sequence.value_or(-1) << "]\n";
    } break;
    default:
      break;
  }

  received.push_back(Dispatch{ std::move(type), frame.d, frame.s.value_or(sequence.value_or(0)) });
  deliver();
}

void Session::onInvalidSession(bool resumable) {
  if (resumable && canResume()) {
    std::cout << "[Gateway] Invalid session, resuming\n";
    return reconnect(true);
  }

  if (state == State::Identifying)
    return fail(GatewayError::invalid_session, true);

  std::cout << "[Gateway] Invalid session, identifying again\n";

  sessionId.reset();
  sequence.reset();
  resumeUrl.clear();

  std::uniform_int_distribution<std::int64_t> jitter(
      settings.invalidSessionDelayMin.count(),
      std::max(settings.invalidSessionDelayMin, settings.invalidSessionDelayMax).count());

  delay.expires_after(std::chrono::milliseconds(jitter(rng)));
  delay.async_wait(
      [self = shared_from_this(), gen = generation](const beast::error_code& ec) {
        if (ec || gen != self->generation || self->state == State::Closed)
          return;

        self->sendIdentify();
      });
}

void Session::onHello(const json::value& data) {
  heartbeatInterval = std::chrono::milliseconds(
      json::value_to<std::int64_t>(data.at("heartbeat_interval")));

  std::cout << "[Gateway] Hello [heartbeat interval: " << heartbeatInterval.count() << "ms]\n";

  std::uniform_real_distribution<double> fraction(0.0, 1.0);
  auto first = std::chrono::duration_cast<std::chrono::milliseconds>(heartbeatInterval * fraction(rng));

  heartbeat.cancel();
  lastHeartbeatAcked = true;
  heartbeat.expires_after(first);
  heartbeat.async_wait(
      [self = shared_from_this(), gen = generation](const beast::error_code& ec) {
        self->onHeartbeat(gen, ec);
      });

  if (canResume())
    sendResume();
  else
    sendIdentify();
}

void Session::onHeartbeat(std::uint64_t gen, const beast::error_code& ec) {
  if (ec || gen != generation || state == State::Closed)
    return;

  if (!lastHeartbeatAcked) {
    std::cerr << "[Gateway] Heartbeat was not acknowledged, reconnecting\n";
    return reconnect(true);
  }

  lastHeartbeatAcked = false;
  sendHeartbeat();

  heartbeat.expires_at(heartbeat.expiry() + heartbeatInterval);
  heartbeat.async_wait(
      [self = shared_from_this(), gen](const beast::error_code& ec) {
        self->onHeartbeat(gen, ec);
      });
}

void Session::sendHeartbeat() {
  if (sequence)
    send(OpCode::Heartbeat, *sequence);
  else
    send(OpCode::Heartbeat, nullptr);
}

void Session::sendIdentify() {
  json::object data{
    { "token", settings.token },
    { "properties", {
      { "os", settings.os },
      { "browser", settings.browser },
      { "device", settings.device }
    }},
    { "compress", settings.compress },
    { "large_threshold", settings.largeThreshold },
    { "intents", settings.intents }
  };

  if (settings.shard)
    data["shard"] = json::array{ settings.shard->id, settings.shard->count };

  std::cout << "[Gateway] Identifying\n";

  state = State::Identifying;
  send(OpCode::Identify, data);
}

void Session::sendResume() {
  json::object data{
    { "token", settings.token },
    { "session_id", *sessionId },
    { "seq", *sequence }
  };

  std::cout << "[Gateway] Resuming [sequence: " << *sequence << "]\n";

  state = State::Resuming;
  send(OpCode::Resume, data);
}

void Session::send(OpCode op, const json::value& data) {
  json::object payload{
    { "op", static_cast<int>(op) },
    { "d", data }
  };

  writeQueue.push_back(json::serialize(payload));

  if (!writing)
    doWrite();
}

void Session::doWrite() {
  if (writeQueue.empty() || !socket) {
    writing = false;
    return;
  }

  writing = true;

  auto wait = limiter.acquire();
  if (wait > SendLimiter::clock::duration::zero()) {
    sendTimer.expires_after(wait);
    sendTimer.async_wait(
        [self = shared_from_this(), gen = generation](const beast::error_code& ec) {
          if (ec || gen != self->generation)
            return;

          self->doWrite();
        });
    return;
  }

  socket->write(writeQueue.front(),
      [self = shared_from_this(), gen = generation](const beast::error_code& ec) {
        asio::post(self->strand, [self, gen, ec] { self->onWrite(gen, ec); });
      });
}

void Session::onWrite(std::uint64_t gen, const beast::error_code& ec) {
  if (gen != generation)
    return;

  writing = false;

  if (ec) {
    std::cerr << "[Gateway] Write failed: " << ec.message() << '\n';
    return;
  }

  writeQueue.pop_front();

  if (!writeQueue.empty())
    doWrite();
}

void Session::deliver() {
  if (!pending)
    return;

  if (!received.empty()) {
    auto handler = std::move(pending);
    pending = nullptr;
    asio::post(strand,
        [handler = std::move(handler), dispatch = std::move(received.front())]() mutable {
          handler({}, std::move(dispatch));
        });
    received.pop_front();
    return;
  }

  if (fatal) {
    auto handler = std::move(pending);
    pending = nullptr;
    asio::post(strand, [handler = std::move(handler), ec = fatal] {
      handler(ec, {});
    });
  }
}

} // namespace discord

} // namespace relay
