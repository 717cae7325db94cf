#pragma once

#include "../common.hpp"
#include "connection.hpp"
#include "frame_codec.hpp"
#include "gateway.hpp"
#include "send_limiter.hpp"

#include <random>
#include <set>

namespace relay {

namespace discord {

struct Shard {
  int id;
  int count;
};

struct SessionSettings {
  std::string token;
  std::uint32_t intents{ GUILDS | GUILD_MESSAGES | DIRECT_MESSAGES };
  std::optional<Shard> shard;
  int largeThreshold{ 250 };
  bool compress{ false };
  bool transportCompression{ true };
  int version{ 10 };

  std::string os{ "linux" };
  std::string browser{ "relay" };
  std::string device{ "relay" };

  // Closures with these codes are never retried.
  std::set<std::uint16_t> fatalCloseCodes{ 4004, 4010, 4011, 4012, 4013, 4014 };
  // Must not be 1000 or 1001, those end the session server side.
  std::uint16_t resumeCloseCode{ 4000 };

  std::chrono::milliseconds invalidSessionDelayMin{ 1000 };
  std::chrono::milliseconds invalidSessionDelayMax{ 5000 };
  std::chrono::milliseconds reconnectDelay{ 1000 };
  std::chrono::milliseconds maxReconnectDelay{ 60000 };
  int maxReconnectAttempts{ 5 };

  int sendLimit{ 120 };
  std::chrono::milliseconds sendPeriod{ 60000 };
};

struct GuildMembersRequest {
  std::string guildId;
  int limit{ 0 };
  bool presences{ false };
  std::optional<std::string> nonce;
  std::vector<std::string> userIds;
  std::optional<std::string> query;
};

/*
 * A gateway session: owns the live socket, runs the heartbeat, answers the
 * control opcodes and resumes or re-identifies across reconnects. Dispatch
 * frames are handed out one at a time through next(), in the order they
 * were received.
 *
 * A session that reached Closed is never restarted; build a new one.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
  enum class State {
    Idle,
    Connecting,
    AwaitingHello,
    Identifying,
    Resuming,
    Ready,
    Closed,
  };

  using DispatchHandler = std::function<void(const beast::error_code& ec, Dispatch dispatch)>;

private:
  asio::strand<asio::any_io_executor> strand;
  SessionSettings settings;
  ConnectionFactory factory;

  std::shared_ptr<Connection> socket;
  std::unique_ptr<FrameCodec> codec;
  std::uint64_t generation{ 0 };
  State state{ State::Idle };

  std::string url;
  std::string resumeUrl;
  std::optional<std::int64_t> sequence;
  std::optional<std::string> sessionId;

  std::chrono::milliseconds heartbeatInterval{ 0 };
  bool lastHeartbeatAcked{ true };
  asio::steady_timer heartbeat;
  asio::steady_timer delay;
  int failedConnects{ 0 };

  std::deque<std::string> writeQueue;
  bool writing{ false };
  SendLimiter limiter;
  asio::steady_timer sendTimer;

  std::deque<Dispatch> received;
  DispatchHandler pending;
  beast::error_code fatal;

  std::mt19937 rng{ std::random_device{}() };

public:
  Session(asio::any_io_executor ex, SessionSettings settings, ConnectionFactory factory);

  // Connects to `gatewayUrl`, which already carries the version/encoding query.
  void start(const std::string& gatewayUrl);

  /*
   * Completes with the next dispatch frame. Once the session failed it
   * completes with the error: a `relay.close_code` error for a
   * non-resumable closure, a GatewayError otherwise, and
   * operation_aborted after close(). Only one call may be outstanding.
   */
  void next(DispatchHandler handler);

  void requestGuildMembers(const GuildMembersRequest& request);

  // Closes the socket with a normal close code and fails the pending pull.
  void close();

  // Accessors are meant for the session's own executor.
  State getState() const { return state; }
  std::optional<std::int64_t> getSequence() const { return sequence; }
  const std::optional<std::string>& getSessionId() const { return sessionId; }
  std::chrono::milliseconds getHeartbeatInterval() const { return heartbeatInterval; }

private:
  void open(const std::string& target);
  void reconnect(bool closeSocket);
  void fail(const beast::error_code& ec, bool closeSocket);
  bool canResume() const;

  void onConnect(std::uint64_t gen, const beast::error_code& ec);
  void doRead(std::uint64_t gen);
  void onRead(std::uint64_t gen, const beast::error_code& ec, const std::string& payload, bool binary);
  void onClosed(const beast::error_code& ec);

  void handleFrame(const json::value& value);
  void onDispatch(const Frame& frame);
  void onInvalidSession(bool resumable);
  void onHello(const json::value& data);
  void onHeartbeat(std::uint64_t gen, const beast::error_code& ec);

  void sendHeartbeat();
  void sendIdentify();
  void sendResume();
  void send(OpCode op, const json::value& data);
  void doWrite();
  void onWrite(std::uint64_t gen, const beast::error_code& ec);

  void deliver();
};

} // namespace discord

} // namespace relay
