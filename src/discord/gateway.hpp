#pragma once

#include "../common.hpp"

namespace relay {

namespace discord {

enum class OpCode {
  Dispatch            = 0,
  Heartbeat           = 1,
  Identify            = 2,
  PresenceUpdate      = 3,
  VoiceStateUpdate    = 4,
  Resume              = 6,
  Reconnect           = 7,
  RequestGuildMembers = 8,
  InvalidSession      = 9,
  Hello               = 10,
  HeartbeatAck        = 11,
};

OpCode tag_invoke(json::value_to_tag<OpCode>, const json::value& jv);

const std::uint32_t GUILDS                    = 1 << 0;
const std::uint32_t GUILD_MEMBERS             = 1 << 1;
const std::uint32_t GUILD_BANS                = 1 << 2;
const std::uint32_t GUILD_EMOJIS              = 1 << 3;
const std::uint32_t GUILD_INTEGRATIONS        = 1 << 4;
const std::uint32_t GUILD_WEBHOOKS            = 1 << 5;
const std::uint32_t GUILD_INVITES             = 1 << 6;
const std::uint32_t GUILD_VOICE_STATES        = 1 << 7;
const std::uint32_t GUILD_PRESENCES           = 1 << 8;
const std::uint32_t GUILD_MESSAGES            = 1 << 9;
const std::uint32_t GUILD_MESSAGE_REACTIONS   = 1 << 10;
const std::uint32_t GUILD_MESSAGE_TYPING      = 1 << 11;
const std::uint32_t DIRECT_MESSAGES           = 1 << 12;
const std::uint32_t DIRECT_MESSAGE_REACTIONS  = 1 << 13;
const std::uint32_t DIRECT_MESSAGE_TYPING     = 1 << 14;
const std::uint32_t MESSAGE_CONTENT           = 1 << 15;

struct SessionStartLimit {
  int total;
  int remaining;
  int resetAfter;
  int maxConcurrency;
};

// Result of GET /gateway/bot.
struct GatewayBot {
  std::string url;
  int shards;
  SessionStartLimit sessionStartLimit;
};

SessionStartLimit tag_invoke(json::value_to_tag<SessionStartLimit>, const json::value& jv);
GatewayBot tag_invoke(json::value_to_tag<GatewayBot>, const json::value& jv);

// One decoded protocol frame: {op, d, s, t}.
struct Frame {
  OpCode op;
  json::value d;
  std::optional<std::int64_t> s;
  std::optional<std::string> t;
};

Frame tag_invoke(json::value_to_tag<Frame>, const json::value& jv);

// What the consumer of a session receives for each dispatch frame.
struct Dispatch {
  std::string type;
  json::value data;
  std::int64_t sequence;
};

struct Url {
  std::string host;
  std::string port;
  std::string target;
};

/*
 * Splits `wss://host[:port][/path][?query]`. The scheme is optional, the
 * port defaults to 443 and the target to "/".
 */
Url parseUrl(const std::string& url);

// Appends the version, encoding and optional zlib-stream query to a gateway url.
std::string gatewayUrl(const std::string& base, int version, bool transportCompression);

} // namespace discord

} // namespace relay
