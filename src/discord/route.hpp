#pragma once

#include "../common.hpp"

#include <map>

namespace relay {

namespace discord {

using RouteParams = std::map<std::string, std::string>;

// Path components that split one route into independent rate limit scopes.
struct MajorParameters {
  std::string channelId;
  std::string guildId;
  std::string webhookId;
  std::string webhookToken;

  std::string str() const;
};

/*
 * A REST call before substitution, e.g.
 * Route{ http::verb::post, "/channels/{channel_id}/messages", {{ "channel_id", "42" }} }
 */
struct Route {
  http::verb method;
  std::string path;
  RouteParams params;
  // Interaction callbacks and similar routes are exempt from the global limit.
  bool global{ true };

  Route(http::verb method, std::string path, RouteParams params = {})
    : method(method)
    , path(std::move(path))
    , params(std::move(params))
  {}

  // Method plus path template; identifies the route independently of its parameters.
  std::string key() const;

  // Path with every `{name}` replaced. Throws std::invalid_argument on a missing parameter.
  std::string target() const;

  MajorParameters major() const;
};

} // namespace discord

} // namespace relay
