#include "route.hpp"

namespace relay {

namespace discord {

std::string MajorParameters::str() const {
  return channelId + '/' + guildId + '/' + webhookId + '/' + webhookToken;
}

std::string Route::key() const {
  auto verb = http::to_string(method);
  std::string key(verb.data(), verb.size());
  key += ' ';
  key += path;
  return key;
}

std::string Route::target() const {
  std::string result;
  result.reserve(path.size());

  std::size_t pos = 0;
  while (pos < path.size()) {
    auto open = path.find('{', pos);
    if (open == std::string::npos) {
      result.append(path, pos, std::string::npos);
      break;
    }

    auto close = path.find('}', open);
    if (close == std::string::npos)
      throw std::invalid_argument("unterminated parameter in route " + path);

    result.append(path, pos, open - pos);

    auto name = path.substr(open + 1, close - open - 1);
    auto it = params.find(name);
    if (it == params.end())
      throw std::invalid_argument("missing parameter `" + name + "` for route " + path);

    result += it->second;
    pos = close + 1;
  }

  return result;
}

MajorParameters Route::major() const {
  auto get = [this](const char* name) {
    auto it = params.find(name);
    return it == params.end() ? std::string{} : it->second;
  };

  return { get("channel_id"), get("guild_id"), get("webhook_id"), get("webhook_token") };
}

} // namespace discord

} // namespace relay
