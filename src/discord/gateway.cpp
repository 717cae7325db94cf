#include "gateway.hpp"

namespace relay {

namespace discord {

OpCode tag_invoke(json::value_to_tag<OpCode>, const json::value& jv) {
  return static_cast<OpCode>(json::value_to<int>(jv));
}

SessionStartLimit tag_invoke(json::value_to_tag<SessionStartLimit>, const json::value& jv) {
  SessionStartLimit s;
  const json::object& obj = jv.as_object();
  extract(obj, s.total, "total");
  extract(obj, s.remaining, "remaining");
  extract(obj, s.resetAfter, "reset_after");
  extract_maybe(obj, s.maxConcurrency, "max_concurrency", 1);
  return s;
}

GatewayBot tag_invoke(json::value_to_tag<GatewayBot>, const json::value& jv) {
  GatewayBot g;
  const json::object& obj = jv.as_object();
  extract(obj, g.url, "url");
  extract_maybe(obj, g.shards, "shards", 1);
  extract(obj, g.sessionStartLimit, "session_start_limit");
  return g;
}

Frame tag_invoke(json::value_to_tag<Frame>, const json::value& jv) {
  Frame f;
  const json::object& obj = jv.as_object();
  extract(obj, f.op, "op");
  if (auto it = obj.find("d"); it != obj.end())
    f.d = it->value();
  extract_optional(obj, f.s, "s");
  extract_optional(obj, f.t, "t");
  return f;
}

Url parseUrl(const std::string& url) {
  Url u{ "", "443", "/" };

  std::string rest = url;
  if (auto scheme = rest.find("://"); scheme != std::string::npos)
    rest = rest.substr(scheme + 3);

  auto end = rest.find_first_of("/?");
  std::string authority = rest.substr(0, end);
  if (end != std::string::npos) {
    u.target = rest.substr(end);
    if (u.target.front() == '?')
      u.target.insert(u.target.begin(), '/');
  }

  if (auto colon = authority.find(':'); colon != std::string::npos) {
    u.port = authority.substr(colon + 1);
    authority.resize(colon);
  }
  u.host = authority;

  return u;
}

std::string gatewayUrl(const std::string& base, int version, bool transportCompression) {
  std::string url = base;
  if (auto query = url.find('?'); query != std::string::npos)
    url.resize(query);
  if (url.empty() || url.back() != '/')
    url += '/';

  url += "?v=" + std::to_string(version) + "&encoding=json";
  if (transportCompression)
    url += "&compress=zlib-stream";
  return url;
}

} // namespace discord

} // namespace relay
