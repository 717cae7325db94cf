#pragma once

#include <cstdint>
#include <string>

namespace relay {

namespace discord {

/*
 * https://gist.github.com/Lee-R/3839813
 */

namespace detail {

  constexpr std::uint32_t fnv1a_32(char const* s, std::size_t count) {
    return ((count ? fnv1a_32(s, count - 1) : 2166136261u) ^ s[count]) * 16777619u;
  }

} // namespace detail

constexpr std::uint32_t operator"" _hash(char const* s, std::size_t count) {
  return detail::fnv1a_32(s, count);
}

inline std::uint32_t fnv1a_32(const std::string& s) {
  return detail::fnv1a_32(s.c_str(), s.length());
}

// Dispatch types the client itself reacts to.
enum class Event: std::uint32_t {
  Ready         = "READY"_hash,
  Resumed       = "RESUMED"_hash,
};

inline Event toEvent(const std::string& type) {
  return static_cast<Event>(fnv1a_32(type));
}

} // namespace discord

} // namespace relay
