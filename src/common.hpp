#pragma once

#include <cstdint>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/bind/bind.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>

namespace relay {

  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace http  = beast::http;
  namespace ssl   = asio::ssl;
  namespace ws    = beast::websocket;
  namespace json  = boost::json;

  using tcp = asio::ip::tcp;

  template <class T>
    void extract(const json::object& object, T& t, json::string_view key) {
      t = json::value_to<T>(object.at(key));
    }

  template <class T>
    void extract_maybe(const json::object& object, T& t, json::string_view key, T default_ = T()) {
      if (object.count(key) && !object.at(key).is_null())
        t = json::value_to<T>(object.at(key));
      else
        t = default_;
    }

  template <class T>
    void extract_optional(const json::object& object, std::optional<T>& t, json::string_view key) {
      auto it = object.find(key);
      if (it != object.end() && !it->value().is_null())
        t = std::make_optional<T>(json::value_to<T>(it->value()));
      else
        t.reset();
    }

} // namespace relay
