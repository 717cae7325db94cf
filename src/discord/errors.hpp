#pragma once

#include "../common.hpp"

namespace relay {

namespace discord {

enum class HttpError {
  bad_request = 1,
  unauthorized,
  forbidden,
  not_found,
  method_not_allowed,
  server_error,
  http_error,
  invalid_payload,
};

enum class GatewayError {
  invalid_session = 1,
  decode_failed,
  unknown_message,
  reconnect_failed,
};

const boost::system::error_category& http_category();
const boost::system::error_category& gateway_category();

/*
 * Websocket close codes reported by a fatal closure. The error value is the
 * close code itself.
 */
const boost::system::error_category& close_code_category();

boost::system::error_code make_error_code(HttpError e);
boost::system::error_code make_error_code(GatewayError e);
boost::system::error_code make_close_error(std::uint16_t code);

// Maps a response status onto the terminal error it would raise.
boost::system::error_code classify_status(unsigned status);

} // namespace discord

} // namespace relay

namespace boost {

namespace system {

template <>
struct is_error_code_enum<relay::discord::HttpError> : std::true_type {};

template <>
struct is_error_code_enum<relay::discord::GatewayError> : std::true_type {};

} // namespace system

} // namespace boost
