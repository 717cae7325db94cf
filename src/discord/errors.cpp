#include "errors.hpp"

namespace relay {

namespace discord {

namespace {

class HttpCategory : public boost::system::error_category {
public:
  const char* name() const noexcept override {
    return "relay.http";
  }

  std::string message(int ev) const override {
    switch (static_cast<HttpError>(ev)) {
      case HttpError::bad_request:        return "bad request";
      case HttpError::unauthorized:       return "unauthorized";
      case HttpError::forbidden:          return "forbidden";
      case HttpError::not_found:          return "not found";
      case HttpError::method_not_allowed: return "method not allowed";
      case HttpError::server_error:       return "server error";
      case HttpError::http_error:         return "http error";
      case HttpError::invalid_payload:    return "invalid response payload";
    }
    return "unknown http error";
  }
};

class GatewayCategory : public boost::system::error_category {
public:
  const char* name() const noexcept override {
    return "relay.gateway";
  }

  std::string message(int ev) const override {
    switch (static_cast<GatewayError>(ev)) {
      case GatewayError::invalid_session:  return "session invalidated";
      case GatewayError::decode_failed:    return "failed to decode gateway frame";
      case GatewayError::unknown_message:  return "unknown gateway message";
      case GatewayError::reconnect_failed: return "unable to reconnect to gateway";
    }
    return "unknown gateway error";
  }
};

class CloseCodeCategory : public boost::system::error_category {
public:
  const char* name() const noexcept override {
    return "relay.close_code";
  }

  std::string message(int ev) const override {
    switch (ev) {
      case 4000: return "unknown error";
      case 4001: return "unknown opcode";
      case 4002: return "decode error";
      case 4003: return "not authenticated";
      case 4004: return "authentication failed";
      case 4005: return "already authenticated";
      case 4007: return "invalid sequence";
      case 4008: return "rate limited";
      case 4009: return "session timed out";
      case 4010: return "invalid shard";
      case 4011: return "sharding required";
      case 4012: return "invalid API version";
      case 4013: return "invalid intents";
      case 4014: return "disallowed intents";
    }
    return "gateway closed with code " + std::to_string(ev);
  }
};

} // namespace

const boost::system::error_category& http_category() {
  static const HttpCategory category;
  return category;
}

const boost::system::error_category& gateway_category() {
  static const GatewayCategory category;
  return category;
}

const boost::system::error_category& close_code_category() {
  static const CloseCodeCategory category;
  return category;
}

boost::system::error_code make_error_code(HttpError e) {
  return { static_cast<int>(e), http_category() };
}

boost::system::error_code make_error_code(GatewayError e) {
  return { static_cast<int>(e), gateway_category() };
}

boost::system::error_code make_close_error(std::uint16_t code) {
  return { static_cast<int>(code), close_code_category() };
}

boost::system::error_code classify_status(unsigned status) {
  if (status >= 200 && status < 300)
    return {};

  switch (status) {
    case 400: return HttpError::bad_request;
    case 401: return HttpError::unauthorized;
    case 403: return HttpError::forbidden;
    case 404: return HttpError::not_found;
    case 405: return HttpError::method_not_allowed;
    default: break;
  }

  if (status >= 500)
    return HttpError::server_error;

  return HttpError::http_error;
}

} // namespace discord

} // namespace relay
