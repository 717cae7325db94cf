#pragma once

#include "../common.hpp"

#include <zlib.h>

namespace relay {

namespace discord {

/*
 * Turns inbound websocket messages into JSON frames.
 *
 * Binary messages are pieces of a single zlib stream that spans the whole
 * connection. They are buffered until the buffer ends in the Z_SYNC_FLUSH
 * marker (00 00 FF FF), then inflated through the connection-wide context.
 * Text messages are parsed as they are.
 */
class FrameCodec {
  z_stream stream{};
  std::string buffer;
  std::string output;
  bool initialized{ false };

public:
  static constexpr std::string_view Marker{ "\x00\x00\xff\xff", 4 };

  FrameCodec();
  ~FrameCodec();

  FrameCodec(const FrameCodec&) = delete;
  FrameCodec& operator=(const FrameCodec&) = delete;

  /*
   * Returns the decoded frame once a complete unit is available, nothing while
   * a compressed message is still partial. Any failure sets `ec` to
   * GatewayError::decode_failed; the codec is unusable afterwards.
   */
  std::optional<json::value> feed(std::string_view chunk, bool binary, beast::error_code& ec);

  std::size_t buffered() const { return buffer.size(); }

private:
  bool decompress(beast::error_code& ec);
  std::optional<json::value> parse(std::string_view text, beast::error_code& ec);
};

} // namespace discord

} // namespace relay
