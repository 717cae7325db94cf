#include "frame_codec.hpp"
#include "errors.hpp"

#include <array>

namespace relay {

namespace discord {

FrameCodec::FrameCodec() {
  initialized = inflateInit(&stream) == Z_OK;
}

FrameCodec::~FrameCodec() {
  if (initialized)
    inflateEnd(&stream);
}

std::optional<json::value> FrameCodec::feed(std::string_view chunk, bool binary, beast::error_code& ec) {
  ec = {};

  if (!binary)
    return parse(chunk, ec);

  buffer.append(chunk.data(), chunk.size());

  if (buffer.size() < Marker.size() ||
      std::string_view{ buffer }.substr(buffer.size() - Marker.size()) != Marker)
    return std::nullopt;

  if (!decompress(ec))
    return std::nullopt;

  buffer.clear();

  std::string text;
  text.swap(output);
  return parse(text, ec);
}

bool FrameCodec::decompress(beast::error_code& ec) {
  if (!initialized) {
    ec = GatewayError::decode_failed;
    return false;
  }

  std::array<unsigned char, 16 * 1024> chunk;

  stream.next_in  = reinterpret_cast<Bytef*>(buffer.data());
  stream.avail_in = static_cast<uInt>(buffer.size());

  do {
    stream.next_out  = chunk.data();
    stream.avail_out = static_cast<uInt>(chunk.size());

    int rc = ::inflate(&stream, Z_SYNC_FLUSH);
    if (rc != Z_OK && rc != Z_BUF_ERROR && rc != Z_STREAM_END) {
      std::cerr << "[Gateway] Inflate failed: "
        << (stream.msg ? stream.msg : "zlib error " + std::to_string(rc)) << '\n';
      ec = GatewayError::decode_failed;
      return false;
    }

    output.append(reinterpret_cast<const char*>(chunk.data()), chunk.size() - stream.avail_out);

    if (rc == Z_BUF_ERROR || rc == Z_STREAM_END)
      break;
  } while (stream.avail_out == 0 || stream.avail_in > 0);

  return true;
}

std::optional<json::value> FrameCodec::parse(std::string_view text, beast::error_code& ec) {
  auto value = json::parse(json::string_view{ text.data(), text.size() }, ec);
  if (ec) {
    std::cerr << "[Gateway] Failed to parse frame: " << ec.message() << '\n';
    ec = GatewayError::decode_failed;
    return std::nullopt;
  }

  return value;
}

} // namespace discord

} // namespace relay
