#pragma once

#include "common.hpp"

#include <zlib.h>

namespace relay {

namespace test {

// Runs `io` in short slices until `pred` holds or `timeout` passes.
template <class Pred>
bool runUntil(asio::io_context& io, Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;

    io.restart();
    io.run_for(std::chrono::milliseconds(5));
  }
  return true;
}

inline void runFor(asio::io_context& io, std::chrono::milliseconds duration) {
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < deadline) {
    io.restart();
    io.run_for(std::chrono::milliseconds(5));
  }
}

// One zlib stream, flushed with Z_SYNC_FLUSH after every message.
class Deflater {
  z_stream stream{};

public:
  Deflater() { deflateInit(&stream, Z_DEFAULT_COMPRESSION); }
  ~Deflater() { deflateEnd(&stream); }

  Deflater(const Deflater&) = delete;
  Deflater& operator=(const Deflater&) = delete;

  std::string compress(const std::string& text) {
    std::string out;
    unsigned char chunk[256];

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    stream.avail_in = static_cast<uInt>(text.size());

    do {
      stream.next_out = chunk;
      stream.avail_out = sizeof(chunk);
      deflate(&stream, Z_SYNC_FLUSH);
      out.append(reinterpret_cast<const char*>(chunk), sizeof(chunk) - stream.avail_out);
    } while (stream.avail_out == 0);

    return out;
  }
};

} // namespace test

} // namespace relay
