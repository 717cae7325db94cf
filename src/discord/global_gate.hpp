#pragma once

#include "../common.hpp"

namespace relay {

namespace discord {

/*
 * Process-wide signal raised by a global 429. While it is closed every bucket
 * holds its next request back; reopening wakes them all at once.
 */
class GlobalGate {
public:
  using clock = std::chrono::steady_clock;
  using Waiter = std::function<void(const beast::error_code& ec)>;

private:
  asio::any_io_executor ex;
  asio::steady_timer timer;
  bool closed{ false };
  clock::time_point until{};
  std::vector<Waiter> waiters;

public:
  explicit GlobalGate(asio::any_io_executor ex)
    : ex(ex)
    , timer(ex)
  {}

  bool isClosed() const { return closed; }

  // Closes the gate for `duration`; an already longer closure is kept.
  void closeFor(clock::duration duration);

  // Completes right away while open, otherwise once the gate reopens.
  void wait(Waiter waiter);

  void cancel();

private:
  void open();
};

} // namespace discord

} // namespace relay
