#pragma once

#include <chrono>

namespace relay {

namespace discord {

/*
 * Fixed-window limiter for frames sent on one gateway connection: at most
 * `amount` frames per `period`.
 */
class SendLimiter {
public:
  using clock = std::chrono::steady_clock;

private:
  clock::time_point windowStart{};
  int count{ 0 };
  int limit;
  clock::duration period;

public:
  explicit SendLimiter(int amount = 120, clock::duration period = std::chrono::seconds(60))
    : limit(amount)
    , period(period)
  {}

  /*
   * Claims a slot at `now`. Returns zero when the frame may go out
   * immediately, otherwise how long to wait before asking again.
   */
  clock::duration acquire(clock::time_point now = clock::now());

  int sent() const { return count; }
  int amount() const { return limit; }
};

} // namespace discord

} // namespace relay
