#include "send_limiter.hpp"

namespace relay {

namespace discord {

SendLimiter::clock::duration SendLimiter::acquire(clock::time_point now) {
  if (count == 0 || windowStart + period <= now) {
    windowStart = now;
    count = 0;
  }

  if (count >= limit)
    return windowStart + period - now;

  ++count;
  return clock::duration::zero();
}

} // namespace discord

} // namespace relay
