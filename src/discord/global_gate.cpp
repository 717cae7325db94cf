#include "global_gate.hpp"

namespace relay {

namespace discord {

void GlobalGate::closeFor(clock::duration duration) {
  auto deadline = clock::now() + duration;
  if (closed && deadline <= until)
    return;

  std::cerr << "[Http] Global rate limit hit, pausing all requests for "
    << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count() << "ms\n";

  closed = true;
  until = deadline;

  timer.expires_at(until);
  timer.async_wait(
      [this](const beast::error_code& ec) {
        if (ec)
          return;

        open();
      });
}

void GlobalGate::wait(Waiter waiter) {
  if (!closed) {
    asio::post(ex, [waiter = std::move(waiter)] { waiter({}); });
    return;
  }

  waiters.push_back(std::move(waiter));
}

void GlobalGate::cancel() {
  timer.cancel();
  closed = false;

  auto pending = std::move(waiters);
  waiters.clear();
  for (auto& waiter: pending)
    asio::post(ex, [waiter = std::move(waiter)] { waiter(asio::error::operation_aborted); });
}

void GlobalGate::open() {
  closed = false;

  auto pending = std::move(waiters);
  waiters.clear();
  for (auto& waiter: pending)
    asio::post(ex, [waiter = std::move(waiter)] { waiter({}); });
}

} // namespace discord

} // namespace relay
