#pragma once

#include "../common.hpp"
#include "request.hpp"
#include "route.hpp"

namespace relay {

namespace discord {

struct RateLimitHeaders {
  std::optional<int> limit;
  std::optional<int> remaining;
  std::optional<double> reset;        // epoch seconds
  std::optional<double> resetAfter;   // seconds
  std::optional<std::string> bucket;
  std::optional<std::string> scope;
  bool global{ false };
};

// Reads the X-RateLimit-* headers; malformed values are skipped.
RateLimitHeaders parseRateLimitHeaders(const http::fields& headers);

class BucketRegistry;

/*
 * One rate limit scope. The bucket is a FIFO lock: at most one request holds
 * it, and a bucket whose window is exhausted keeps it held until the window
 * resets. Every member runs on the executor the bucket was built with.
 */
class Bucket : public std::enable_shared_from_this<Bucket> {
public:
  using clock = std::chrono::steady_clock;
  using Waiter = std::function<void(const beast::error_code& ec)>;

private:
  friend class BucketRegistry;

  asio::any_io_executor ex;
  std::weak_ptr<BucketRegistry> registry;
  std::string routeKey;
  MajorParameters majorParameters;
  std::string key;
  std::string id;

  std::optional<int> limit;
  std::optional<int> remaining;
  clock::time_point resetAt{};

  bool locked{ false };
  std::deque<Waiter> waiters;
  std::shared_ptr<Bucket> merged;
  asio::steady_timer releaseTimer;
  asio::steady_timer expiryTimer;

public:
  Bucket(asio::any_io_executor ex, std::weak_ptr<BucketRegistry> registry,
      std::string routeKey, MajorParameters major, std::string key);

  // Completes once the caller holds the bucket.
  void acquire(Waiter waiter);

  // Hands the bucket to the next waiter, or unlocks it.
  void release();

  // Keeps the bucket held until the current window resets, then releases it.
  void releaseLater();

  void update(const RateLimitHeaders& headers);

  // Time left until the current window resets.
  clock::duration delay() const;

  bool exhausted() const { return remaining && *remaining == 0; }

  // Fails every waiter with operation_aborted and stops the timers.
  void cancel();

  const std::string& getKey() const { return key; }
  const std::string& getId() const { return id; }
  std::optional<int> getLimit() const { return limit; }
  std::optional<int> getRemaining() const { return remaining; }
  bool isLocked() const { return locked; }

  // The bucket this one was merged into once its id turned out to be tracked already.
  std::shared_ptr<Bucket> successor() const { return merged; }
  std::size_t waiting() const { return waiters.size(); }

private:
  void scheduleExpiry();
  void expire();
};

/*
 * All live buckets, keyed by `<scope>|<major parameters>`. The scope is the
 * bucket id the server disclosed for the route, or the route key until then.
 */
class BucketRegistry : public std::enable_shared_from_this<BucketRegistry> {
  asio::any_io_executor ex;
  std::unordered_map<std::string, std::shared_ptr<Bucket>> buckets;
  std::unordered_map<std::string, std::string> routeBuckets;

public:
  explicit BucketRegistry(asio::any_io_executor ex)
    : ex(std::move(ex))
  {}

  static std::string makeKey(const std::string& scope, const MajorParameters& major);

  // A bucket still running under the route key serves the route until it learns its id.
  std::shared_ptr<Bucket> resolve(const std::string& routeKey, const MajorParameters& major);

  /*
   * Records the bucket id the server reported for the bucket's route. On the
   * first disclosure the bucket moves under its real key; it keeps its lock
   * and waiters. When another bucket already serves that key, an idle one is
   * replaced; a busy one takes over the waiters and this bucket is retired.
   */
  void learn(Bucket& bucket, const std::string& id);

  void erase(const std::string& key, const Bucket* bucket);

  void cancel();

  std::shared_ptr<Bucket> find(const std::string& key) const;
  std::optional<std::string> bucketFor(const std::string& routeKey) const;
  std::size_t size() const { return buckets.size(); }
};

} // namespace discord

} // namespace relay
