#include "bucket.hpp"

namespace relay {

namespace discord {

namespace {

template <class T>
std::optional<T> header(const http::fields& headers, const char* name) {
  auto it = headers.find(name);
  if (it == headers.end())
    return std::nullopt;

  T value;
  if (!boost::conversion::try_lexical_convert(it->value().data(), it->value().size(), value)) {
    std::cerr << "[Http] Ignoring malformed header " << name << ": " << it->value() << '\n';
    return std::nullopt;
  }
  return value;
}

template <>
std::optional<std::string> header<std::string>(const http::fields& headers, const char* name) {
  auto it = headers.find(name);
  if (it == headers.end())
    return std::nullopt;
  return std::string(it->value().data(), it->value().size());
}

} // namespace

RateLimitHeaders parseRateLimitHeaders(const http::fields& headers) {
  RateLimitHeaders h;
  h.limit = header<int>(headers, "X-RateLimit-Limit");
  h.remaining = header<int>(headers, "X-RateLimit-Remaining");
  h.reset = header<double>(headers, "X-RateLimit-Reset");
  h.resetAfter = header<double>(headers, "X-RateLimit-Reset-After");
  h.bucket = header<std::string>(headers, "X-RateLimit-Bucket");
  h.scope = header<std::string>(headers, "X-RateLimit-Scope");
  h.global = headers.find("X-RateLimit-Global") != headers.end();
  return h;
}

Bucket::Bucket(asio::any_io_executor e, std::weak_ptr<BucketRegistry> r,
    std::string route, MajorParameters major, std::string k)
  : ex(std::move(e))
  , registry(std::move(r))
  , routeKey(std::move(route))
  , majorParameters(std::move(major))
  , key(std::move(k))
  , releaseTimer(ex)
  , expiryTimer(ex)
{}

void Bucket::acquire(Waiter waiter) {
  if (locked) {
    waiters.push_back(std::move(waiter));
    return;
  }

  locked = true;
  expiryTimer.cancel();
  asio::post(ex, [waiter = std::move(waiter)] { waiter({}); });
}

void Bucket::release() {
  if (!waiters.empty()) {
    auto waiter = std::move(waiters.front());
    waiters.pop_front();
    asio::post(ex, [waiter = std::move(waiter)] { waiter({}); });
    return;
  }

  locked = false;
  scheduleExpiry();
}

void Bucket::releaseLater() {
  auto wait = delay();

  std::cout << "[Http] Bucket " << key << " exhausted, holding for "
    << std::chrono::duration_cast<std::chrono::milliseconds>(wait).count() << "ms\n";

  releaseTimer.expires_after(wait);
  releaseTimer.async_wait(
      [self = shared_from_this()](const beast::error_code& ec) {
        if (ec)
          return;

        self->release();
      });
}

void Bucket::update(const RateLimitHeaders& headers) {
  if (headers.limit)
    limit = headers.limit;
  if (headers.remaining)
    remaining = headers.remaining;

  auto now = clock::now();

  if (headers.resetAfter) {
    resetAt = now + std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(*headers.resetAfter));
  } else if (headers.reset) {
    auto epoch = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    resetAt = now + std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(*headers.reset - epoch));
  }
}

Bucket::clock::duration Bucket::delay() const {
  auto now = clock::now();
  return resetAt > now ? resetAt - now : clock::duration::zero();
}

void Bucket::cancel() {
  releaseTimer.cancel();
  expiryTimer.cancel();
  locked = false;

  auto pending = std::move(waiters);
  waiters.clear();
  for (auto& waiter: pending)
    asio::post(ex, [waiter = std::move(waiter)] { waiter(asio::error::operation_aborted); });
}

void Bucket::scheduleExpiry() {
  auto wait = delay();
  if (wait == clock::duration::zero())
    return expire();

  expiryTimer.expires_after(wait);
  expiryTimer.async_wait(
      [self = shared_from_this()](const beast::error_code& ec) {
        if (ec)
          return;

        self->expire();
      });
}

void Bucket::expire() {
  if (locked || !waiters.empty())
    return;

  if (auto r = registry.lock())
    r->erase(key, this);
}

std::string BucketRegistry::makeKey(const std::string& scope, const MajorParameters& major) {
  return scope + '|' + major.str();
}

std::shared_ptr<Bucket> BucketRegistry::resolve(const std::string& routeKey, const MajorParameters& major) {
  auto key = makeKey(routeKey, major);
  auto it = buckets.find(key);
  if (it != buckets.end())
    return it->second;

  auto mapped = routeBuckets.find(routeKey);
  if (mapped != routeBuckets.end()) {
    key = makeKey(mapped->second, major);
    it = buckets.find(key);
    if (it != buckets.end())
      return it->second;
  }

  auto bucket = std::make_shared<Bucket>(ex, weak_from_this(), routeKey, major, key);
  if (mapped != routeBuckets.end())
    bucket->id = mapped->second;
  buckets.emplace(key, bucket);
  return bucket;
}

void BucketRegistry::learn(Bucket& bucket, const std::string& id) {
  routeBuckets[bucket.routeKey] = id;

  if (!bucket.id.empty())
    return;

  bucket.id = id;

  auto target = makeKey(id, bucket.majorParameters);
  if (target == bucket.key)
    return;

  auto current = buckets.find(bucket.key);
  if (current == buckets.end() || current->second.get() != &bucket)
    return;

  auto owned = current->second;
  buckets.erase(current);
  bucket.key = target;

  auto existing = buckets.find(target);
  if (existing == buckets.end()) {
    buckets.emplace(target, std::move(owned));
    std::cout << "[Http] Route " << bucket.routeKey << " uses bucket " << id << '\n';
    return;
  }

  auto tracked = existing->second;
  if (!tracked->locked && tracked->waiters.empty()) {
    tracked->expiryTimer.cancel();
    existing->second = std::move(owned);
    std::cout << "[Http] Route " << bucket.routeKey << " takes over idle bucket " << id << '\n';
    return;
  }

  std::cout << "[Http] Bucket " << id << " already busy, merging " << bucket.waiters.size()
    << " waiting request(s) from " << bucket.routeKey << '\n';

  bucket.merged = tracked;
  auto pending = std::move(bucket.waiters);
  bucket.waiters.clear();
  for (auto& waiter: pending)
    tracked->acquire(std::move(waiter));
}

void BucketRegistry::erase(const std::string& key, const Bucket* bucket) {
  auto it = buckets.find(key);
  if (it != buckets.end() && it->second.get() == bucket)
    buckets.erase(it);
}

void BucketRegistry::cancel() {
  auto all = std::move(buckets);
  buckets.clear();
  for (auto& entry: all)
    entry.second->cancel();
}

std::shared_ptr<Bucket> BucketRegistry::find(const std::string& key) const {
  auto it = buckets.find(key);
  return it == buckets.end() ? nullptr : it->second;
}

std::optional<std::string> BucketRegistry::bucketFor(const std::string& routeKey) const {
  auto it = routeBuckets.find(routeKey);
  if (it == routeBuckets.end())
    return std::nullopt;
  return it->second;
}

} // namespace discord

} // namespace relay
