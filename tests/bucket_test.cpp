#include <gtest/gtest.h>

#include "discord/bucket.hpp"
#include "discord/global_gate.hpp"
#include "helpers.hpp"

using namespace relay;
using namespace relay::discord;
using namespace std::chrono_literals;

namespace {

MajorParameters channel(const std::string& id) {
  MajorParameters major;
  major.channelId = id;
  return major;
}

} // namespace

TEST(RateLimitHeadersTest, ParsesHeaders) {
  http::fields fields;
  fields.set("X-RateLimit-Limit", "5");
  fields.set("X-RateLimit-Remaining", "0");
  fields.set("X-RateLimit-Reset-After", "1.25");
  fields.set("X-RateLimit-Bucket", "abcd1234");
  fields.set("X-RateLimit-Scope", "user");

  auto headers = parseRateLimitHeaders(fields);
  EXPECT_EQ(headers.limit.value_or(-1), 5);
  EXPECT_EQ(headers.remaining.value_or(-1), 0);
  EXPECT_DOUBLE_EQ(headers.resetAfter.value_or(-1), 1.25);
  EXPECT_EQ(headers.bucket.value_or(""), "abcd1234");
  EXPECT_EQ(headers.scope.value_or(""), "user");
  EXPECT_FALSE(headers.global);
  EXPECT_FALSE(headers.reset);
}

TEST(RateLimitHeadersTest, SkipsMalformedValues) {
  http::fields fields;
  fields.set("X-RateLimit-Remaining", "plenty");
  fields.set("X-RateLimit-Global", "true");

  auto headers = parseRateLimitHeaders(fields);
  EXPECT_FALSE(headers.remaining);
  EXPECT_TRUE(headers.global);
}

class BucketTest : public ::testing::Test {
protected:
  asio::io_context io;
  std::shared_ptr<BucketRegistry> registry{ std::make_shared<BucketRegistry>(io.get_executor()) };
};

TEST_F(BucketTest, ResolvesByRouteAndMajor) {
  auto a = registry->resolve("GET /channels/{channel_id}", channel("1"));
  auto b = registry->resolve("GET /channels/{channel_id}", channel("1"));
  auto c = registry->resolve("GET /channels/{channel_id}", channel("2"));

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(a->getKey(), "GET /channels/{channel_id}|1///");
  EXPECT_EQ(registry->size(), 2u);
}

TEST_F(BucketTest, GrantsInArrivalOrder) {
  auto bucket = registry->resolve("GET /x", channel("1"));
  std::vector<int> granted;

  for (int i = 0; i < 3; ++i)
    bucket->acquire([&granted, i](const beast::error_code& ec) {
      if (!ec)
        granted.push_back(i);
    });

  test::runFor(io, 20ms);
  ASSERT_EQ(granted, std::vector<int>{ 0 });
  EXPECT_TRUE(bucket->isLocked());
  EXPECT_EQ(bucket->waiting(), 2u);

  bucket->release();
  test::runFor(io, 20ms);
  bucket->release();
  test::runFor(io, 20ms);

  EXPECT_EQ(granted, (std::vector<int>{ 0, 1, 2 }));
  EXPECT_TRUE(bucket->isLocked());
}

TEST_F(BucketTest, IdleBucketIsCollected) {
  auto bucket = registry->resolve("GET /x", channel("1"));
  bool granted = false;
  bucket->acquire([&](const beast::error_code& ec) { granted = !ec; });
  ASSERT_TRUE(test::runUntil(io, [&] { return granted; }));

  RateLimitHeaders headers;
  headers.remaining = 3;
  headers.resetAfter = 0.05;
  bucket->update(headers);
  bucket->release();

  EXPECT_EQ(registry->size(), 1u);
  EXPECT_TRUE(test::runUntil(io, [&] { return registry->size() == 0; }, 1s));
}

TEST_F(BucketTest, ReleaseLaterHoldsUntilReset) {
  auto bucket = registry->resolve("GET /x", channel("1"));
  std::vector<std::chrono::steady_clock::time_point> grants;

  for (int i = 0; i < 2; ++i)
    bucket->acquire([&](const beast::error_code& ec) {
      if (!ec)
        grants.push_back(std::chrono::steady_clock::now());
    });
  ASSERT_TRUE(test::runUntil(io, [&] { return grants.size() == 1; }));

  RateLimitHeaders headers;
  headers.remaining = 0;
  headers.resetAfter = 0.1;
  bucket->update(headers);
  EXPECT_TRUE(bucket->exhausted());

  auto released = std::chrono::steady_clock::now();
  bucket->releaseLater();

  ASSERT_TRUE(test::runUntil(io, [&] { return grants.size() == 2; }));
  EXPECT_GE(grants[1] - released, 90ms);
}

TEST_F(BucketTest, LearnMovesBucketUnderItsId) {
  auto bucket = registry->resolve("GET /x", channel("1"));
  bucket->acquire([](const beast::error_code&) {});

  registry->learn(*bucket, "abc");

  EXPECT_EQ(bucket->getKey(), "abc|1///");
  EXPECT_EQ(bucket->getId(), "abc");
  EXPECT_EQ(registry->find("abc|1///"), bucket);
  EXPECT_EQ(registry->find("GET /x|1///"), nullptr);
  EXPECT_EQ(registry->bucketFor("GET /x").value_or(""), "abc");
  EXPECT_TRUE(bucket->isLocked());

  // Later calls on the route, and on other routes sharing the id, resolve to it.
  EXPECT_EQ(registry->resolve("GET /x", channel("1")), bucket);
  auto other = registry->resolve("POST /y", channel("1"));
  registry->learn(*other, "abc");
  EXPECT_EQ(registry->resolve("POST /y", channel("1")), bucket);
  EXPECT_EQ(other->successor(), bucket);
  EXPECT_EQ(registry->size(), 1u);
}

TEST_F(BucketTest, RouteKeyBucketServesRouteUntilItLearns) {
  auto first = registry->resolve("POST /x", channel("1"));
  auto second = registry->resolve("POST /x", channel("2"));
  first->acquire([](const beast::error_code&) {});
  second->acquire([](const beast::error_code&) {});

  registry->learn(*first, "abc");
  EXPECT_EQ(registry->resolve("POST /x", channel("2")), second);
  EXPECT_EQ(registry->resolve("POST /x", channel("3"))->getKey(), "abc|3///");

  registry->learn(*second, "abc");
  EXPECT_EQ(second->getKey(), "abc|2///");
  EXPECT_EQ(registry->resolve("POST /x", channel("2")), second);
}

TEST_F(BucketTest, BusyTrackedBucketAbsorbsWaiters) {
  auto tracked = registry->resolve("GET /x", channel("1"));
  registry->learn(*tracked, "abc");
  tracked->acquire([](const beast::error_code&) {});

  auto other = registry->resolve("POST /y", channel("1"));
  std::vector<int> granted;
  for (int i = 0; i < 2; ++i)
    other->acquire([&granted, i](const beast::error_code& ec) {
      if (!ec)
        granted.push_back(i);
    });
  test::runFor(io, 10ms);
  ASSERT_EQ(granted, std::vector<int>{ 0 });

  registry->learn(*other, "abc");
  EXPECT_EQ(other->successor(), tracked);
  EXPECT_EQ(other->waiting(), 0u);
  EXPECT_EQ(tracked->waiting(), 1u);
  EXPECT_EQ(registry->resolve("POST /y", channel("1")), tracked);

  other->release();
  test::runFor(io, 10ms);
  EXPECT_EQ(granted.size(), 1u);

  tracked->release();
  ASSERT_TRUE(test::runUntil(io, [&] { return granted.size() == 2; }));
  EXPECT_EQ(granted[1], 1);
}

TEST_F(BucketTest, IdleTrackedBucketIsReplaced) {
  auto idle = registry->resolve("GET /x", channel("1"));
  registry->learn(*idle, "abc");

  auto other = registry->resolve("POST /y", channel("1"));
  other->acquire([](const beast::error_code&) {});
  registry->learn(*other, "abc");

  EXPECT_FALSE(other->successor());
  EXPECT_EQ(registry->find("abc|1///"), other);
  EXPECT_EQ(registry->resolve("GET /x", channel("1")), other);
}

TEST_F(BucketTest, CancelFailsWaiters) {
  auto bucket = registry->resolve("GET /x", channel("1"));
  std::vector<beast::error_code> results;

  for (int i = 0; i < 2; ++i)
    bucket->acquire([&](const beast::error_code& ec) { results.push_back(ec); });
  test::runFor(io, 10ms);

  registry->cancel();
  ASSERT_TRUE(test::runUntil(io, [&] { return results.size() == 2; }));

  EXPECT_FALSE(results[0]);
  EXPECT_EQ(results[1], asio::error::operation_aborted);
  EXPECT_EQ(registry->size(), 0u);
}

TEST(GlobalGateTest, HoldsWaitersUntilOpen) {
  asio::io_context io;
  GlobalGate gate{ io.get_executor() };
  bool passed = false;

  gate.closeFor(100ms);
  gate.closeFor(10ms);
  EXPECT_TRUE(gate.isClosed());

  auto start = std::chrono::steady_clock::now();
  gate.wait([&](const beast::error_code& ec) { passed = !ec; });

  test::runFor(io, 40ms);
  EXPECT_FALSE(passed);

  ASSERT_TRUE(test::runUntil(io, [&] { return passed; }));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
  EXPECT_FALSE(gate.isClosed());
}

TEST(GlobalGateTest, OpenGatePassesImmediately) {
  asio::io_context io;
  GlobalGate gate{ io.get_executor() };
  bool passed = false;

  gate.wait([&](const beast::error_code& ec) { passed = !ec; });

  EXPECT_TRUE(test::runUntil(io, [&] { return passed; }, 100ms));
}
