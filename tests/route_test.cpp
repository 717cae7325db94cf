#include <gtest/gtest.h>

#include "discord/route.hpp"

using namespace relay;
using discord::Route;

TEST(RouteTest, SubstitutesParameters) {
  Route route{ http::verb::patch, "/channels/{channel_id}/messages/{message_id}",
    {{ "channel_id", "10" }, { "message_id", "20" }} };

  EXPECT_EQ(route.target(), "/channels/10/messages/20");
  EXPECT_EQ(route.key(), "PATCH /channels/{channel_id}/messages/{message_id}");
}

TEST(RouteTest, KeyIgnoresParameterValues) {
  Route a{ http::verb::get, "/channels/{channel_id}", {{ "channel_id", "1" }} };
  Route b{ http::verb::get, "/channels/{channel_id}", {{ "channel_id", "2" }} };
  Route c{ http::verb::delete_, "/channels/{channel_id}", {{ "channel_id", "1" }} };

  EXPECT_EQ(a.key(), b.key());
  EXPECT_NE(a.key(), c.key());
}

TEST(RouteTest, MissingParameterThrows) {
  Route route{ http::verb::get, "/guilds/{guild_id}/members/{user_id}", {{ "guild_id", "1" }} };

  EXPECT_THROW(route.target(), std::invalid_argument);
}

TEST(RouteTest, UnterminatedParameterThrows) {
  Route route{ http::verb::get, "/guilds/{guild_id", {{ "guild_id", "1" }} };

  EXPECT_THROW(route.target(), std::invalid_argument);
}

TEST(RouteTest, MajorParameters) {
  Route route{ http::verb::post, "/webhooks/{webhook_id}/{webhook_token}",
    {{ "webhook_id", "7" }, { "webhook_token", "tok" }} };

  auto major = route.major();
  EXPECT_EQ(major.webhookId, "7");
  EXPECT_EQ(major.webhookToken, "tok");
  EXPECT_TRUE(major.channelId.empty());
  EXPECT_EQ(major.str(), "//7/tok");

  Route plain{ http::verb::get, "/gateway/bot" };
  EXPECT_EQ(plain.major().str(), "///");
  EXPECT_EQ(plain.target(), "/gateway/bot");
}
