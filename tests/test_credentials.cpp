#include <gtest/gtest.h>

#include <stdexcept>

#include "Server/Credentials.hpp"

TEST(CredentialsTest, EmptyListDisablesAuth) {
  auto credentials = Credentials::parse("");
  EXPECT_FALSE(credentials.enabled());
  EXPECT_TRUE(credentials.authorize(""));
}

TEST(CredentialsTest, ParsesUsers) {
  auto credentials = Credentials::parse("user1:password1,user2:pa:ss");
  EXPECT_TRUE(credentials.enabled());
  EXPECT_EQ(credentials.size(), 2u);
}

TEST(CredentialsTest, RejectsMalformedEntries) {
  EXPECT_THROW(Credentials::parse("nopassword"), std::invalid_argument);
  EXPECT_THROW(Credentials::parse(":secret"), std::invalid_argument);
}

TEST(CredentialsTest, AuthorizesBasicHeader) {
  auto credentials = Credentials::parse("user1:password1,user2:pa:ss");
  // base64("user1:password1")
  EXPECT_TRUE(credentials.authorize("Basic dXNlcjE6cGFzc3dvcmQx"));
  EXPECT_TRUE(credentials.authorize("basic   dXNlcjE6cGFzc3dvcmQx "));
  // base64("user2:pa:ss")
  EXPECT_TRUE(credentials.authorize("Basic dXNlcjI6cGE6c3M="));
  // base64("user1:wrong")
  EXPECT_FALSE(credentials.authorize("Basic dXNlcjE6d3Jvbmc="));
  EXPECT_FALSE(credentials.authorize(""));
  EXPECT_FALSE(credentials.authorize("Bearer dXNlcjE6cGFzc3dvcmQx"));
  EXPECT_FALSE(credentials.authorize("Basic !!!notbase64"));
}

TEST(CredentialsTest, RejectsNearMissPasswords) {
  auto credentials = Credentials::parse("user1:password1");
  // base64("user1:password2")
  EXPECT_FALSE(credentials.authorize("Basic dXNlcjE6cGFzc3dvcmQy"));
  // base64("user1:password")
  EXPECT_FALSE(credentials.authorize("Basic dXNlcjE6cGFzc3dvcmQ="));
  // base64("user1:password11")
  EXPECT_FALSE(credentials.authorize("Basic dXNlcjE6cGFzc3dvcmQxMQ=="));
  // base64("user1:")
  EXPECT_FALSE(credentials.authorize("Basic dXNlcjE6"));
  EXPECT_TRUE(credentials.authorize("Basic dXNlcjE6cGFzc3dvcmQx"));
}
