/**
 * @file test_ws_url.cpp
 */

#include <gtest/gtest.h>
#include "core/net/beast_ws_client.h"

using uploadwatch::netws::parse_ws_url;
using uploadwatch::netws::ParsedWsUrl;

TEST(WsUrl, PlainWithDefaultPort) {
    ParsedWsUrl u;
    ASSERT_TRUE(parse_ws_url("ws://localhost/api/ws/progress/u1?session_id=s", u));
    EXPECT_EQ(u.host, "localhost");
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.target, "/api/ws/progress/u1?session_id=s");
    EXPECT_FALSE(u.tls);
}

TEST(WsUrl, SecureWithExplicitPort) {
    ParsedWsUrl u;
    ASSERT_TRUE(parse_ws_url("wss://api.example.com:8443/x", u));
    EXPECT_EQ(u.host, "api.example.com");
    EXPECT_EQ(u.port, "8443");
    EXPECT_TRUE(u.tls);
}

TEST(WsUrl, RejectsOtherSchemes) {
    ParsedWsUrl u;
    EXPECT_FALSE(parse_ws_url("https://api.example.com/x", u));
    EXPECT_FALSE(parse_ws_url("ws://", u));
}
