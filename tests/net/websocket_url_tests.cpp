/**
 * @file websocket_url_tests.cpp
 * @brief Unit tests for WebSocket URL handling
 */

#include <gtest/gtest.h>
#include "nightfall/net/websocket_transport.h"

using namespace nightfall;
using namespace nightfall::net;

TEST(WebSocketUrlTest, PlainUrlWithPortAndPath) {
    WebSocketEndpoint endpoint;
    ASSERT_TRUE(parse_websocket_url("ws://localhost:3000/socket", endpoint));
    EXPECT_FALSE(endpoint.secure);
    EXPECT_EQ(endpoint.host, "localhost");
    EXPECT_EQ(endpoint.port, 3000);
    EXPECT_EQ(endpoint.path, "/socket");
}

TEST(WebSocketUrlTest, DefaultPorts) {
    WebSocketEndpoint plain;
    ASSERT_TRUE(parse_websocket_url("ws://example.com", plain));
    EXPECT_EQ(plain.port, 80);
    EXPECT_EQ(plain.path, "/");

    WebSocketEndpoint secure;
    ASSERT_TRUE(parse_websocket_url("wss://example.com/game", secure));
    EXPECT_TRUE(secure.secure);
    EXPECT_EQ(secure.port, 443);
    EXPECT_EQ(secure.path, "/game");
}

TEST(WebSocketUrlTest, RejectsBadUrls) {
    WebSocketEndpoint endpoint;
    EXPECT_FALSE(parse_websocket_url("http://example.com", endpoint));
    EXPECT_FALSE(parse_websocket_url("ws://", endpoint));
    EXPECT_FALSE(parse_websocket_url("ws://:3000/x", endpoint));
    EXPECT_FALSE(parse_websocket_url("ws://host:0", endpoint));
    EXPECT_FALSE(parse_websocket_url("ws://host:70000", endpoint));
    EXPECT_FALSE(parse_websocket_url("ws://host:12ab", endpoint));
}

TEST(WebSocketUrlTest, AppendCredential) {
    EXPECT_EQ(append_credential("/socket", ""), "/socket");
    EXPECT_EQ(append_credential("/socket", "abc123"), "/socket?token=abc123");
    EXPECT_EQ(append_credential("/socket?v=2", "abc"), "/socket?v=2&token=abc");
    EXPECT_EQ(append_credential("/", "a b+c/="), "/?token=a%20b%2Bc%2F%3D");
}
