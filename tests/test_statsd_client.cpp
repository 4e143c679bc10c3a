// tests/test_statsd_client.cpp
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"

#include "../src/metrics/DummyStatsDClient.hpp"
#include "../src/metrics/StatsDClient.hpp"

TEST(StatsDClientTest, ParsesHostAndPort) {
    auto [host, port] = StatsDClient::parseAddress("metrics.internal:8125");
    EXPECT_EQ(host, "metrics.internal");
    EXPECT_EQ(port, 8125);
}

TEST(StatsDClientTest, MapsLocalhostToLoopback) {
    auto [host, port] = StatsDClient::parseAddress("localhost:9125");
    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_EQ(port, 9125);
}

TEST(StatsDClientTest, RejectsMalformedAddress) {
    EXPECT_THROW(StatsDClient::parseAddress("metrics.internal"), std::runtime_error);
    EXPECT_THROW(StatsDClient::parseAddress(":8125"), std::runtime_error);
    EXPECT_THROW(StatsDClient::parseAddress("metrics.internal:"), std::runtime_error);
    EXPECT_THROW(StatsDClient::parseAddress("metrics.internal:abc"), std::runtime_error);
    EXPECT_THROW(StatsDClient::parseAddress("metrics.internal:70000"), std::runtime_error);
}

TEST(StatsDClientTest, DummyClientAcceptsEverything) {
    DummyStatsDClient client;
    EXPECT_NO_THROW(client.increment("gateway.cache_hit"));
    EXPECT_NO_THROW(client.decrement("gateway.cache_hit", 2));
    EXPECT_NO_THROW(client.gauge("gateway.queue", 1.5));
    EXPECT_NO_THROW(client.timing("gateway.dispatch_latency", std::chrono::milliseconds(12)));
    EXPECT_NO_THROW(client.set("gateway.clients", "10.0.0.1"));
}
