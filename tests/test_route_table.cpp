// tests/test_route_table.cpp
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/RouteTable.hpp"

namespace {

RouteTable makeTable(std::vector<RouteEntry> routes) {
    return RouteTable(std::move(routes));
}

} // namespace

TEST(RouteTableTest, MatchesPrefixAndStripsIt) {
    RouteTable table = makeTable({{"/svc", "orders"}});

    auto match = table.match("/svc/items");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->service_name, "orders");
    EXPECT_EQ(match->path_prefix, "/svc");
    EXPECT_EQ(match->forward_target, "/items");
}

TEST(RouteTableTest, ExactPrefixForwardsRoot) {
    RouteTable table = makeTable({{"/svc", "orders"}});
    auto match = table.match("/svc");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->forward_target, "/");
}

TEST(RouteTableTest, QueryStringIsPreservedButIgnoredForMatching) {
    RouteTable table = makeTable({{"/svc", "orders"}});

    auto match = table.match("/svc/items?page=2&sort=asc");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->forward_target, "/items?page=2&sort=asc");

    auto bare = table.match("/svc?page=2");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->forward_target, "/?page=2");
}

TEST(RouteTableTest, LongestPrefixWinsRegardlessOfOrder) {
    RouteTable table = makeTable({{"/api", "general"}, {"/api/billing", "billing"}, {"/", "fallback"}});

    EXPECT_EQ(table.match("/api/billing/invoices")->service_name, "billing");
    EXPECT_EQ(table.match("/api/orders")->service_name, "general");
    EXPECT_EQ(table.match("/health-check")->service_name, "fallback");
}

TEST(RouteTableTest, PrefixMustEndOnSegmentBoundary) {
    RouteTable table = makeTable({{"/svc", "orders"}});
    EXPECT_FALSE(table.match("/svcs/items").has_value());
    EXPECT_FALSE(table.match("/other").has_value());
}

TEST(RouteTableTest, TrailingSlashPrefix) {
    RouteTable table = makeTable({{"/svc/", "orders"}});
    auto match = table.match("/svc/items");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->forward_target, "/items");
}

TEST(RouteTableTest, RejectsInvalidEntries) {
    EXPECT_THROW(makeTable({{"svc", "orders"}}), std::invalid_argument);
    EXPECT_THROW(makeTable({{"", "orders"}}), std::invalid_argument);
    EXPECT_THROW(makeTable({{"/svc", ""}}), std::invalid_argument);
}

TEST(RouteTableTest, EmptyTableMatchesNothing) {
    RouteTable table = makeTable({});
    EXPECT_FALSE(table.match("/svc/items").has_value());
}

TEST(RouteTableTest, StripPrefixHelpers) {
    EXPECT_EQ(RouteTable::stripPrefix("/svc", "/svc/a/b"), "/a/b");
    EXPECT_EQ(RouteTable::stripPrefix("/", "/a/b"), "/a/b");
    EXPECT_TRUE(RouteTable::prefixMatches("/", "/anything"));
    EXPECT_FALSE(RouteTable::prefixMatches("/a", "/ab"));
}
