// tests/test_static_service_locator.cpp
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/discovery/StaticServiceLocator.hpp"
#include "TestMocks.hpp"

using ::testing::NiceMock;

class StaticServiceLocatorTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    BackendUrlInfo first_ = makeInstance("10.0.0.1", 8081);
    BackendUrlInfo second_ = makeInstance("10.0.0.2", 8081);

    std::map<std::string, std::vector<BackendUrlInfo>> services() const {
        return {{"orders", {first_, second_}}, {"billing", {makeInstance("10.0.1.1", 9000)}}};
    }
};

TEST_F(StaticServiceLocatorTest, RoundRobinsAcrossInstances) {
    StaticServiceLocator locator(services(), std::chrono::seconds(10), logger_);

    std::vector<std::string> picked;
    for (int i = 0; i < 4; ++i) {
        auto instance = locator.resolveHealthy("orders");
        ASSERT_TRUE(instance.has_value());
        picked.push_back(instance->url);
    }
    EXPECT_EQ(picked, (std::vector<std::string>{first_.url, second_.url, first_.url, second_.url}));
}

TEST_F(StaticServiceLocatorTest, UnknownServiceHasNoInstance) {
    StaticServiceLocator locator(services(), std::chrono::seconds(10), logger_);
    EXPECT_FALSE(locator.resolveHealthy("inventory").has_value());
    EXPECT_TRUE(locator.resolveAll("inventory").empty());
}

TEST_F(StaticServiceLocatorTest, QuarantinedInstanceIsSkipped) {
    StaticServiceLocator locator(services(), std::chrono::seconds(10), logger_);
    locator.reportFailure("orders", first_);

    for (int i = 0; i < 3; ++i) {
        auto instance = locator.resolveHealthy("orders");
        ASSERT_TRUE(instance.has_value());
        EXPECT_EQ(instance->url, second_.url);
    }
    EXPECT_EQ(locator.resolveAll("orders").size(), 1u);
}

TEST_F(StaticServiceLocatorTest, AllQuarantinedMeansNoHealthyInstance) {
    StaticServiceLocator locator(services(), std::chrono::seconds(10), logger_);
    locator.reportFailure("orders", first_);
    locator.reportFailure("orders", second_);
    EXPECT_FALSE(locator.resolveHealthy("orders").has_value());
    EXPECT_TRUE(locator.resolveHealthy("billing").has_value());
}

TEST_F(StaticServiceLocatorTest, QuarantineExpires) {
    StaticServiceLocator locator(services(), std::chrono::milliseconds(30), logger_);
    locator.reportFailure("orders", first_);
    EXPECT_EQ(locator.resolveAll("orders").size(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(locator.resolveAll("orders").size(), 2u);
}

TEST_F(StaticServiceLocatorTest, ZeroQuarantineDisablesPassiveHealth) {
    StaticServiceLocator locator(services(), std::chrono::milliseconds(0), logger_);
    locator.reportFailure("orders", first_);
    EXPECT_EQ(locator.resolveAll("orders").size(), 2u);
}

TEST_F(StaticServiceLocatorTest, ListsConfiguredServices) {
    StaticServiceLocator locator(services(), std::chrono::seconds(10), logger_);
    auto names = locator.serviceNames();
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()), (std::set<std::string>{"billing", "orders"}));
}

TEST_F(StaticServiceLocatorTest, RejectsInvalidArguments) {
    EXPECT_THROW(StaticServiceLocator(services(), std::chrono::seconds(10), nullptr), std::invalid_argument);
    EXPECT_THROW(StaticServiceLocator(services(), std::chrono::milliseconds(-1), logger_), std::invalid_argument);
}
