// tests/test_gateway_error.cpp
#include <string>
#include <system_error>

#include "gtest/gtest.h"

#include "../src/models/GatewayError.hpp"

TEST(GatewayErrorTest, ErrorCodeUsesGatewayCategory) {
    std::error_code ec = GatewayErrc::CircuitOpen;
    EXPECT_EQ(ec.category().name(), std::string("gateway"));
    EXPECT_EQ(ec.message(), "circuit breaker is open");
    EXPECT_EQ(ec, make_error_code(GatewayErrc::CircuitOpen));
    EXPECT_NE(ec, make_error_code(GatewayErrc::ProbeLimitExceeded));
}

TEST(GatewayErrorTest, BackendStatusCarriesStatusCode) {
    auto error = GatewayError::backendStatus(GatewayErrc::RetryableBackendStatus, 503, "backend returned status 503");
    EXPECT_TRUE(error.is(GatewayErrc::RetryableBackendStatus));
    ASSERT_TRUE(error.statusCode().has_value());
    EXPECT_EQ(*error.statusCode(), 503);
    EXPECT_EQ(error.cause(), nullptr);
}

TEST(GatewayErrorTest, RetryExhaustedWrapsCause) {
    GatewayError last(GatewayErrc::TransportFailed, "transport failed: connection refused");
    auto error = GatewayError::retryExhausted(3, last);

    EXPECT_EQ(error.code(), GatewayErrc::RetryExhausted);
    EXPECT_EQ(error.attempts(), 3);
    EXPECT_TRUE(error.wraps(GatewayErrc::TransportFailed));
    EXPECT_FALSE(error.wraps(GatewayErrc::CircuitOpen));
    EXPECT_EQ(error.rootCause().code(), GatewayErrc::TransportFailed);
    EXPECT_EQ(error.to_string(), "max retry attempts (3) exceeded: transport failed: connection refused");
}

TEST(GatewayErrorTest, RetryExhaustedKeepsLastBackendStatus) {
    auto last = GatewayError::backendStatus(GatewayErrc::RetryableBackendStatus, 502, "bad gateway");
    auto error = GatewayError::retryExhausted(2, last);
    EXPECT_EQ(error.statusCode(), 502);
}
