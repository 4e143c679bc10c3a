// tests/test_dispatcher.cpp
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/config/AppConfig.hpp"
#include "../src/core/Dispatcher.hpp"
#include "TestMocks.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

DispatcherOptions fastOptions() {
    DispatcherOptions options;
    options.retry_policy.maxAttempts = 3;
    options.retry_policy.initialDelay = std::chrono::milliseconds(1);
    options.retry_policy.maxDelay = std::chrono::milliseconds(2);
    options.retry_policy.jitterEnabled = false;
    options.cache_ttl = std::chrono::seconds(300);
    return options;
}

ProxyRequest makeRequest(http::verb method, const std::string& target) {
    ProxyRequest request;
    request.message = http::request<http::string_body>{method, target, 11};
    request.message.set(http::field::host, "gateway.local");
    request.client_address = "192.168.1.10";
    return request;
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<NiceMock<MockServiceLocator>> locator_ = std::make_shared<NiceMock<MockServiceLocator>>();
    std::shared_ptr<NiceMock<MockBackendClient>> backend_ = std::make_shared<NiceMock<MockBackendClient>>();
    std::shared_ptr<NiceMock<MockCache>> cache_ = std::make_shared<NiceMock<MockCache>>();
    BackendUrlInfo instance_ = makeInstance("10.0.0.5", 8080);

    void SetUp() override {
        ON_CALL(*locator_, resolveHealthy("orders")).WillByDefault(Return(instance_));
        ON_CALL(*cache_, get(_)).WillByDefault(Return(std::nullopt));
        ON_CALL(*cache_, set(_, _, _)).WillByDefault(Return(true));
    }

    std::unique_ptr<Dispatcher> makeDispatcher(DispatcherOptions options = fastOptions(), bool with_cache = true) {
        return std::make_unique<Dispatcher>(options, locator_, backend_,
                                            with_cache ? cache_ : nullptr, logger_, statsd_);
    }
};

TEST_F(DispatcherTest, ForwardsRequestAndCachesOkGetResponse) {
    auto dispatcher = makeDispatcher();
    std::string cached_value;

    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Return(backendResponse(200, R"({"items":[1,2]})")));
    EXPECT_CALL(*cache_, set("proxy:orders:/items", _, 300)).WillOnce(DoAll(SaveArg<1>(&cached_value), Return(true)));

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_FALSE(result.error.has_value());
    EXPECT_FALSE(result.cache_hit);
    EXPECT_EQ(result.response->result_int(), 200);
    EXPECT_EQ(result.response->body(), R"({"items":[1,2]})");
    EXPECT_EQ((*result.response)["X-Cache"], "MISS");

    auto entry = json::parse(cached_value);
    EXPECT_EQ(entry["status_code"], 200);
    EXPECT_EQ(entry["body"], R"({"items":[1,2]})");
    EXPECT_EQ(entry["content_type"], "application/json");
}

TEST_F(DispatcherTest, CacheHitSkipsBackendAndBreaker) {
    auto dispatcher = makeDispatcher();
    json entry = {{"status_code", 200}, {"body", "cached-body"}, {"content_type", "text/plain"}};

    EXPECT_CALL(*cache_, get("proxy:orders:/items")).WillOnce(Return(entry.dump()));
    EXPECT_CALL(*backend_, send(_, _, _)).Times(0);
    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::CACHE_HIT, 1)).Times(1);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_TRUE(result.cache_hit);
    EXPECT_EQ(result.response->body(), "cached-body");
    EXPECT_EQ((*result.response)[http::field::content_type], "text/plain");
    EXPECT_EQ((*result.response)["X-Cache"], "HIT");
    EXPECT_EQ(dispatcher->breakers().size(), 0u);
}

TEST_F(DispatcherTest, UnreadableCacheEntryFallsThroughToBackend) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*cache_, get(_)).WillOnce(Return(std::string("not json")));
    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Return(backendResponse(200, "fresh")));

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->body(), "fresh");
    EXPECT_FALSE(result.cache_hit);
}

TEST_F(DispatcherTest, NonGetRequestsBypassCache) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*cache_, get(_)).Times(0);
    EXPECT_CALL(*cache_, set(_, _, _)).Times(0);
    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Return(backendResponse(201, "created")));

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::post, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->result_int(), 201);
}

TEST_F(DispatcherTest, WorksWithoutCache) {
    auto dispatcher = makeDispatcher(fastOptions(), false);
    EXPECT_CALL(*backend_, send(_, _, _)).Times(2).WillRepeatedly(Return(backendResponse(200, "body")));

    for (int i = 0; i < 2; ++i) {
        Deadline deadline = Deadline::after(std::chrono::seconds(5));
        auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);
        ASSERT_TRUE(result.response.has_value());
    }
}

TEST_F(DispatcherTest, TerminalClientErrorIsReturnedWithoutRetryOrCaching) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Return(backendResponse(404, R"({"error":"not found"})")));
    EXPECT_CALL(*cache_, set(_, _, _)).Times(0);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items/42"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->result_int(), 404);

    auto breaker = dispatcher->breakers().find("orders");
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->counts().totalSuccesses, 1u);
}

TEST_F(DispatcherTest, RetryableStatusIsRetriedUntilSuccess) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _))
        .WillOnce(Return(backendResponse(503, "busy")))
        .WillOnce(Return(backendResponse(200, "ok")));

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->body(), "ok");
}

TEST_F(DispatcherTest, ExhaustedRetriesMapToBadGateway) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).Times(3).WillRepeatedly(Return(backendResponse(500, "error")));
    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::RETRY_EXHAUSTED, 1)).Times(1);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.error.has_value());
    EXPECT_FALSE(result.response.has_value());
    EXPECT_EQ(result.error->code(), GatewayErrc::RetryExhausted);
    EXPECT_EQ(result.error->attempts(), 3);
    EXPECT_EQ(Dispatcher::statusForError(*result.error), http::status::bad_gateway);

    auto res = Dispatcher::errorResponse(*result.error, 11, true);
    EXPECT_EQ(res.result(), http::status::bad_gateway);
    EXPECT_EQ(res.body(), R"({"success": false, "message": "Service error"})");
    EXPECT_EQ(res.body().find("10.0.0.5"), std::string::npos);
}

TEST_F(DispatcherTest, BreakerCountsOneOutcomePerRequestNotPerAttempt) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).Times(3).WillRepeatedly(Return(backendResponse(503, "busy")));

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->attempts(), 3);

    auto breaker = dispatcher->breakers().find("orders");
    ASSERT_NE(breaker, nullptr);
    BreakerCounts counts = breaker->counts();
    EXPECT_EQ(counts.requests, 1u);
    EXPECT_EQ(counts.totalFailures, 1u);
    EXPECT_EQ(counts.consecutiveFailures, 1u);
}

TEST_F(DispatcherTest, RetriedFailuresBelowRequestThresholdKeepBreakerClosed) {
    auto options = fastOptions();
    options.breaker_settings.minRequestThreshold = 5;
    auto dispatcher = makeDispatcher(options);
    EXPECT_CALL(*backend_, send(_, _, _)).Times(6).WillRepeatedly(Return(backendResponse(500, "error")));

    for (int i = 0; i < 2; ++i) {
        Deadline deadline = Deadline::after(std::chrono::seconds(5));
        auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);
        ASSERT_TRUE(result.error.has_value());
        EXPECT_EQ(result.error->code(), GatewayErrc::RetryExhausted);
    }

    auto breaker = dispatcher->breakers().find("orders");
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->state(), BreakerState::Closed);
    EXPECT_EQ(breaker->counts().requests, 2u);
    EXPECT_EQ(breaker->counts().totalFailures, 2u);
}

TEST_F(DispatcherTest, TransportFailureQuarantinesInstanceAndRetries) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _))
        .WillOnce(Return(transportFailure()))
        .WillOnce(Return(backendResponse(200, "ok")));
    EXPECT_CALL(*locator_, reportFailure("orders", instance_)).Times(1);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->body(), "ok");
}

TEST_F(DispatcherTest, DiscoveryFailureIsRetriedThenReported) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*locator_, resolveHealthy("inventory")).Times(3).WillRepeatedly(Return(std::nullopt));
    EXPECT_CALL(*backend_, send(_, _, _)).Times(0);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("inventory", makeRequest(http::verb::get, "/stock"), deadline);

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code(), GatewayErrc::RetryExhausted);
    EXPECT_TRUE(result.error->wraps(GatewayErrc::DiscoveryFailed));
    EXPECT_EQ(Dispatcher::statusForError(*result.error), http::status::bad_gateway);
}

TEST_F(DispatcherTest, OpenBreakerFailsFastWithServiceUnavailable) {
    auto options = fastOptions();
    options.retry_policy.maxAttempts = 1;
    auto dispatcher = makeDispatcher(options);

    EXPECT_CALL(*backend_, send(_, _, _)).Times(5).WillRepeatedly(Return(backendResponse(502, "down")));
    for (int i = 0; i < 5; ++i) {
        Deadline deadline = Deadline::after(std::chrono::seconds(5));
        auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);
        ASSERT_TRUE(result.error.has_value());
    }

    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::CIRCUIT_OPEN, 1)).Times(1);
    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code(), GatewayErrc::CircuitOpen);
    EXPECT_EQ(Dispatcher::statusForError(*result.error), http::status::service_unavailable);
    EXPECT_EQ(dispatcher->breakers().find("orders")->state(), BreakerState::Open);
}

TEST_F(DispatcherTest, ExpiredDeadlineMapsToGatewayTimeout) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).Times(0);

    Deadline deadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code(), GatewayErrc::Cancelled);
    EXPECT_EQ(Dispatcher::statusForError(*result.error), http::status::gateway_timeout);
}

TEST_F(DispatcherTest, BackendTimeoutAfterDeadlineIsCancellation) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Invoke(
        [](const BackendUrlInfo&, http::request<http::string_body>, Deadline& deadline) {
            deadline.cancel();
            BackendCallResult result;
            result.error = boost::asio::error::operation_aborted;
            return result;
        }));
    EXPECT_CALL(*locator_, reportFailure(_, _)).Times(0);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code(), GatewayErrc::Cancelled);
}

TEST_F(DispatcherTest, CacheWriteFailureDoesNotFailTheRequest) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Return(backendResponse(200, "ok")));
    EXPECT_CALL(*cache_, set(_, _, _)).WillOnce(Return(false));
    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::CACHE_WRITE_FAILED, 1)).Times(1);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    auto result = dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);

    ASSERT_TRUE(result.response.has_value());
    EXPECT_FALSE(result.error.has_value());
}

TEST_F(DispatcherTest, RecordsLatency) {
    auto dispatcher = makeDispatcher();
    EXPECT_CALL(*backend_, send(_, _, _)).WillOnce(Return(backendResponse(200, "ok")));
    EXPECT_CALL(*statsd_, timing(MetricsDefinitions::DISPATCH_LATENCY, _)).Times(1);

    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    dispatcher->dispatch("orders", makeRequest(http::verb::get, "/items"), deadline);
}

TEST_F(DispatcherTest, RejectsNullCollaborators) {
    EXPECT_THROW(Dispatcher(fastOptions(), nullptr, backend_, cache_, logger_, statsd_), std::invalid_argument);
    EXPECT_THROW(Dispatcher(fastOptions(), locator_, nullptr, cache_, logger_, statsd_), std::invalid_argument);
    EXPECT_THROW(Dispatcher(fastOptions(), locator_, backend_, cache_, nullptr, statsd_), std::invalid_argument);
    EXPECT_THROW(Dispatcher(fastOptions(), locator_, backend_, cache_, logger_, nullptr), std::invalid_argument);
}

TEST(DispatcherStaticsTest, OutboundRequestCarriesForwardingHeaders) {
    ProxyRequest request;
    request.message = http::request<http::string_body>{http::verb::post, "/items?x=1", 11};
    request.message.set(http::field::host, "gateway.example.com");
    request.message.set("X-Forwarded-For", "203.0.113.7");
    request.message.set(http::field::connection, "keep-alive");
    request.message.body() = R"({"sku":"a"})";
    request.message.prepare_payload();
    request.client_address = "192.168.1.10";

    auto outbound = Dispatcher::buildOutboundRequest(request, makeInstance("orders-1", 9000));

    EXPECT_EQ(outbound.target(), "/items?x=1");
    EXPECT_EQ(outbound.method(), http::verb::post);
    EXPECT_EQ(outbound[http::field::host], "orders-1:9000");
    EXPECT_EQ(outbound["X-Forwarded-Host"], "gateway.example.com");
    EXPECT_EQ(outbound["X-Forwarded-Proto"], "http");
    EXPECT_EQ(outbound["X-Forwarded-For"], "203.0.113.7, 192.168.1.10");
    EXPECT_FALSE(outbound.keep_alive());
    EXPECT_EQ(outbound.body(), R"({"sku":"a"})");
    EXPECT_EQ(outbound[http::field::content_length], "11");
}

TEST(DispatcherStaticsTest, DefaultPortIsOmittedFromHostHeader) {
    ProxyRequest request;
    request.message = http::request<http::string_body>{http::verb::get, "/", 11};
    auto outbound = Dispatcher::buildOutboundRequest(request, makeInstance("orders-1", 80));
    EXPECT_EQ(outbound[http::field::host], "orders-1");
    EXPECT_TRUE(outbound.find("X-Forwarded-For") == outbound.end());
}

TEST(DispatcherStaticsTest, CacheKeyIncludesServiceAndTarget) {
    EXPECT_EQ(Dispatcher::cacheKey("orders", "/items?page=2"), "proxy:orders:/items?page=2");
}

TEST(DispatcherStaticsTest, RateLimitedResponseBodyAndRetryAfter) {
    auto res = Dispatcher::errorResponse(GatewayError(GatewayErrc::AdmissionDenied, "denied"), 11, false);
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    EXPECT_EQ(res[http::field::retry_after], "60");
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(res.body(), R"({"success": false, "message": "Rate limit exceeded. Please try again later."})");
}

TEST(DispatcherStaticsTest, ErrorStatusMapping) {
    EXPECT_EQ(Dispatcher::statusForError(GatewayError(GatewayErrc::ProbeLimitExceeded, "")),
              http::status::service_unavailable);
    EXPECT_EQ(Dispatcher::statusForError(GatewayError(GatewayErrc::TransportFailed, "")),
              http::status::bad_gateway);
    EXPECT_EQ(Dispatcher::statusForError(GatewayError(GatewayErrc::Cancelled, "")),
              http::status::gateway_timeout);
}
