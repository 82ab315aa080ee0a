#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <stdexcept>

#include "Errors.hpp"
#include "Network.hpp"
#include "RequestContext.hpp"
#include "Response.hpp"
#include "RetryStrategy.hpp"
#include "mock_http_client.hpp"

using namespace searchnet;
using namespace searchnet::mock;

namespace {

HttpRequest get(const std::string& url = "https://example.org/search") {
	HttpRequest request;
	request.url = url;
	request.methodName = "GET";
	return request;
}

std::unique_ptr<Network> make_network(const MockFactory& mocks, NetworkSettings settings) {
	return std::make_unique<Network>("test", std::move(settings), mocks.factory());
}

NetworkSettings with_retries(int retries, RetryOnHttpError retryOn, RetryStrategyKind kind) {
	NetworkSettings settings;
	settings.retries = retries;
	settings.retryOnHttpError = std::move(retryOn);
	settings.retryStrategy = kind;
	return settings;
}

NetworkSettings two_addresses(NetworkSettings settings) {
	settings.sourceAddresses = {IpAddress::parse("10.0.0.1"), IpAddress::parse("10.0.0.2")};
	return settings;
}

} // namespace

// --- RetryOnHttpErrorTest ---

TEST(RetryOnHttpErrorTest, Modes) {
	EXPECT_FALSE(RetryOnHttpError::never().matches(503));

	auto any = RetryOnHttpError::anyError();
	EXPECT_TRUE(any.matches(400));
	EXPECT_TRUE(any.matches(599));
	EXPECT_FALSE(any.matches(399));
	EXPECT_FALSE(any.matches(600));

	auto one = RetryOnHttpError::status(403);
	EXPECT_TRUE(one.matches(403));
	EXPECT_FALSE(one.matches(404));

	auto set = RetryOnHttpError::statusSet({429, 503});
	EXPECT_TRUE(set.matches(429));
	EXPECT_TRUE(set.matches(503));
	EXPECT_FALSE(set.matches(500));
}

TEST(RetryStrategyTest, ParseNames) {
	EXPECT_EQ(parseRetryStrategy("engine"), RetryStrategyKind::Engine);
	EXPECT_EQ(parseRetryStrategy("SAME_HTTP_CLIENT"), RetryStrategyKind::SameHttpClient);
	EXPECT_EQ(parseRetryStrategy("different_http_client"), RetryStrategyKind::DifferentHttpClient);
	EXPECT_THROW(parseRetryStrategy("sometimes"), ConfigurationError);

	EXPECT_STREQ(retryStrategyName(RetryStrategyKind::SameHttpClient), "same_http_client");
	EXPECT_EQ(RetryStrategy::create(RetryStrategyKind::Engine)->kind(), RetryStrategyKind::Engine);
}

// --- Status driven retries, for every strategy ---

class RetryLoopTest : public ::testing::TestWithParam<RetryStrategyKind> {};

TEST_P(RetryLoopTest, RetriedStatusThenSuccess) {
	MockFactory mocks;
	mocks.script()->push(Step::http(403));
	mocks.script()->push(Step::http(200));
	auto network = make_network(mocks, with_retries(1, RetryOnHttpError::status(403), GetParam()));

	auto ctx = network->getContext(5.0);
	auto response = ctx.request(get());

	EXPECT_EQ(response.status(), 200);
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
}

TEST_P(RetryLoopTest, LastAttemptWinsOverException) {
	MockFactory mocks;
	mocks.script()->push(Step::http(403));
	mocks.script()->push(Step::http(403));
	auto network = make_network(mocks, with_retries(1, RetryOnHttpError::status(403), GetParam()));

	auto ctx = network->getContext(5.0);
	Response response;
	ASSERT_NO_THROW(response = ctx.request(get()));

	EXPECT_EQ(response.status(), 403);
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
}

TEST_P(RetryLoopTest, NoRetriesMeansOneAttempt) {
	MockFactory mocks;
	mocks.script()->push(Step::http(503));
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::anyError(), GetParam()));

	auto ctx = network->getContext(5.0);
	EXPECT_EQ(ctx.request(get()).status(), 503);
	EXPECT_EQ(mocks.script()->attemptCount(), 1u);
}

TEST_P(RetryLoopTest, NoRetriesTransportFailureIsRaised) {
	MockFactory mocks;
	mocks.script()->push(Step::failure());
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::anyError(), GetParam()));

	auto ctx = network->getContext(5.0);
	EXPECT_THROW(ctx.request(get()), TransportError);
	EXPECT_EQ(mocks.script()->attemptCount(), 1u);
}

TEST_P(RetryLoopTest, TransportFailuresUseTheBudget) {
	MockFactory mocks;
	for (int i = 0; i < 3; ++i)
		mocks.script()->push(Step::failure());
	auto network = make_network(mocks, with_retries(2, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	EXPECT_THROW(ctx.request(get()), TransportError);
	EXPECT_EQ(mocks.script()->attemptCount(), 3u);
}

TEST_P(RetryLoopTest, TlsErrorIsRetried) {
	MockFactory mocks;
	mocks.script()->push(Step::tls());
	mocks.script()->push(Step::ok("fine"));
	auto network = make_network(mocks, with_retries(1, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	auto response = ctx.request(get());
	EXPECT_EQ(response.text(), "fine");
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
}

TEST_P(RetryLoopTest, DisconnectRetryIsFree) {
	MockFactory mocks;
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::ok());
	auto network = make_network(mocks, with_retries(2, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	EXPECT_EQ(ctx.request(get()).status(), 200);
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
	EXPECT_EQ(ctx.retries(), 2);
}

TEST_P(RetryLoopTest, DisconnectRetryWithoutBudget) {
	MockFactory mocks;
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::ok());
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	EXPECT_EQ(ctx.request(get()).status(), 200);
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
}

TEST_P(RetryLoopTest, SecondDisconnectIsNotFree) {
	MockFactory mocks;
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::ok());
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	EXPECT_THROW(ctx.request(get()), RemoteDisconnectedError);
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
}

TEST_P(RetryLoopTest, DisconnectDropsTheClientFromThePool) {
	MockFactory mocks;
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::ok());
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	ctx.request(get());

	auto attempts = mocks.script()->attempts();
	ASSERT_EQ(attempts.size(), 2u);
	EXPECT_NE(attempts[0].client, attempts[1].client);

	// Not closed under concurrent users, only no longer handed out
	auto broken = mocks.clients().front();
	EXPECT_FALSE(broken->isClosed());
	EXPECT_NE(network->getClient().get(), broken.get());
}

TEST_P(RetryLoopTest, OneFreeDisconnectPerCall) {
	MockFactory mocks;
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::ok());
	mocks.script()->push(Step::disconnect());
	mocks.script()->push(Step::ok());
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	auto twoSends = [](RequestContext& c) {
		c.send(get("https://example.org/1"));
		c.send(get("https://example.org/2"));
	};
	EXPECT_THROW(ctx.call(twoSends), RemoteDisconnectedError);
	EXPECT_EQ(mocks.script()->attemptCount(), 3u);
}

TEST_P(RetryLoopTest, UnretriedHttpStatusErrorPropagates) {
	MockFactory mocks;
	for (int i = 0; i < 3; ++i)
		mocks.script()->push(Step::http(404));
	auto network = make_network(mocks, with_retries(2, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	auto raising = [&](RequestContext& c) {
		++runs;
		c.send(get()).raiseForStatus();
	};
	EXPECT_THROW(ctx.call(raising), HttpStatusError);
	EXPECT_EQ(runs, 1);
	EXPECT_EQ(mocks.script()->attemptCount(), 1u);
}

TEST_P(RetryLoopTest, DeadlineWinsOverRetryCounter) {
	MockFactory mocks;
	for (int i = 0; i < 6; ++i)
		mocks.script()->push(Step::failure(1.5));
	auto network = make_network(mocks, with_retries(5, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(2.0);
	EXPECT_THROW(ctx.request(get()), TimeoutError);
	EXPECT_EQ(mocks.script()->attemptCount(), 2u);
	EXPECT_LE(ctx.remainingTime(), 0.0);
}

TEST_P(RetryLoopTest, AttemptTimeoutIsClampedToTheBudget) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::never(), GetParam()));

	auto ctx = network->getContext(1.0);
	ctx.request(get());

	auto attempts = mocks.script()->attempts();
	ASSERT_EQ(attempts.size(), 1u);
	EXPECT_GT(attempts[0].timeout, 1.0f);
	EXPECT_LE(attempts[0].timeout, 1.0f + static_cast<float>(RequestContext::OVERHEAD));
}

TEST_P(RetryLoopTest, InvalidArgumentIsNotRetried) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(3, RetryOnHttpError::anyError(), GetParam()));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	EXPECT_THROW(ctx.call([&](RequestContext&) -> Response {
		++runs;
		throw std::invalid_argument("bad url");
	}),
				 std::invalid_argument);
	EXPECT_EQ(runs, 1);
}

INSTANTIATE_TEST_SUITE_P(Strategies, RetryLoopTest,
						 ::testing::Values(RetryStrategyKind::Engine, RetryStrategyKind::SameHttpClient,
										   RetryStrategyKind::DifferentHttpClient),
						 [](const ::testing::TestParamInfo<RetryStrategyKind>& info) {
							 switch (info.param) {
								 case RetryStrategyKind::Engine: return std::string("Engine");
								 case RetryStrategyKind::SameHttpClient: return std::string("SameHttpClient");
								 case RetryStrategyKind::DifferentHttpClient: return std::string("DifferentHttpClient");
							 }
							 return std::string("Unknown");
						 });

// --- Strategy specific client binding ---

TEST(RetrySameClientTest, RetriesOnTheBoundClient) {
	MockFactory mocks;
	mocks.script()->push(Step::http(503));
	mocks.script()->push(Step::http(503));
	mocks.script()->push(Step::ok());
	auto network = make_network(
		mocks, two_addresses(with_retries(2, RetryOnHttpError::anyError(), RetryStrategyKind::SameHttpClient)));

	auto ctx = network->getContext(5.0);
	EXPECT_EQ(ctx.request(get()).status(), 200);

	auto attempts = mocks.script()->attempts();
	ASSERT_EQ(attempts.size(), 3u);
	for (const auto& attempt : attempts)
		EXPECT_EQ(attempt.sourceAddress, attempts[0].sourceAddress);
}

TEST(RetryNewClientTest, EveryAttemptRotates) {
	MockFactory mocks;
	mocks.script()->push(Step::http(503));
	mocks.script()->push(Step::http(503));
	mocks.script()->push(Step::ok());
	auto network = make_network(
		mocks, two_addresses(with_retries(2, RetryOnHttpError::anyError(), RetryStrategyKind::DifferentHttpClient)));

	auto ctx = network->getContext(5.0);
	EXPECT_EQ(ctx.request(get()).status(), 200);

	auto attempts = mocks.script()->attempts();
	ASSERT_EQ(attempts.size(), 3u);
	EXPECT_EQ(attempts[0].sourceAddress, "10.0.0.1");
	EXPECT_EQ(attempts[1].sourceAddress, "10.0.0.2");
	EXPECT_EQ(attempts[2].sourceAddress, "10.0.0.1");
}

TEST(RetryWithinFunctionTest, ClosureIsTheUnitOfRetry) {
	MockFactory mocks;
	mocks.script()->push(Step::ok());
	mocks.script()->push(Step::http(503));
	mocks.script()->push(Step::ok());
	mocks.script()->push(Step::ok());
	auto network = make_network(
		mocks, two_addresses(with_retries(1, RetryOnHttpError::anyError(), RetryStrategyKind::Engine)));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	long status = ctx.call([&](RequestContext& c) {
		++runs;
		c.send(get("https://example.org/token"));
		return c.send(get()).status();
	});

	EXPECT_EQ(status, 200);
	EXPECT_EQ(runs, 2);

	auto attempts = mocks.script()->attempts();
	ASSERT_EQ(attempts.size(), 4u);
	// Both sends of one run share the client bound for that run
	EXPECT_EQ(attempts[0].sourceAddress, attempts[1].sourceAddress);
	EXPECT_EQ(attempts[2].sourceAddress, attempts[3].sourceAddress);
	EXPECT_NE(attempts[0].sourceAddress, attempts[2].sourceAddress);
}

TEST(RetryWithinFunctionTest, SoftRetryFallbackIsReturned) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(1, RetryOnHttpError::never(), RetryStrategyKind::Engine));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	Response response = ctx.call([&](RequestContext& c) -> Response {
		++runs;
		auto r = c.send(get());
		throw SoftRetryError(r, "captcha page");
	});

	EXPECT_EQ(runs, 2);
	EXPECT_EQ(response.status(), 200);
}

TEST(RetryWithinFunctionTest, SoftRetryFallbackOfVoidClosureRaises) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(0, RetryOnHttpError::never(), RetryStrategyKind::Engine));

	auto ctx = network->getContext(5.0);
	EXPECT_THROW(ctx.call([&](RequestContext& c) { throw SoftRetryError(c.send(get())); }), HttpStatusError);
}

TEST(RetryWithinFunctionTest, RetriedHttpStatusErrorRerunsTheClosure) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(2, RetryOnHttpError::status(404), RetryStrategyKind::Engine));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	auto raising = [&](RequestContext&) {
		++runs;
		HttpResponse native;
		native.status = 404;
		throw HttpStatusError(Response(native));
	};
	EXPECT_THROW(ctx.call(raising), HttpStatusError);
	EXPECT_EQ(runs, 3);
	EXPECT_EQ(ctx.retries(), 0);
}

TEST(RetryWithinFunctionTest, OtherHttpStatusErrorIsNotRetried) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(2, RetryOnHttpError::status(404), RetryStrategyKind::Engine));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	auto raising = [&](RequestContext&) {
		++runs;
		HttpResponse native;
		native.status = 500;
		throw HttpStatusError(Response(native));
	};
	EXPECT_THROW(ctx.call(raising), HttpStatusError);
	EXPECT_EQ(runs, 1);
}

TEST(RetryNewClientTest, SoftRetryInClosureIsNotRetried) {
	MockFactory mocks;
	auto network = make_network(mocks, with_retries(3, RetryOnHttpError::never(), RetryStrategyKind::DifferentHttpClient));

	auto ctx = network->getContext(5.0);
	int runs = 0;
	Response response = ctx.call([&](RequestContext& c) -> Response {
		++runs;
		throw SoftRetryError(c.send(get()));
	});

	EXPECT_EQ(runs, 1);
	EXPECT_EQ(response.status(), 200);
}
