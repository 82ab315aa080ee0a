#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "Errors.hpp"
#include "HttpClient.hpp"
#include "Response.hpp"
#include "Transport.hpp"

using namespace searchnet;

namespace {

HttpResponse native(long status, std::string body = "") {
	HttpResponse response;
	response.status = status;
	response.effectiveUrl = "https://example.org/final";
	response.headers = {"HTTP/1.1 200 OK", "Content-Type:  application/json ", "X-Dup: first", "x-dup: second"};
	response.body = std::move(body);
	return response;
}

} // namespace

// --- ResponseTest ---

TEST(ResponseTest, Accessors) {
	Response response(native(200, R"({"results": [1, 2]})"), "get", "https://example.org/search");
	EXPECT_EQ(response.method(), "GET");
	EXPECT_EQ(response.url(), "https://example.org/search");
	EXPECT_TRUE(response.ok());
	EXPECT_EQ(response.json()["results"].size(), 2u);
	EXPECT_FALSE(response.isStream());
}

TEST(ResponseTest, UrlFallsBackToTheEffectiveUrl) {
	Response response(native(200));
	EXPECT_EQ(response.url(), "https://example.org/final");
}

TEST(ResponseTest, HeaderLookupIsCaseInsensitive) {
	Response response(native(200));
	EXPECT_EQ(response.header("content-type"), "application/json");
	EXPECT_EQ(response.header("X-DUP"), "first");
	EXPECT_FALSE(response.header("Location").has_value());
}

TEST(ResponseTest, RaiseForStatus) {
	Response fine(native(302));
	EXPECT_NO_THROW(fine.raiseForStatus());

	Response missing(native(404));
	EXPECT_FALSE(missing.ok());
	try {
		missing.raiseForStatus();
		FAIL() << "expected HttpStatusError";
	} catch (const HttpStatusError& e) {
		EXPECT_EQ(e.response().status(), 404);
	}
}

TEST(ResponseTest, InvalidJson) {
	Response response(native(200, "<html>"));
	EXPECT_THROW(response.json(), nlohmann::json::parse_error);
}

TEST(ResponseTest, StreamRequiresAStreamedResponse) {
	Response response(native(200));
	EXPECT_THROW(response.stream(), std::logic_error);

	response.attachStream(std::make_shared<BodyStream>(16));
	EXPECT_TRUE(response.isStream());
	EXPECT_NO_THROW(response.stream());
}

// --- TransportErrorTest ---

TEST(TransportErrorTest, CurlCodesMapToErrorKinds) {
	EXPECT_THROW(throwTransportError(CURLE_OPERATION_TIMEDOUT), TimeoutError);
	EXPECT_THROW(throwTransportError(CURLE_GOT_NOTHING), RemoteDisconnectedError);
	EXPECT_THROW(throwTransportError(CURLE_RECV_ERROR), RemoteDisconnectedError);
	EXPECT_THROW(throwTransportError(CURLE_PEER_FAILED_VERIFICATION), TlsError);
	EXPECT_THROW(throwTransportError(CURLE_SSL_CONNECT_ERROR), TlsError);

	try {
		throwTransportError(CURLE_COULDNT_CONNECT, "10.0.0.1");
		FAIL() << "expected TransportError";
	} catch (const TimeoutError&) {
		FAIL() << "not a timeout";
	} catch (const TransportError& e) {
		EXPECT_EQ(e.curlCode(), CURLE_COULDNT_CONNECT);
		EXPECT_NE(std::string(e.what()).find("10.0.0.1"), std::string::npos);
	}
}

// --- ProxySelectionTest ---

TEST(ProxySelectionTest, MostSpecificPatternWins) {
	ProxySet proxies = {
		{"all://", "http://any:3128"},
		{"https://", "http://secure:3128"},
		{"https://Example.org", "http://host:3128"},
	};

	EXPECT_EQ(CurlHttpClient::selectProxy(proxies, "https://example.org/search"), "http://host:3128");
	EXPECT_EQ(CurlHttpClient::selectProxy(proxies, "https://other.org/"), "http://secure:3128");
	EXPECT_EQ(CurlHttpClient::selectProxy(proxies, "http://example.org/"), "http://any:3128");
}

TEST(ProxySelectionTest, NoMatchingPattern) {
	ProxySet proxies = {{"https://", "http://secure:3128"}};
	EXPECT_FALSE(CurlHttpClient::selectProxy(proxies, "http://example.org/").has_value());
	EXPECT_FALSE(CurlHttpClient::selectProxy(proxies, "not a url").has_value());
	EXPECT_FALSE(CurlHttpClient::selectProxy(ProxySet(), "https://example.org/").has_value());
}

// --- BodyStreamTest ---

TEST(BodyStreamTest, ChunksInOrderThenEnd) {
	BodyStream stream(64);
	EXPECT_EQ(stream.push("ab", 2), BodyStream::PushResult::Accepted);
	EXPECT_EQ(stream.push("cd", 2), BodyStream::PushResult::Accepted);
	stream.finish(CURLE_OK, "", native(200));

	EXPECT_EQ(stream.next(), "ab");
	EXPECT_EQ(stream.next(), "cd");
	EXPECT_FALSE(stream.next().has_value());
	EXPECT_TRUE(stream.finished());
}

TEST(BodyStreamTest, FailedTransferThrowsAfterTheBufferedChunks) {
	BodyStream stream(64);
	stream.push("partial", 7);
	stream.finish(CURLE_RECV_ERROR, "connection reset", native(200));

	EXPECT_EQ(stream.next(), "partial");
	EXPECT_THROW(stream.next(), RemoteDisconnectedError);
	EXPECT_EQ(stream.result(), CURLE_RECV_ERROR);
	EXPECT_EQ(stream.error(), "connection reset");
}

TEST(BodyStreamTest, FullBufferPausesTheProducer) {
	BodyStream stream(4);
	EXPECT_EQ(stream.push("abcd", 4), BodyStream::PushResult::Accepted);
	EXPECT_EQ(stream.push("ef", 2), BodyStream::PushResult::Pause);

	EXPECT_EQ(stream.next(), "abcd");
	EXPECT_EQ(stream.push("ef", 2), BodyStream::PushResult::Accepted);
	EXPECT_EQ(stream.next(), "ef");
}

TEST(BodyStreamTest, CloseAbortsAndReleasesResources) {
	auto resource = std::make_shared<int>(1);
	BodyStream stream(64);
	stream.holdResource(resource);
	stream.push("ab", 2);
	EXPECT_EQ(resource.use_count(), 2);

	stream.close();
	EXPECT_EQ(resource.use_count(), 1);
	EXPECT_EQ(stream.push("cd", 2), BodyStream::PushResult::Abort);
	EXPECT_FALSE(stream.next().has_value());

	// A late failure report is not surfaced after close
	stream.finish(CURLE_RECV_ERROR, "late", native(200));
	EXPECT_FALSE(stream.next().has_value());
}

TEST(BodyStreamTest, WaitHead) {
	BodyStream stream(64);
	EXPECT_FALSE(stream.waitHead(0.05f));

	std::thread producer([&]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
		stream.publishHead(native(201, "dropped"));
	});
	EXPECT_TRUE(stream.waitHead(5.0f));
	producer.join();

	EXPECT_EQ(stream.head().status, 201);
	EXPECT_TRUE(stream.head().body.empty());
}

TEST(BodyStreamTest, NextBlocksUntilData) {
	BodyStream stream(64);
	std::thread producer([&]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
		stream.push("late", 4);
		stream.finish(CURLE_OK, "", native(200));
	});

	EXPECT_EQ(stream.next(), "late");
	EXPECT_FALSE(stream.next().has_value());
	producer.join();
}
