#include "Dispatcher.hpp"
#include "Errors.hpp"
#include "Settings.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace searchnet;

static const char* DEFAULT_SETTINGS = R"({
	"outgoing": {
		"request_timeout": 5.0,
		"retries": 0,
		"networks": {
			"flaky": { "retries": 3, "retry_on_http_error": [503], "retry_strategy": "different_http_client" },
			"scoped": { "retries": 1, "retry_on_http_error": true, "retry_strategy": "engine" }
		}
	},
	"engines": [
		{ "name": "httpbin", "network": { "retries": 1 } }
	],
	"log_level": "info"
})";

void printResponse(const Response& response) {
	std::cout << "Elapsed: " << response.elapsed() << "s" << std::endl;
	std::cout << "Status: " << response.status() << std::endl;
	std::cout << "Url: " << response.url() << std::endl;
	std::cout << "Body length: " << response.text().length() << std::endl;
}

void printTime() {
	auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::cout << "[" << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S") << "] ";
}

void testGET(Dispatcher& dispatcher) {
	std::cout << "GET request on the engine network..." << std::endl;

	RequestOptions options;
	options.params = {{"q", "c++ networking"}};
	options.headers = {{"Accept", "application/json"}};

	auto response = dispatcher.get("https://httpbin.org/get", options, "httpbin");
	printResponse(response);
	std::cout << "Echoed args: " << response.json()["args"].dump() << std::endl;
}

void testPOST(Dispatcher& dispatcher) {
	std::cout << "POST request with a JSON body..." << std::endl;

	RequestOptions options;
	options.json = nlohmann::json{{"name", "test"}, {"value", "123"}};

	auto response = dispatcher.post("https://httpbin.org/post", options);
	printResponse(response);
}

void testRetry(Dispatcher& dispatcher) {
	std::cout << "Request retried on 503 with a new client per attempt..." << std::endl;

	auto start = std::chrono::steady_clock::now();
	printTime();
	std::cout << "Sending request (expecting 503 response)..." << std::endl;

	auto response = dispatcher.get("https://httpbin.org/status/503", {}, "flaky");
	auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	printTime();
	std::cout << "Final status after " << duration.count() / 1000.0 << "s: " << response.status() << std::endl;
}

void testMultiRequest(Dispatcher& dispatcher) {
	std::cout << "Concurrent requests sharing one deadline..." << std::endl;

	std::vector<RequestDescriptor> requests(4);
	for (size_t i = 0; i < requests.size(); ++i)
		requests[i].url = "https://httpbin.org/get?slot=" + std::to_string(i);
	requests[3].url = "https://httpbin.org/delay/10";

	auto start = std::chrono::steady_clock::now();
	auto results = dispatcher.multiRequest(requests, "", 3.0);
	auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	for (size_t i = 0; i < results.size(); ++i) {
		std::cout << "  [" << i << "] ";
		if (results[i].ok()) {
			std::cout << "status " << results[i].response->status() << std::endl;
			continue;
		}
		try {
			std::rethrow_exception(results[i].error);
		} catch (const std::exception& e) {
			std::cout << "failed: " << e.what() << std::endl;
		}
	}
	std::cout << "Total wall-clock time: " << duration.count() / 1000.0 << "s" << std::endl;
}

void testStream(Dispatcher& dispatcher) {
	std::cout << "Streamed response read chunk by chunk..." << std::endl;

	auto response = dispatcher.stream("GET", "https://httpbin.org/drip?duration=2&numbytes=100&delay=0");
	printTime();
	std::cout << "Head received, status " << response.status() << std::endl;

	size_t chunks = 0, bytes = 0;
	while (auto chunk = response.stream().next()) {
		++chunks;
		bytes += chunk->size();
	}
	printTime();
	std::cout << "Read " << bytes << " bytes in " << chunks << " chunks" << std::endl;
}

void testContext(Dispatcher& dispatcher) {
	std::cout << "Two requests retried together as one unit..." << std::endl;

	int runs = 0;
	auto origin = dispatcher.callWithContext("scoped", 10.0, [&](RequestContext& ctx) {
		++runs;
		auto ip = dispatcher.get(ctx, "https://httpbin.org/ip");
		dispatcher.get(ctx, "https://httpbin.org/headers");
		std::cout << "  remaining " << ctx.remainingTime() << "s, http time " << ctx.httpTime() << "s" << std::endl;
		return ip.json()["origin"].get<std::string>();
	});
	std::cout << "Origin: " << origin << " after " << runs << " run(s)" << std::endl;
}

int main(int argc, char** argv) {
	std::cout << "========================================" << std::endl;
	std::cout << "   searchnet Example" << std::endl;
	std::cout << "========================================" << std::endl << std::endl;

	std::cout << "Note: These examples require internet connection" << std::endl;
	std::cout << "      to reach https://httpbin.org/" << std::endl << std::endl;

	try {
		Settings settings =
			argc > 1 ? Settings::load(argv[1]) : Settings::fromJson(nlohmann::json::parse(DEFAULT_SETTINGS));
		Dispatcher dispatcher(settings);

		std::cout << "\n[1] GET" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testGET(dispatcher);

		std::cout << "\n[2] POST" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testPOST(dispatcher);

		std::cout << "\n[3] Retry" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testRetry(dispatcher);

		std::cout << "\n[4] Multi Request" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testMultiRequest(dispatcher);

		std::cout << "\n[5] Stream" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testStream(dispatcher);

		std::cout << "\n[6] Request Context" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testContext(dispatcher);

		dispatcher.shutdown();
		return 0;
	} catch (const NetworkError& e) {
		std::cerr << "Network error: " << e.what() << std::endl;
		return 1;
	} catch (const std::exception& e) {
		std::cerr << "Failed with exception: " << e.what() << std::endl;
		return 1;
	}
}
