#pragma once

#include "NetworkRegistry.hpp"
#include "RequestContext.hpp"
#include "Response.hpp"
#include "Settings.hpp"
#include "Transport.hpp"
#include "models.hpp"

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace searchnet {

struct RequestOptions {
	std::vector<std::pair<std::string, std::string>> params; // appended to the query string
	std::vector<std::pair<std::string, std::string>> headers;
	std::map<std::string, std::string> cookies;
	std::map<std::string, std::string> data; // form body
	std::optional<std::string> content;		 // raw body, wins over json and data
	std::optional<nlohmann::json> json;

	std::optional<double> timeout;
	std::optional<bool> allowRedirects; // default: true for GET and OPTIONS
	std::optional<long> maxRedirects;
	std::optional<bool> verify;

	bool raiseForHttpError = false;
};

struct RequestDescriptor {
	std::string method = "GET";
	std::string url;
	RequestOptions options;
};

struct MultiResult {
	std::optional<Response> response;
	std::exception_ptr error;

	bool ok() const { return this->response.has_value() && !this->error; }
};

/**
 * Entry point for engine code. Owns the transport and the network registry;
 * every call resolves a network, builds a fresh RequestContext and runs
 * under that network's retry strategy.
 */
class Dispatcher {
public:
	// Logging is configured from settings before the networks are built
	explicit Dispatcher(const Settings& settings, bool check = true);
	// Networks built elsewhere (custom client factory), no transport owned
	explicit Dispatcher(std::shared_ptr<NetworkRegistry> registry,
						double requestTimeout = RequestContext::DEFAULT_TIMEOUT);
	~Dispatcher();

	Dispatcher(const Dispatcher&) = delete;
	Dispatcher& operator=(const Dispatcher&) = delete;

	Response request(const std::string& method, const std::string& url, const RequestOptions& options = {},
					 const std::string& network = "");
	// A send inside ctx.call(), retried per the context's network
	Response request(RequestContext& ctx, const std::string& method, const std::string& url,
					 const RequestOptions& options = {});

	Response get(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("GET", url, options, network);
	}
	Response post(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("POST", url, options, network);
	}
	Response put(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("PUT", url, options, network);
	}
	Response patch(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("PATCH", url, options, network);
	}
	Response del(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("DELETE", url, options, network);
	}
	Response head(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("HEAD", url, options, network);
	}
	Response options(const std::string& url, const RequestOptions& options = {}, const std::string& network = "") {
		return this->request("OPTIONS", url, options, network);
	}

	Response get(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "GET", url, options);
	}
	Response post(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "POST", url, options);
	}
	Response put(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "PUT", url, options);
	}
	Response patch(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "PATCH", url, options);
	}
	Response del(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "DELETE", url, options);
	}
	Response head(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "HEAD", url, options);
	}
	Response options(RequestContext& ctx, const std::string& url, const RequestOptions& options = {}) {
		return this->request(ctx, "OPTIONS", url, options);
	}

	/**
	 * Returns once the response head arrived; read the body with
	 * response.stream().next(). Closing (or dropping) the stream cancels the
	 * transfer.
	 */
	Response stream(const std::string& method, const std::string& url, const RequestOptions& options = {},
					const std::string& network = "");

	// One thread and one context per request, all sharing the same start time
	std::vector<MultiResult> multiRequest(const std::vector<RequestDescriptor>& requests,
										  const std::string& network = "",
										  std::optional<double> timeout = std::nullopt);

	// Run fn(ctx) under the retry strategy of network
	template <class F>
	auto callWithContext(const std::string& network, std::optional<double> timeout, F&& fn) {
		RequestContext ctx = this->registry_->get(network)->getContext(timeout.value_or(this->defaultTimeout(network)));
		return ctx.call(std::forward<F>(fn));
	}

	NetworkRegistry& registry() { return *this->registry_; }
	double requestTimeout() const { return this->requestTimeout_; }
	// Budget of a call on network without an explicit timeout
	double defaultTimeout(const std::string& network) const {
		return this->registry_->timeoutFor(network).value_or(this->requestTimeout_);
	}

	// Close every network and stop the transport, once
	void shutdown();

	static HttpRequest buildRequest(const std::string& method, const std::string& url, const RequestOptions& options);
	static RequestPolicy buildPolicy(const std::string& method, const RequestOptions& options);
	static SendOptions buildSendOptions(const RequestOptions& options, bool stream = false);

private:
	Response run(const std::string& method, const std::string& url, const RequestOptions& options,
				 const std::string& network, bool stream,
				 std::optional<RequestContext::Clock::time_point> startTime = std::nullopt);

	// Declared first so it is destroyed after the registry
	std::unique_ptr<Transport> transport_;
	std::shared_ptr<NetworkRegistry> registry_;
	double requestTimeout_;
	std::once_flag shutdownOnce_;
};

} // namespace searchnet
