#pragma once

#include "Errors.hpp"
#include "HttpClient.hpp"
#include "Network.hpp"
#include "Response.hpp"
#include "RetryStrategy.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace searchnet {

/**
 * Per-call state: the time budget, the retry budget and the client(s) bound
 * by the retry strategy. Created fresh for every top-level call and not
 * shared between threads.
 */
class RequestContext {
public:
	using Clock = std::chrono::steady_clock;

	static constexpr double DEFAULT_TIMEOUT = 120.0;
	// Slack added to every budget
	static constexpr double OVERHEAD = 0.2;

	RequestContext(Network& network, std::optional<double> timeout = std::nullopt,
				   std::optional<Clock::time_point> startTime = std::nullopt);

	RequestContext(const RequestContext&) = delete;
	RequestContext& operator=(const RequestContext&) = delete;
	RequestContext(RequestContext&&) = default;

	// (overrideTimeout or timeout) + OVERHEAD - elapsed, in second
	double remainingTime(std::optional<double> overrideTimeout = std::nullopt) const;
	// Seconds spent inside HTTP sends so far
	double httpTime() const { return this->httpTime_; }
	double timeout() const { return this->timeout_; }
	Clock::time_point startTime() const { return this->startTime_; }

	int retries() const { return this->retries_; }
	void consumeRetry() { --this->retries_; }

	// True the first time only: one free retry after a remote disconnect per context
	bool takeDisconnectRetry() { return !std::exchange(this->disconnectRetried_, true); }

	Network& network() const { return *this->network_; }

	class HttpTimer {
	public:
		explicit HttpTimer(RequestContext& ctx) : ctx_(ctx), start_(Clock::now()) {}
		~HttpTimer() {
			this->ctx_.httpTime_ += std::chrono::duration<double>(Clock::now() - this->start_).count();
		}

		HttpTimer(const HttpTimer&) = delete;
		HttpTimer& operator=(const HttpTimer&) = delete;

	private:
		RequestContext& ctx_;
		Clock::time_point start_;
	};

	HttpTimer recordHttpTime() { return HttpTimer(*this); }

	// The bound client for these overrides, bound on first use and rebound once closed
	std::shared_ptr<HttpClient> boundClient(const ClientOverrides& overrides = ClientOverrides());
	bool hasClient(const ClientOverrides& overrides = ClientOverrides()) const;
	// A client from the network's rotation, not bound
	std::shared_ptr<HttpClient> newClient(const ClientOverrides& overrides = ClientOverrides());
	// Unbind the client for these overrides and drop it from the network's pool
	void discardClient(const ClientOverrides& overrides = ClientOverrides());
	// Unbind every client, dropping them from the pool first when discard is set
	void resetClient(bool discard = false);

	/**
	 * Run fn(*this) under the network's retry strategy and return its
	 * result. When retries end on a SoftRetryError its response is returned
	 * if fn returns a Response; otherwise it is raised as HttpStatusError.
	 */
	template <class F>
	std::invoke_result_t<F&, RequestContext&> call(F&& fn);

	// One send, retried per the strategy. Use inside call() or standalone.
	Response send(const HttpRequest& request, const RequestPolicy& policy = RequestPolicy(),
				  const SendOptions& options = SendOptions());
	// call() around a single send
	Response request(const HttpRequest& request, const RequestPolicy& policy = RequestPolicy(),
					 const SendOptions& options = SendOptions());

private:
	Network* network_;
	const RetryStrategy* strategy_;

	int retries_;
	Clock::time_point startTime_;
	double timeout_;
	double httpTime_ = 0.0;
	bool disconnectRetried_ = false;

	std::map<ClientOverrides, std::shared_ptr<HttpClient>> clients_;
};

template <class F>
std::invoke_result_t<F&, RequestContext&> RequestContext::call(F&& fn) {
	using R = std::invoke_result_t<F&, RequestContext&>;

	if constexpr (std::is_void_v<R>) {
		std::optional<Response> fallback = this->strategy_->call(*this, [&]() { fn(*this); });
		if (fallback)
			throw HttpStatusError(std::move(*fallback));
	} else {
		std::optional<R> result;
		std::optional<Response> fallback = this->strategy_->call(*this, [&]() { result.emplace(fn(*this)); });
		if (fallback) {
			if constexpr (std::is_same_v<std::decay_t<R>, Response>)
				return std::move(*fallback);
			else
				throw HttpStatusError(std::move(*fallback));
		}
		return std::move(*result);
	}
}

} // namespace searchnet
