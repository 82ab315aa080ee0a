#pragma once

#include "HttpClient.hpp"
#include "Network.hpp"
#include "Response.hpp"
#include "models.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <tuple>

namespace searchnet {

class RequestContext;

// Per-request settings that select another pooled client
struct ClientOverrides {
	std::optional<bool> verify;
	std::optional<long> maxRedirects;

	bool operator<(const ClientOverrides& other) const {
		return std::tie(this->verify, this->maxRedirects) < std::tie(other.verify, other.maxRedirects);
	}
};

struct SendOptions {
	std::optional<double> timeout; // replaces the context budget for this send (still counted from the start)
	ClientOverrides overrides;
	bool stream = false;
};

/**
 * How failed attempts are retried. Every variant runs the same loop:
 *
 *   budget spent                -> TimeoutError
 *   retry-triggering status     -> retries left ? retry : return the response
 *   SoftRetryError              -> retries left ? retry : return its response
 *   first remote disconnect     -> drop the client, retry without using a retry
 *   other TransportError        -> retries left ? retry : rethrow
 *   HttpStatusError             -> retried status and retries left ? retry : rethrow
 *
 * Anything else (invalid arguments, configuration errors) propagates at once.
 */
class RetryStrategy {
public:
	virtual ~RetryStrategy() = default;

	/**
	 * Run attempt within the strategy. Returns the fallback response when the
	 * loop ended on a SoftRetryError, nullopt when attempt returned normally.
	 */
	virtual std::optional<Response> call(RequestContext& ctx, const std::function<void()>& attempt) const = 0;

	virtual Response send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
						  const SendOptions& options) const = 0;

	virtual RetryStrategyKind kind() const = 0;
	const char* name() const { return retryStrategyName(this->kind()); }

	static std::unique_ptr<RetryStrategy> create(RetryStrategyKind kind);

protected:
	using Attempt = std::function<std::optional<Response>()>;

	// The shared loop. onDisconnect runs before the free retry after a remote disconnect.
	std::optional<Response> run(RequestContext& ctx, const Attempt& attempt, const std::function<void()>& onDisconnect) const;

	// attempt once with the context's clients unbound afterwards, a SoftRetryError yields its response
	std::optional<Response> callOnce(RequestContext& ctx, const std::function<void()>& attempt) const;

	/**
	 * One send on client with the timeout clamped to the remaining budget.
	 * A retry-triggering status becomes a SoftRetryError while retries are left.
	 */
	static Response attemptOnce(RequestContext& ctx, HttpClient& client, const HttpRequest& request,
								const RequestPolicy& policy, const SendOptions& options);
};

// Retries the caller's whole closure, binding a fresh client before each run
class RetryWithinFunction : public RetryStrategy {
public:
	std::optional<Response> call(RequestContext& ctx, const std::function<void()>& attempt) const override;
	// Single attempt, the enclosing call() retries
	Response send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
				  const SendOptions& options) const override;
	RetryStrategyKind kind() const override { return RetryStrategyKind::Engine; }
};

// Retries a send on the bound client
class RetrySameClient : public RetryStrategy {
public:
	std::optional<Response> call(RequestContext& ctx, const std::function<void()>& attempt) const override;
	Response send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
				  const SendOptions& options) const override;
	RetryStrategyKind kind() const override { return RetryStrategyKind::SameHttpClient; }
};

// Retries a send, each attempt on a new client from the rotation
class RetryNewClient : public RetryStrategy {
public:
	std::optional<Response> call(RequestContext& ctx, const std::function<void()>& attempt) const override;
	Response send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
				  const SendOptions& options) const override;
	RetryStrategyKind kind() const override { return RetryStrategyKind::DifferentHttpClient; }
};

} // namespace searchnet
