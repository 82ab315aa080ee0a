#include "RetryStrategy.hpp"
#include "Errors.hpp"
#include "RequestContext.hpp"

#include <stdexcept>

namespace searchnet {

namespace {

// Unbinds the context's clients when the call ends
struct ScopedBinding {
	RequestContext& ctx;
	explicit ScopedBinding(RequestContext& ctx) : ctx(ctx) {}
	~ScopedBinding() { this->ctx.resetClient(); }
};

} // namespace

std::unique_ptr<RetryStrategy> RetryStrategy::create(RetryStrategyKind kind) {
	switch (kind) {
		case RetryStrategyKind::Engine:
			return std::make_unique<RetryWithinFunction>();
		case RetryStrategyKind::SameHttpClient:
			return std::make_unique<RetrySameClient>();
		case RetryStrategyKind::DifferentHttpClient:
			return std::make_unique<RetryNewClient>();
	}
	throw std::invalid_argument("Unknown retry strategy");
}

std::optional<Response> RetryStrategy::run(RequestContext& ctx, const Attempt& attempt,
										   const std::function<void()>& onDisconnect) const {
	const auto& logger = ctx.network().logger();

	while (true) {
		if (ctx.remainingTime() <= 0)
			throw TimeoutError("Timeout: the time budget of " + std::to_string(ctx.timeout()) + "s is spent");
		if (ctx.retries() < 0) [[unlikely]]
			throw std::logic_error("Internal error: retries exhausted without a result");

		try {
			return attempt();
		} catch (const SoftRetryError& e) {
			if (ctx.retries() <= 0)
				return e.response();
			logger->debug("{}, retrying ({} left)", e.what(), ctx.retries());
		} catch (const RemoteDisconnectedError& e) {
			if (ctx.takeDisconnectRetry()) {
				// Stale keep-alive connection: one free retry on a fresh connection
				logger->debug("{}, retrying once", e.what());
				onDisconnect();
				continue;
			}
			if (ctx.retries() <= 0)
				throw;
			logger->debug("{}, retrying ({} left)", e.what(), ctx.retries());
		} catch (const TransportError& e) {
			if (ctx.retries() <= 0)
				throw;
			logger->debug("{}, retrying ({} left)", e.what(), ctx.retries());
		} catch (const HttpStatusError& e) {
			if (!ctx.network().retryOnHttpError().matches(e.response().status()) || ctx.retries() <= 0)
				throw;
			logger->debug("{}, retrying ({} left)", e.what(), ctx.retries());
		}
		ctx.consumeRetry();
	}
}

std::optional<Response> RetryStrategy::callOnce(RequestContext& ctx, const std::function<void()>& attempt) const {
	ScopedBinding binding(ctx);
	try {
		attempt();
		return std::nullopt;
	} catch (const SoftRetryError& e) {
		return e.response();
	}
}

Response RetryStrategy::attemptOnce(RequestContext& ctx, HttpClient& client, const HttpRequest& request,
									const RequestPolicy& policy, const SendOptions& options) {
	double remaining = ctx.remainingTime(options.timeout);
	if (remaining <= 0)
		throw TimeoutError("Timeout: no time left to send " + request.url);

	RequestPolicy clamped = policy;
	clamped.timeout = static_cast<float>(remaining);

	Response response = [&]() {
		auto timer = ctx.recordHttpTime();
		return options.stream ? client.stream(request, clamped) : client.send(request, clamped);
	}();

	if (ctx.retries() > 0 && ctx.network().retryOnHttpError().matches(response.status())) {
		std::string reason = "HTTP status " + std::to_string(response.status()) + " is retried";
		throw SoftRetryError(std::move(response), reason);
	}
	return response;
}

// RetryWithinFunction implementation
std::optional<Response> RetryWithinFunction::call(RequestContext& ctx, const std::function<void()>& attempt) const {
	ScopedBinding binding(ctx);

	return this->run(ctx, [&]() -> std::optional<Response> {
		ctx.resetClient();
		attempt();
		return std::nullopt;
	}, [&]() { ctx.resetClient(true); });
}

Response RetryWithinFunction::send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
								   const SendOptions& options) const {
	auto client = ctx.boundClient(options.overrides);
	return attemptOnce(ctx, *client, request, policy, options);
}

// RetrySameClient implementation
std::optional<Response> RetrySameClient::call(RequestContext& ctx, const std::function<void()>& attempt) const {
	return this->callOnce(ctx, attempt);
}

Response RetrySameClient::send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
							   const SendOptions& options) const {
	auto response = this->run(ctx, [&]() -> std::optional<Response> {
		// Rebinds only after a disconnect discarded the bound client
		auto client = ctx.boundClient(options.overrides);
		return attemptOnce(ctx, *client, request, policy, options);
	}, [&]() { ctx.discardClient(options.overrides); });
	return std::move(*response);
}

// RetryNewClient implementation
std::optional<Response> RetryNewClient::call(RequestContext& ctx, const std::function<void()>& attempt) const {
	return this->callOnce(ctx, attempt);
}

Response RetryNewClient::send(RequestContext& ctx, const HttpRequest& request, const RequestPolicy& policy,
							  const SendOptions& options) const {
	std::shared_ptr<HttpClient> client;
	auto response = this->run(ctx, [&]() -> std::optional<Response> {
		client = ctx.newClient(options.overrides);
		return attemptOnce(ctx, *client, request, policy, options);
	}, [&]() { ctx.network().discardClient(client); });
	return std::move(*response);
}

} // namespace searchnet
