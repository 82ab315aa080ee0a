#pragma once

#include "AddressRotator.hpp"
#include "ConnectionPool.hpp"
#include "HttpClient.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

namespace searchnet {

class RequestContext;
class RetryStrategy;

enum class RetryStrategyKind { Engine, SameHttpClient, DifferentHttpClient };

// "engine", "same_http_client", "different_http_client", case-insensitive
RetryStrategyKind parseRetryStrategy(std::string_view name);
const char* retryStrategyName(RetryStrategyKind kind);

/**
 * Which response statuses trigger a retry.
 */
class RetryOnHttpError {
public:
	enum class Mode { Never, AnyError, Status, StatusSet };

	RetryOnHttpError() = default;

	static RetryOnHttpError never() { return RetryOnHttpError(); }
	// Any status in [400, 599]
	static RetryOnHttpError anyError();
	static RetryOnHttpError status(long status);
	static RetryOnHttpError statusSet(std::set<long> statuses);

	bool matches(long status) const;
	Mode mode() const { return this->mode_; }
	const std::set<long>& statuses() const { return this->statuses_; }

private:
	Mode mode_ = Mode::Never;
	std::set<long> statuses_;
};

struct NetworkSettings {
	bool enableHttp = false;
	bool enableHttp2 = true;
	bool verify = true;
	std::string caBundle;	// verify against this bundle instead of the system store
	long maxRedirects = 30;

	std::vector<SourceAddress> sourceAddresses;
	ProxyMap proxies;
	bool usingTorProxy = false;

	long maxConnections = 10;
	long maxKeepaliveConnections = 100;
	float keepaliveExpiry = 5.0f;

	int retries = 0;
	RetryOnHttpError retryOnHttpError;
	RetryStrategyKind retryStrategy = RetryStrategyKind::DifferentHttpClient;
};

/**
 * A named egress configuration. Hands out clients rotating over its source
 * addresses and proxies, and request contexts bound to its retry strategy.
 */
class Network {
public:
	using Clock = std::chrono::steady_clock;

	static constexpr const char* TOR_CHECK_URL = "https://check.torproject.org/api/ip";
	static constexpr float TOR_CHECK_TIMEOUT = 10.0f;

	// Throws ConfigurationError on inconsistent settings
	Network(std::string name, NetworkSettings settings, ClientFactory factory);
	~Network();

	Network(const Network&) = delete;
	Network& operator=(const Network&) = delete;

	const std::string& name() const { return this->name_; }
	const NetworkSettings& settings() const { return this->settings_; }
	const RetryOnHttpError& retryOnHttpError() const { return this->settings_.retryOnHttpError; }
	const RetryStrategy& retryStrategy() const { return *this->strategy_; }
	const std::shared_ptr<spdlog::logger>& logger() const { return this->logger_; }

	// A fresh context per top-level call; timeout defaults to RequestContext::DEFAULT_TIMEOUT
	RequestContext getContext(std::optional<double> timeout = std::nullopt,
							  std::optional<Clock::time_point> startTime = std::nullopt);

	/**
	 * Next client in the rotation. verify and maxRedirects override the
	 * network settings and select another pooled client.
	 * Throws ConfigurationError when the Tor check of a new client fails.
	 */
	std::shared_ptr<HttpClient> getClient(std::optional<bool> verify = std::nullopt,
										  std::optional<long> maxRedirects = std::nullopt);

	// Drop client from the pool after a broken connection, without closing it
	void discardClient(const std::shared_ptr<HttpClient>& client);

	// Creates one client; false (and an error log line) when that fails
	bool checkConfiguration();

	void close();
	bool closed() const { return this->pool_.closed(); }
	size_t clientCount() const { return this->pool_.size(); }

private:
	std::shared_ptr<HttpClient> create_client(const ClientKey& key);
	void verify_tor(HttpClient& client, const ClientKey& key);

	std::string name_;
	NetworkSettings settings_;
	ClientFactory factory_;
	std::shared_ptr<spdlog::logger> logger_;

	AddressRotator rotator_;
	ConnectionPool pool_;
	std::unique_ptr<RetryStrategy> strategy_;

	std::mutex torMutex_;
	std::set<std::optional<ProxySet>> torVerified_;
};

} // namespace searchnet
