#include "Network.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "RequestContext.hpp"
#include "RetryStrategy.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

namespace searchnet {

RetryStrategyKind parseRetryStrategy(std::string_view name) {
	if (util::iequals(name, "engine"))
		return RetryStrategyKind::Engine;
	if (util::iequals(name, "same_http_client"))
		return RetryStrategyKind::SameHttpClient;
	if (util::iequals(name, "different_http_client"))
		return RetryStrategyKind::DifferentHttpClient;
	throw ConfigurationError("Unknown retry strategy: " + std::string(name));
}

const char* retryStrategyName(RetryStrategyKind kind) {
	switch (kind) {
		case RetryStrategyKind::Engine: return "engine";
		case RetryStrategyKind::SameHttpClient: return "same_http_client";
		case RetryStrategyKind::DifferentHttpClient: return "different_http_client";
	}
	return "unknown";
}

RetryOnHttpError RetryOnHttpError::anyError() {
	RetryOnHttpError r;
	r.mode_ = Mode::AnyError;
	return r;
}

RetryOnHttpError RetryOnHttpError::status(long status) {
	RetryOnHttpError r;
	r.mode_ = Mode::Status;
	r.statuses_.insert(status);
	return r;
}

RetryOnHttpError RetryOnHttpError::statusSet(std::set<long> statuses) {
	RetryOnHttpError r;
	r.mode_ = Mode::StatusSet;
	r.statuses_ = std::move(statuses);
	return r;
}

bool RetryOnHttpError::matches(long status) const {
	switch (this->mode_) {
		case Mode::Never:
			return false;
		case Mode::AnyError:
			return status >= 400 && status <= 599;
		case Mode::Status:
		case Mode::StatusSet:
			return this->statuses_.count(status) > 0;
	}
	return false;
}

static const NetworkSettings& validate(const std::string& name, const NetworkSettings& settings) {
	if (settings.retries < 0)
		throw ConfigurationError("Network " + name + ": retries must be >= 0");
	if (settings.maxRedirects < 0)
		throw ConfigurationError("Network " + name + ": max_redirects must be >= 0");
	if (settings.maxConnections < 0 || settings.maxKeepaliveConnections < 0)
		throw ConfigurationError("Network " + name + ": pool limits must be >= 0");
	if (settings.keepaliveExpiry < 0)
		throw ConfigurationError("Network " + name + ": keepalive_expiry must be >= 0");
	return settings;
}

Network::Network(std::string name, NetworkSettings settings, ClientFactory factory)
	: name_(std::move(name)),
	  settings_(validate(this->name_, settings)),
	  factory_(std::move(factory)),
	  logger_(log::get("network." + this->name_)),
	  rotator_(this->settings_.sourceAddresses, this->settings_.proxies),
	  pool_(this->logger_),
	  strategy_(RetryStrategy::create(this->settings_.retryStrategy)) {
	if (!this->factory_)
		throw std::invalid_argument("Network " + this->name_ + ": no client factory");

	if (!this->rotator_.hasAddresses() && !this->rotator_.hasProxies())
		this->logger_->warn("No source address nor proxy configured, using the default route");
	if (this->settings_.usingTorProxy && !this->rotator_.hasProxies())
		this->logger_->warn("using_tor_proxy is set but no proxy is configured");
}

Network::~Network() {
	this->close();
}

RequestContext Network::getContext(std::optional<double> timeout, std::optional<Clock::time_point> startTime) {
	return RequestContext(*this, timeout, startTime);
}

std::shared_ptr<HttpClient> Network::getClient(std::optional<bool> verify, std::optional<long> maxRedirects) {
	ClientKey key;
	key.verify = verify.value_or(this->settings_.verify);
	if (key.verify)
		key.caBundle = this->settings_.caBundle;
	key.maxRedirects = maxRedirects.value_or(this->settings_.maxRedirects);
	key.sourceAddress = this->rotator_.nextAddress();
	key.proxies = this->rotator_.nextProxySet();

	return this->pool_.getClient(key, [&]() { return this->create_client(key); });
}

std::shared_ptr<HttpClient> Network::create_client(const ClientKey& key) {
	ClientConfig config;
	config.verify = key.verify;
	config.caBundle = key.caBundle;
	config.maxRedirects = key.maxRedirects;
	config.sourceAddress = key.sourceAddress;
	config.proxies = key.proxies;
	config.enableHttp = this->settings_.enableHttp;
	config.enableHttp2 = this->settings_.enableHttp2;
	config.maxConnections = this->settings_.maxConnections;
	config.maxKeepaliveConnections = this->settings_.maxKeepaliveConnections;
	config.keepaliveExpiry = this->settings_.keepaliveExpiry;
	config.loggerName = "network." + this->name_;
	config.id = key.fingerprint();

	auto client = this->factory_(config);
	if (!client)
		throw ConfigurationError("Network " + this->name_ + ": the client factory returned no client");

	if (this->settings_.usingTorProxy) {
		try {
			this->verify_tor(*client, key);
		} catch (const std::exception&) {
			client->close();
			throw;
		}
	}
	return client;
}

void Network::verify_tor(HttpClient& client, const ClientKey& key) {
	{
		std::lock_guard<std::mutex> lk(this->torMutex_);
		if (this->torVerified_.count(key.proxies))
			return;
	}

	HttpRequest request;
	request.url = TOR_CHECK_URL;
	request.methodName = "GET";

	RequestPolicy policy;
	policy.timeout = TOR_CHECK_TIMEOUT;
	policy.connTimeout = TOR_CHECK_TIMEOUT;

	bool isTor = false;
	try {
		auto response = client.send(request, policy);
		isTor = response.json().value("IsTor", false);
	} catch (const NetworkError& e) {
		throw ConfigurationError("Network " + this->name_ + ": Tor check failed: " + e.what());
	} catch (const nlohmann::json::exception& e) {
		throw ConfigurationError("Network " + this->name_ + ": Tor check returned an invalid answer: " + e.what());
	}

	if (!isTor)
		throw ConfigurationError("Network " + this->name_ + ": the proxy is not a Tor exit");

	this->logger_->debug("Tor check passed for client {}", key.fingerprint());
	std::lock_guard<std::mutex> lk(this->torMutex_);
	this->torVerified_.insert(key.proxies);
}

void Network::discardClient(const std::shared_ptr<HttpClient>& client) {
	if (this->pool_.evict(client))
		this->logger_->debug("Client dropped from the pool after a remote disconnect");
}

bool Network::checkConfiguration() {
	try {
		this->getClient();
		return true;
	} catch (const std::exception& e) {
		this->logger_->error("Invalid network configuration: {}", e.what());
		return false;
	}
}

void Network::close() {
	this->pool_.closeAll();
}

} // namespace searchnet
