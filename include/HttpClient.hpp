#pragma once

#include "AddressRotator.hpp"
#include "Response.hpp"
#include "Transport.hpp"
#include "models.hpp"
#include "utils.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace searchnet {

/**
 * Egress identity and pool limits of one client. Two requests may share a
 * client (and its connections) only if their ClientConfig is the same.
 */
struct ClientConfig {
	bool verify = true;
	std::string caBundle;	// used instead of the system store when non-empty
	long maxRedirects = 30;
	std::optional<std::string> sourceAddress;
	std::optional<ProxySet> proxies;

	bool enableHttp = false;
	bool enableHttp2 = true;

	long maxConnections = 10;			// concurrent transfers, 0 means unlimited
	long maxKeepaliveConnections = 100;	// idle connections kept open
	float keepaliveExpiry = 5.0f;		// in second

	std::string loggerName = "client";
	std::string id;	// short identifier used in log lines
};

class HttpClient {
public:
	virtual ~HttpClient() = default;

	// Throws TransportError (or a subclass) when no response was received
	virtual Response send(const HttpRequest& request, const RequestPolicy& policy) = 0;
	// Returns once the head is received, the body is read from response.stream()
	virtual Response stream(const HttpRequest& request, const RequestPolicy& policy) = 0;

	virtual void close() = 0;
	virtual bool isClosed() const = 0;
};

using ClientFactory = std::function<std::shared_ptr<HttpClient>(const ClientConfig&)>;

/**
 * HttpClient on top of the shared Transport. Each client owns a curl share
 * handle, so connections, DNS entries and TLS sessions are pooled per client.
 */
class CurlHttpClient : public HttpClient {
public:
	CurlHttpClient(Transport& transport, ClientConfig config);
	~CurlHttpClient() override;

	Response send(const HttpRequest& request, const RequestPolicy& policy) override;
	Response stream(const HttpRequest& request, const RequestPolicy& policy) override;

	void close() override;
	bool isClosed() const override { return this->closed_.load(); }

	const ClientConfig& config() const { return this->config_; }

	// Proxy URL for url: the most specific of "all://", "<scheme>://" and "<scheme>://<host>"
	static std::optional<std::string> selectProxy(const ProxySet& proxies, const std::string& url);

	static ClientFactory factory(Transport& transport);

private:
	struct Share;

	HttpTransfer make_transfer(const HttpRequest& request, const RequestPolicy& policy);
	void configure(CURL* handle, const std::string& url) const;
	std::shared_ptr<SemaphorePermit> acquire_permit(float timeout);
	void check_usable(const HttpRequest& request) const;
	void log_response(const Response& response) const;

	Transport& transport_;
	ClientConfig config_;
	std::shared_ptr<spdlog::logger> logger_;
	long ipResolve_ = CURL_IPRESOLVE_WHATEVER;

	std::shared_ptr<Share> share_;
	std::shared_ptr<BoundedSemaphore> sema_; // null when unlimited
	std::atomic<bool> closed_{false};
};

} // namespace searchnet
