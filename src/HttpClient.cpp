#include "HttpClient.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <chrono>
#include <future>
#include <mutex>

namespace searchnet {

struct CurlHttpClient::Share {
	CURLSH* handle = NULL;
	std::mutex locks[CURL_LOCK_DATA_LAST];

	Share() {
		this->handle = curl_share_init();
		if (!this->handle)
			throw TransportError("curl_share_init failed");

		curl_share_setopt(this->handle, CURLSHOPT_LOCKFUNC, Share::lock_cb);
		curl_share_setopt(this->handle, CURLSHOPT_UNLOCKFUNC, Share::unlock_cb);
		curl_share_setopt(this->handle, CURLSHOPT_USERDATA, this);
		curl_share_setopt(this->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
		curl_share_setopt(this->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
		curl_share_setopt(this->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
	}

	~Share() {
		curl_share_cleanup(this->handle);
	}

	Share(const Share&) = delete;
	Share& operator=(const Share&) = delete;

	static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
		static_cast<Share*>(userptr)->locks[data].lock();
	}

	static void unlock_cb(CURL*, curl_lock_data data, void* userptr) {
		static_cast<Share*>(userptr)->locks[data].unlock();
	}
};

struct UrlParts {
	std::string scheme;
	std::string host;
};

static std::optional<UrlParts> split_url(const std::string& url) {
	std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), curl_url_cleanup);
	if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
		return std::nullopt;

	UrlParts parts;
	char* part = nullptr;
	if (curl_url_get(handle.get(), CURLUPART_SCHEME, &part, 0) == CURLUE_OK) {
		parts.scheme = util::tolower(part);
		curl_free(part);
	}
	part = nullptr;
	if (curl_url_get(handle.get(), CURLUPART_HOST, &part, 0) == CURLUE_OK) {
		parts.host = util::tolower(part);
		curl_free(part);
	}
	return parts;
}

static const char* http_version_name(long version) {
	switch (version) {
		case CURL_HTTP_VERSION_1_0: return "HTTP/1.0";
		case CURL_HTTP_VERSION_1_1: return "HTTP/1.1";
		case CURL_HTTP_VERSION_2_0: return "HTTP/2";
#if LIBCURL_VERSION_NUM >= 0x074200
		case CURL_HTTP_VERSION_3: return "HTTP/3";
#endif
		default: return "HTTP";
	}
}

CurlHttpClient::CurlHttpClient(Transport& transport, ClientConfig config)
	: transport_(transport), config_(std::move(config)), logger_(log::get(config_.loggerName)),
	  share_(std::make_shared<Share>()) {
	if (this->config_.maxConnections > 0)
		this->sema_ = std::make_shared<BoundedSemaphore>(this->config_.maxConnections, this->config_.maxConnections);

	if (this->config_.sourceAddress)
		this->ipResolve_ = IpAddress::parse(*this->config_.sourceAddress).v6 ? CURL_IPRESOLVE_V6 : CURL_IPRESOLVE_V4;
}

CurlHttpClient::~CurlHttpClient() {
	this->close();
}

void CurlHttpClient::close() {
	if (!this->closed_.exchange(true))
		this->logger_->debug("Client {} closed", this->config_.id);
}

std::optional<std::string> CurlHttpClient::selectProxy(const ProxySet& proxies, const std::string& url) {
	auto parts = split_url(url);
	if (!parts)
		return std::nullopt;

	int bestRank = -1;
	const std::string* best = nullptr;
	for (const auto& [pattern, proxy] : proxies) {
		auto sep = pattern.find("://");
		if (sep == std::string::npos)
			continue;
		std::string scheme = util::tolower(std::string_view(pattern).substr(0, sep));
		std::string host = util::tolower(std::string_view(pattern).substr(sep + 3));

		if (scheme != "all" && scheme != parts->scheme)
			continue;
		if (!host.empty() && host != parts->host)
			continue;

		int rank = (host.empty() ? 0 : 2) + (scheme == "all" ? 0 : 1);
		if (rank > bestRank) {
			bestRank = rank;
			best = &proxy;
		}
	}
	if (!best)
		return std::nullopt;
	return *best;
}

void CurlHttpClient::configure(CURL* handle, const std::string& url) const {
	curl_easy_setopt(handle, CURLOPT_SHARE, this->share_->handle);

	if (this->config_.sourceAddress) {
		std::string iface = "host!" + *this->config_.sourceAddress;
		curl_easy_setopt(handle, CURLOPT_INTERFACE, iface.c_str());
		curl_easy_setopt(handle, CURLOPT_IPRESOLVE, this->ipResolve_);
	}

	if (this->config_.proxies) {
		if (auto proxy = selectProxy(*this->config_.proxies, url))
			curl_easy_setopt(handle, CURLOPT_PROXY, proxy->c_str());
	}

	if (!this->config_.verify) {
		curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
		curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
	} else if (!this->config_.caBundle.empty()) {
		curl_easy_setopt(handle, CURLOPT_CAINFO, this->config_.caBundle.c_str());
	}
#if LIBCURL_VERSION_NUM >= 0x075700
	curl_easy_setopt(handle, CURLOPT_CA_CACHE_TIMEOUT, 604800L);
#endif

	curl_easy_setopt(handle, CURLOPT_HTTP_VERSION,
					 this->config_.enableHttp2 ? CURL_HTTP_VERSION_2TLS : CURL_HTTP_VERSION_1_1);

	const char* protocols = this->config_.enableHttp ? "http,https" : "https";
#if LIBCURL_VERSION_NUM >= 0x075500
	curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, protocols);
	curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS_STR, protocols);
#else
	long mask = this->config_.enableHttp ? (CURLPROTO_HTTP | CURLPROTO_HTTPS) : CURLPROTO_HTTPS;
	curl_easy_setopt(handle, CURLOPT_PROTOCOLS, mask);
	curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS, mask);
	(void)protocols;
#endif

	curl_easy_setopt(handle, CURLOPT_MAXREDIRS, this->config_.maxRedirects);
	curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, this->config_.maxKeepaliveConnections);
	curl_easy_setopt(handle, CURLOPT_MAXAGE_CONN, static_cast<long>(this->config_.keepaliveExpiry));
}

HttpTransfer CurlHttpClient::make_transfer(const HttpRequest& request, const RequestPolicy& policy) {
	const std::string url = request.url;
	auto configure = [this, url](CURL* handle) { this->configure(handle, url); };
	return HttpTransfer(request, policy, std::move(configure), this->share_);
}

void CurlHttpClient::check_usable(const HttpRequest& request) const {
	if (this->closed_.load())
		throw TransportError("The client " + this->config_.id + " is closed");

	auto parts = split_url(request.url);
	if (!parts || parts->scheme.empty())
		throw std::invalid_argument("Invalid URL: " + request.url);
	if (parts->scheme == "http" && !this->config_.enableHttp)
		throw std::invalid_argument("Plain HTTP is disabled for this network: " + request.url);
	if (parts->scheme != "http" && parts->scheme != "https")
		throw std::invalid_argument("Unsupported protocol: " + request.url);
}

std::shared_ptr<SemaphorePermit> CurlHttpClient::acquire_permit(float timeout) {
	if (!this->sema_)
		return nullptr;

	if (timeout > 0) {
		if (!this->sema_->try_acquire_for(std::chrono::duration<float>(timeout)))
			throw TimeoutError("All " + std::to_string(this->config_.maxConnections) + " connections of client "
							   + this->config_.id + " are busy");
	} else {
		this->sema_->acquire();
	}

	// The deleter keeps the semaphore alive as long as the permit
	auto sema = this->sema_;
	return std::shared_ptr<SemaphorePermit>(new SemaphorePermit(*sema), [sema](SemaphorePermit* permit) { delete permit; });
}

void CurlHttpClient::log_response(const Response& response) const {
	this->logger_->debug("HTTP Request: {} {} \"{} {}\"", response.method(), response.url(),
						 http_version_name(response.native().httpVersion), response.status());
}

Response CurlHttpClient::send(const HttpRequest& request, const RequestPolicy& policy) {
	this->check_usable(request);
	auto permit = this->acquire_permit(policy.timeout);

	auto state = this->transport_.submit(this->make_transfer(request, policy), policy.timeout);

	if (policy.timeout > 0) {
		// curl enforces policy.timeout itself, this only bounds the wait on the event loop
		auto waitFor = std::chrono::duration<float>(policy.timeout + 0.25f);
		if (state->future.wait_for(waitFor) != std::future_status::ready) {
			state->cancel();
			throw TimeoutError("No response from " + request.url + " in time");
		}
	}

	HttpResponse native = state->future.get();
	if (native.curlCode != CURLE_OK)
		throwTransportError(native.curlCode, native.error);

	Response response(std::move(native), request.methodName, request.url);
	this->log_response(response);
	return response;
}

Response CurlHttpClient::stream(const HttpRequest& request, const RequestPolicy& policy) {
	this->check_usable(request);
	auto permit = this->acquire_permit(policy.timeout);

	auto sink = std::make_shared<BodyStream>(this->transport_.settings().streamBufferLimit);
	HttpTransfer transfer = this->make_transfer(request, policy);
	transfer.setSink(sink);

	auto state = this->transport_.submit(std::move(transfer), policy.timeout);
	sink->attach(state);
	sink->holdResource(permit);

	if (!sink->waitHead(policy.timeout > 0 ? policy.timeout + 0.25f : 0)) {
		sink->close();
		throw TimeoutError("No response head from " + request.url + " in time");
	}

	HttpResponse head = sink->head();
	if (head.status == 0 && sink->finished() && sink->result() != CURLE_OK)
		throwTransportError(sink->result(), sink->error());

	Response response(std::move(head), request.methodName, request.url);
	response.attachStream(sink);
	this->log_response(response);
	return response;
}

ClientFactory CurlHttpClient::factory(Transport& transport) {
	return [&transport](const ClientConfig& config) -> std::shared_ptr<HttpClient> {
		return std::make_shared<CurlHttpClient>(transport, config);
	};
}

} // namespace searchnet
