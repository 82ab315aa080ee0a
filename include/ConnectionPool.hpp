#pragma once

#include "AddressRotator.hpp"
#include "HttpClient.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace searchnet {

// Everything that makes two clients non-interchangeable
struct ClientKey {
	bool verify = true;
	std::string caBundle;
	long maxRedirects = 30;
	std::optional<std::string> sourceAddress;
	std::optional<ProxySet> proxies;

	bool operator<(const ClientKey& other) const;
	bool operator==(const ClientKey& other) const;

	std::string describe() const;
	// First 12 hex digits of the SHA-1 of describe()
	std::string fingerprint() const;
};

/**
 * Client cache of one network. Creation is serialized per key, lookups of
 * other keys are not blocked by a slow factory.
 */
class ConnectionPool {
public:
	using Factory = std::function<std::shared_ptr<HttpClient>()>;

	explicit ConnectionPool(std::shared_ptr<spdlog::logger> logger);
	~ConnectionPool();

	ConnectionPool(const ConnectionPool&) = delete;
	ConnectionPool& operator=(const ConnectionPool&) = delete;

	/**
	 * The cached client for key, or a new one from create when there is
	 * none or the cached one is closed. A throwing factory leaves nothing
	 * cached. Throws NetworkError after closeAll().
	 */
	std::shared_ptr<HttpClient> getClient(const ClientKey& key, const Factory& create);

	/**
	 * Forget client without closing it: callers still holding it finish
	 * their transfers, the next getClient for its key creates a new one.
	 * False when client is not (or no longer) in the pool.
	 */
	bool evict(const std::shared_ptr<HttpClient>& client);

	// Close every open client once; later calls do nothing
	void closeAll();

	size_t size() const;
	bool closed() const { return this->closed_.load(); }

private:
	struct Entry {
		std::mutex mutex;
		std::shared_ptr<HttpClient> client;
	};

	std::shared_ptr<spdlog::logger> logger_;

	mutable std::mutex mutex_;
	std::map<ClientKey, std::shared_ptr<Entry>> entries_;
	std::map<const HttpClient*, std::shared_ptr<Entry>> owners_;
	std::atomic<bool> closed_{false};
};

} // namespace searchnet
