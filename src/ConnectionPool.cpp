#include "ConnectionPool.hpp"
#include "Errors.hpp"
#include "HashHelper.hpp"

#include <tuple>
#include <vector>

namespace searchnet {

bool ClientKey::operator<(const ClientKey& other) const {
	return std::tie(this->verify, this->caBundle, this->maxRedirects, this->sourceAddress, this->proxies)
		 < std::tie(other.verify, other.caBundle, other.maxRedirects, other.sourceAddress, other.proxies);
}

bool ClientKey::operator==(const ClientKey& other) const {
	return std::tie(this->verify, this->caBundle, this->maxRedirects, this->sourceAddress, this->proxies)
		== std::tie(other.verify, other.caBundle, other.maxRedirects, other.sourceAddress, other.proxies);
}

std::string ClientKey::describe() const {
	std::string out = "verify=";
	out += this->verify ? (this->caBundle.empty() ? "true" : this->caBundle) : "false";
	out += " max_redirects=" + std::to_string(this->maxRedirects);
	out += " source=" + this->sourceAddress.value_or("-");
	out += " proxies=";
	if (!this->proxies) {
		out += "-";
	} else {
		out += "{";
		for (size_t i = 0; i < this->proxies->size(); ++i) {
			if (i) out += ", ";
			out += (*this->proxies)[i].first + " " + (*this->proxies)[i].second;
		}
		out += "}";
	}
	return out;
}

std::string ClientKey::fingerprint() const {
	return Hash::hexdigest(Hash::sha1(this->describe())).substr(0, 12);
}

ConnectionPool::ConnectionPool(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

ConnectionPool::~ConnectionPool() {
	this->closeAll();
}

std::shared_ptr<HttpClient> ConnectionPool::getClient(const ClientKey& key, const Factory& create) {
	if (this->closed_.load())
		throw NetworkError("The connection pool is closed");

	std::shared_ptr<Entry> entry;
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		auto& slot = this->entries_[key];
		if (!slot)
			slot = std::make_shared<Entry>();
		entry = slot;
	}

	std::lock_guard<std::mutex> lk(entry->mutex);
	if (this->closed_.load())
		throw NetworkError("The connection pool is closed");

	if (!entry->client || entry->client->isClosed()) {
		auto client = create();
		{
			std::lock_guard<std::mutex> mapLock(this->mutex_);
			if (entry->client)
				this->owners_.erase(entry->client.get());
			this->owners_[client.get()] = entry;
		}
		entry->client = std::move(client);
		this->logger_->debug("New client {} ({})", key.fingerprint(), key.describe());
	}
	return entry->client;
}

bool ConnectionPool::evict(const std::shared_ptr<HttpClient>& client) {
	if (!client)
		return false;

	std::shared_ptr<Entry> entry;
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		auto it = this->owners_.find(client.get());
		if (it == this->owners_.end())
			return false;
		entry = it->second;
		this->owners_.erase(it);
	}

	std::lock_guard<std::mutex> lk(entry->mutex);
	if (entry->client != client)
		return false;
	entry->client.reset();
	return true;
}

void ConnectionPool::closeAll() {
	if (this->closed_.exchange(true))
		return;

	std::vector<std::shared_ptr<Entry>> entries;
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		for (auto& [key, entry] : this->entries_)
			entries.push_back(entry);
	}

	for (auto& entry : entries) {
		std::lock_guard<std::mutex> lk(entry->mutex);
		if (!entry->client || entry->client->isClosed())
			continue;
		try {
			entry->client->close();
		} catch (const std::exception& e) {
			this->logger_->error("Error while closing a client: {}", e.what());
		}
	}
}

size_t ConnectionPool::size() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->entries_.size();
}

} // namespace searchnet
