#include "AddressRotator.hpp"
#include "Errors.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <netinet/in.h>

namespace searchnet {

static void increment(IpAddress& address) {
	for (size_t i = address.size(); i-- > 0;) {
		if (++address.bytes[i] != 0)
			return;
	}
}

IpAddress IpAddress::parse(std::string_view text) {
	const std::string s(text);
	IpAddress address;

	if (s.find(':') != std::string::npos) {
		address.v6 = true;
		if (inet_pton(AF_INET6, s.c_str(), address.bytes.data()) == 1)
			return address;
	} else if (inet_pton(AF_INET, s.c_str(), address.bytes.data()) == 1) {
		return address;
	}
	throw ConfigurationError("Invalid IP address: " + s);
}

std::string IpAddress::toString() const {
	char buf[INET6_ADDRSTRLEN] = {0};
	if (!inet_ntop(this->v6 ? AF_INET6 : AF_INET, this->bytes.data(), buf, sizeof(buf)))
		throw std::logic_error("inet_ntop failed");
	return buf;
}

IpNetwork IpNetwork::parse(std::string_view text) {
	auto slash = text.find('/');
	if (slash == std::string_view::npos)
		throw ConfigurationError("Invalid IP network (missing prefix): " + std::string(text));

	IpNetwork network;
	network.address = IpAddress::parse(text.substr(0, slash));

	std::string_view prefixText = text.substr(slash + 1);
	const int maxPrefix = network.address.v6 ? 128 : 32;
	auto [ptr, ec] = std::from_chars(prefixText.data(), prefixText.data() + prefixText.size(), network.prefix);
	if (ec != std::errc() || ptr != prefixText.data() + prefixText.size() || prefixText.empty()
		|| network.prefix < 0 || network.prefix > maxPrefix)
		throw ConfigurationError("Invalid IP network prefix: " + std::string(text));

	// Non-strict: clear the host bits
	for (size_t i = 0; i < network.address.size(); ++i) {
		int bits = network.prefix - static_cast<int>(i * 8);
		if (bits >= 8)
			continue;
		if (bits <= 0)
			network.address.bytes[i] = 0;
		else
			network.address.bytes[i] &= static_cast<uint8_t>(0xFF << (8 - bits));
	}
	return network;
}

std::string IpNetwork::toString() const {
	return this->address.toString() + "/" + std::to_string(this->prefix);
}

IpAddress IpNetwork::firstHost() const {
	const int maxPrefix = this->address.v6 ? 128 : 32;
	IpAddress first = this->address;
	if (this->prefix < maxPrefix - 1)
		increment(first);
	return first;
}

IpAddress IpNetwork::lastHost() const {
	const int maxPrefix = this->address.v6 ? 128 : 32;
	IpAddress last = this->address;
	for (size_t i = 0; i < last.size(); ++i) {
		int bits = this->prefix - static_cast<int>(i * 8);
		if (bits >= 8)
			continue;
		if (bits <= 0)
			last.bytes[i] = 0xFF;
		else
			last.bytes[i] |= static_cast<uint8_t>(0xFF >> bits);
	}
	// IPv4 excludes the broadcast address, IPv6 has none
	if (!last.v6 && this->prefix < maxPrefix - 1) {
		for (size_t i = last.size(); i-- > 0;) {
			if (last.bytes[i]-- != 0)
				break;
		}
	}
	return last;
}

AddressRotator::AddressRotator(std::vector<SourceAddress> addresses, ProxyMap proxies) {
	for (auto& source : addresses) {
		AddressEntry entry;
		if (auto* network = std::get_if<IpNetwork>(&source)) {
			entry.cursor = network->firstHost();
			entry.last = network->lastHost();
		} else {
			entry.cursor = entry.last = std::get<IpAddress>(source);
		}
		entry.source = std::move(source);
		this->addresses_.push_back(std::move(entry));
	}

	for (auto& [pattern, urls] : proxies) {
		if (urls.empty())
			continue;
		this->proxies_.emplace_back(pattern, std::move(urls));
	}
	this->proxyCursors_.assign(this->proxies_.size(), 0);
}

std::optional<std::string> AddressRotator::nextAddress() {
	std::lock_guard<std::mutex> lk(this->mutex_);
	if (this->addresses_.empty())
		return std::nullopt;

	AddressEntry& entry = this->addresses_[this->addressIndex_];
	IpAddress host = entry.cursor;

	if (host == entry.last) {
		// Entry exhausted: rewind it and move on
		if (auto* network = std::get_if<IpNetwork>(&entry.source))
			entry.cursor = network->firstHost();
		this->addressIndex_ = (this->addressIndex_ + 1) % this->addresses_.size();
	} else {
		increment(entry.cursor);
	}
	return host.toString();
}

std::optional<ProxySet> AddressRotator::nextProxySet() {
	std::lock_guard<std::mutex> lk(this->mutex_);
	if (this->proxies_.empty())
		return std::nullopt;

	ProxySet set;
	set.reserve(this->proxies_.size());
	for (size_t i = 0; i < this->proxies_.size(); ++i) {
		const auto& [pattern, urls] = this->proxies_[i];
		set.emplace_back(pattern, urls[this->proxyCursors_[i]]);
		this->proxyCursors_[i] = (this->proxyCursors_[i] + 1) % urls.size();
	}
	return set;
}

} // namespace searchnet
