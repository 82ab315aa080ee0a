#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace searchnet {

struct IpAddress {
	bool v6 = false;
	std::array<uint8_t, 16> bytes{}; // network order, only the first 4 used for IPv4

	// Throws ConfigurationError on malformed text
	static IpAddress parse(std::string_view text);

	size_t size() const { return this->v6 ? 16 : 4; }
	std::string toString() const;

	bool operator==(const IpAddress& other) const {
		return this->v6 == other.v6 && this->bytes == other.bytes;
	}
	bool operator!=(const IpAddress& other) const { return !(*this == other); }
};

/**
 * An IP network parsed non-strictly: host bits in "192.168.1.7/24" are
 * cleared instead of rejected.
 */
struct IpNetwork {
	IpAddress address;
	int prefix = 0;

	static IpNetwork parse(std::string_view text);

	std::string toString() const;

	// Usable host range, IPv4 drops network and broadcast (except /31 and /32),
	// IPv6 drops the subnet-router anycast address (except /127 and /128)
	IpAddress firstHost() const;
	IpAddress lastHost() const;
};

using SourceAddress = std::variant<IpAddress, IpNetwork>;

// Ordered pattern -> proxy URL ("all://", "https://", "https://host")
using ProxySet = std::vector<std::pair<std::string, std::string>>;
// Ordered pattern -> proxy URLs to rotate through
using ProxyMap = std::vector<std::pair<std::string, std::vector<std::string>>>;

/**
 * Round-robin over source addresses and proxies. Networks are walked host by
 * host without being expanded. Thread safe; never blocks on I/O.
 */
class AddressRotator {
public:
	AddressRotator(std::vector<SourceAddress> addresses, ProxyMap proxies);

	AddressRotator(const AddressRotator&) = delete;
	AddressRotator& operator=(const AddressRotator&) = delete;

	// nullopt when no address (or no usable host) is configured
	std::optional<std::string> nextAddress();
	// nullopt when no proxy is configured
	std::optional<ProxySet> nextProxySet();

	bool hasAddresses() const { return !this->addresses_.empty(); }
	bool hasProxies() const { return !this->proxies_.empty(); }

private:
	struct AddressEntry {
		SourceAddress source;
		IpAddress cursor;
		IpAddress last;
	};

	std::mutex mutex_;

	std::vector<AddressEntry> addresses_;
	size_t addressIndex_ = 0;

	ProxyMap proxies_;
	std::vector<size_t> proxyCursors_;
};

} // namespace searchnet
