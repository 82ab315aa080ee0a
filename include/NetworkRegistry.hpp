#pragma once

#include "HttpClient.hpp"
#include "Network.hpp"
#include "Settings.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace searchnet {

/**
 * Name -> Network table built once at start-up. Several names may share one
 * Network (engine references). Lookups are read-only after construction.
 */
class NetworkRegistry {
public:
	static constexpr const char* DEFAULT_NAME = "__DEFAULT__";

	NetworkRegistry() = default;
	~NetworkRegistry();

	NetworkRegistry(const NetworkRegistry&) = delete;
	NetworkRegistry& operator=(const NetworkRegistry&) = delete;

	/**
	 * Build every network of settings: the built-in ones, outgoing.networks,
	 * then the engines (inline networks first, references last).
	 * With check set, each network creates one client and a failure throws
	 * ConfigurationError("Invalid network configuration").
	 */
	static std::shared_ptr<NetworkRegistry> fromSettings(const Settings& settings, ClientFactory factory,
														 bool check = true);

	// Register (or replace) name
	void add(const std::string& name, std::shared_ptr<Network> network);

	// "" is the default network. Throws ConfigurationError for unknown names.
	std::shared_ptr<Network> get(const std::string& name = "") const;
	std::shared_ptr<Network> getOrDefault(const std::string& name) const;
	bool contains(const std::string& name) const;

	// The engine's own timeout, if name is an engine that sets one
	std::optional<double> timeoutFor(const std::string& name) const;
	void setTimeout(const std::string& name, double timeout);
	std::vector<std::string> names() const;

	// checkConfiguration() on every distinct network, false if one fails
	bool checkAll();

	// Close every network once
	void shutdown();

private:
	std::vector<std::shared_ptr<Network>> distinct() const;

	std::map<std::string, std::shared_ptr<Network>> networks_;
	std::map<std::string, double> timeouts_;
	std::once_flag shutdownOnce_;
};

} // namespace searchnet
