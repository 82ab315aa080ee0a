#pragma once

#include "AddressRotator.hpp"
#include "Network.hpp"
#include "Transport.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace searchnet {

/**
 * The "outgoing" section. defaults holds the network keys found there,
 * already normalized (see NetworkSettingsDecoder::normalize).
 */
struct OutgoingSettings {
	double requestTimeout = 3.0;
	nlohmann::json defaults = nlohmann::json::object();
	// In declaration order
	std::vector<std::pair<std::string, nlohmann::json>> networks;
};

struct EngineSettings {
	std::string name;
	// string (reference), object (inline network) or null (use keys)
	nlohmann::json network;
	// Normalized network keys set directly on the engine entry
	nlohmann::json keys = nlohmann::json::object();
	// Default time budget of calls made for this engine, in seconds
	std::optional<double> timeout;
};

struct Settings {
	OutgoingSettings outgoing;
	std::vector<EngineSettings> engines;
	TransportSettings transport;
	std::string logLevel = "info";
	std::string logFile;

	// Throws ConfigurationError on unreadable files, malformed JSON or bad values
	static Settings load(const std::string& path);
	static Settings fromJson(const nlohmann::json& doc);
};

/**
 * Turns the JSON form of a network into NetworkSettings.
 */
class NetworkSettingsDecoder {
public:
	// Canonical key names; aliases are rewritten by normalize()
	static const std::vector<std::string>& keys();
	static bool isNetworkKey(const std::string& key);

	// Copy of config with aliases renamed. Throws ConfigurationError on unknown keys.
	static nlohmann::json normalize(const nlohmann::json& config);
	// normalize(overrides) applied over defaults, key by key
	static nlohmann::json merge(const nlohmann::json& defaults, const nlohmann::json& overrides);

	static NetworkSettings decode(const nlohmann::json& config);

	static ProxyMap decodeProxies(const nlohmann::json& value);
	static std::vector<SourceAddress> decodeSourceIps(const nlohmann::json& value);
	static RetryOnHttpError decodeRetryOnHttpError(const nlohmann::json& value);
};

} // namespace searchnet
