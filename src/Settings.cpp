#include "Settings.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <set>

namespace searchnet {

using json = nlohmann::json;

namespace {

const std::map<std::string, std::string> KEY_ALIASES = {
	{"local_addresses", "source_ips"},
	{"max_connections", "pool_connections"},
	{"max_keepalive_connections", "pool_maxsize"},
};

const std::map<std::string, std::string> PROXY_PATTERNS = {
	{"http", "http://"},	 {"http:", "http://"},
	{"https", "https://"},	 {"https:", "https://"},
	{"socks4", "socks4://"}, {"socks4:", "socks4://"},
	{"socks5", "socks5://"}, {"socks5:", "socks5://"},
	{"socks5h", "socks5h://"}, {"socks5h:", "socks5h://"},
};

bool get_bool(const json& value, const std::string& key) {
	if (!value.is_boolean())
		throw ConfigurationError(key + " must be a boolean");
	return value.get<bool>();
}

long get_long(const json& value, const std::string& key) {
	if (!value.is_number_integer())
		throw ConfigurationError(key + " must be an integer");
	return value.get<long>();
}

double get_double(const json& value, const std::string& key) {
	if (!value.is_number())
		throw ConfigurationError(key + " must be a number");
	return value.get<double>();
}

std::vector<std::string> get_strings(const json& value, const std::string& key) {
	std::vector<std::string> out;
	if (value.is_string()) {
		out.push_back(value.get<std::string>());
		return out;
	}
	if (!value.is_array())
		throw ConfigurationError(key + " must be a string or a list of strings");
	for (const auto& item : value) {
		if (!item.is_string())
			throw ConfigurationError(key + " must be a string or a list of strings");
		out.push_back(item.get<std::string>());
	}
	return out;
}

} // namespace

const std::vector<std::string>& NetworkSettingsDecoder::keys() {
	static const std::vector<std::string> names = {
		"enable_http", "enable_http2", "verify", "max_redirects", "source_ips", "proxies",
		"pool_connections", "pool_maxsize", "keepalive_expiry", "retries", "retry_on_http_error",
		"retry_strategy", "using_tor_proxy",
	};
	return names;
}

bool NetworkSettingsDecoder::isNetworkKey(const std::string& key) {
	if (KEY_ALIASES.count(key))
		return true;
	const auto& names = keys();
	return std::find(names.begin(), names.end(), key) != names.end();
}

json NetworkSettingsDecoder::normalize(const json& config) {
	if (config.is_null())
		return json::object();
	if (!config.is_object())
		throw ConfigurationError("A network must be an object");

	json out = json::object();
	for (const auto& [key, value] : config.items()) {
		if (!isNetworkKey(key))
			throw ConfigurationError("Unknown network setting: " + key);
		auto alias = KEY_ALIASES.find(key);
		out[alias != KEY_ALIASES.end() ? alias->second : key] = value;
	}
	return out;
}

json NetworkSettingsDecoder::merge(const json& defaults, const json& overrides) {
	json out = normalize(defaults);
	for (const auto& [key, value] : normalize(overrides).items())
		out[key] = value;
	return out;
}

NetworkSettings NetworkSettingsDecoder::decode(const json& config) {
	NetworkSettings settings;

	for (const auto& [key, value] : normalize(config).items()) {
		if (value.is_null())
			continue;

		if (key == "enable_http") {
			settings.enableHttp = get_bool(value, key);
		} else if (key == "enable_http2") {
			settings.enableHttp2 = get_bool(value, key);
		} else if (key == "verify") {
			// false, true or the path of a CA bundle
			if (value.is_string()) {
				settings.verify = true;
				settings.caBundle = value.get<std::string>();
			} else {
				settings.verify = get_bool(value, key);
			}
		} else if (key == "max_redirects") {
			settings.maxRedirects = get_long(value, key);
		} else if (key == "source_ips") {
			settings.sourceAddresses = decodeSourceIps(value);
		} else if (key == "proxies") {
			settings.proxies = decodeProxies(value);
		} else if (key == "pool_connections") {
			settings.maxConnections = get_long(value, key);
		} else if (key == "pool_maxsize") {
			settings.maxKeepaliveConnections = get_long(value, key);
		} else if (key == "keepalive_expiry") {
			settings.keepaliveExpiry = static_cast<float>(get_double(value, key));
		} else if (key == "retries") {
			settings.retries = static_cast<int>(get_long(value, key));
		} else if (key == "retry_on_http_error") {
			settings.retryOnHttpError = decodeRetryOnHttpError(value);
		} else if (key == "retry_strategy") {
			if (!value.is_string())
				throw ConfigurationError("retry_strategy must be a string");
			settings.retryStrategy = parseRetryStrategy(value.get<std::string>());
		} else if (key == "using_tor_proxy") {
			settings.usingTorProxy = get_bool(value, key);
		}
	}
	return settings;
}

ProxyMap NetworkSettingsDecoder::decodeProxies(const json& value) {
	ProxyMap proxies;
	if (value.is_null())
		return proxies;

	if (value.is_string() || value.is_array()) {
		proxies.emplace_back("all://", get_strings(value, "proxies"));
		return proxies;
	}
	if (!value.is_object())
		throw ConfigurationError("proxies must be a string, a list or an object");

	for (const auto& [key, urls] : value.items()) {
		std::string pattern = key;
		auto mapped = PROXY_PATTERNS.find(util::tolower(key));
		if (mapped != PROXY_PATTERNS.end())
			pattern = mapped->second;
		else if (pattern.find("://") == std::string::npos)
			throw ConfigurationError("Invalid proxy pattern: " + key);

		auto list = get_strings(urls, "proxies." + key);
		if (list.empty())
			continue;
		proxies.emplace_back(pattern, std::move(list));
	}
	return proxies;
}

std::vector<SourceAddress> NetworkSettingsDecoder::decodeSourceIps(const json& value) {
	std::vector<SourceAddress> addresses;
	if (value.is_null())
		return addresses;

	for (const auto& text : get_strings(value, "source_ips")) {
		if (text.find('/') != std::string::npos)
			addresses.emplace_back(IpNetwork::parse(text));
		else
			addresses.emplace_back(IpAddress::parse(text));
	}
	return addresses;
}

RetryOnHttpError NetworkSettingsDecoder::decodeRetryOnHttpError(const json& value) {
	if (value.is_null())
		return RetryOnHttpError::never();
	if (value.is_boolean())
		return value.get<bool>() ? RetryOnHttpError::anyError() : RetryOnHttpError::never();
	if (value.is_number_integer())
		return RetryOnHttpError::status(value.get<long>());
	if (value.is_array()) {
		std::set<long> statuses;
		for (const auto& item : value) {
			if (!item.is_number_integer())
				throw ConfigurationError("retry_on_http_error must hold HTTP status codes");
			statuses.insert(item.get<long>());
		}
		return RetryOnHttpError::statusSet(std::move(statuses));
	}
	throw ConfigurationError("retry_on_http_error must be a boolean, a status code or a list of status codes");
}

static TransportSettings decode_transport(const json& value) {
	TransportSettings settings;
	if (value.is_null())
		return settings;
	if (!value.is_object())
		throw ConfigurationError("transport must be an object");

	for (const auto& [key, item] : value.items()) {
		if (key == "max_transfers") {
			long n = get_long(item, key);
			if (n <= 0)
				throw ConfigurationError("transport.max_transfers must be > 0");
			settings.maxTransfers = static_cast<size_t>(n);
		} else if (key == "max_host_connections") {
			settings.maxHostConnections = get_long(item, key);
		} else if (key == "max_total_connections") {
			settings.maxTotalConnections = get_long(item, key);
		} else if (key == "poll_ms") {
			settings.pollMs = get_long(item, key);
		} else if (key == "stream_buffer_limit") {
			long n = get_long(item, key);
			if (n <= 0)
				throw ConfigurationError("transport.stream_buffer_limit must be > 0");
			settings.streamBufferLimit = static_cast<size_t>(n);
		} else {
			throw ConfigurationError("Unknown transport setting: " + key);
		}
	}
	return settings;
}

Settings Settings::fromJson(const json& doc) {
	if (!doc.is_object())
		throw ConfigurationError("The settings must be a JSON object");

	Settings settings;

	if (doc.contains("outgoing") && !doc["outgoing"].is_null()) {
		const json& outgoing = doc["outgoing"];
		if (!outgoing.is_object())
			throw ConfigurationError("outgoing must be an object");

		json defaults = json::object();
		for (const auto& [key, value] : outgoing.items()) {
			if (key == "request_timeout") {
				settings.outgoing.requestTimeout = get_double(value, key);
			} else if (key == "networks") {
				if (value.is_null())
					continue;
				if (!value.is_object())
					throw ConfigurationError("outgoing.networks must be an object");
				for (const auto& [name, network] : value.items())
					settings.outgoing.networks.emplace_back(name, NetworkSettingsDecoder::normalize(network));
			} else if (NetworkSettingsDecoder::isNetworkKey(key)) {
				defaults[key] = value;
			} else {
				log::get("settings")->warn("Ignoring unknown outgoing setting: {}", key);
			}
		}
		settings.outgoing.defaults = NetworkSettingsDecoder::normalize(defaults);
	}

	if (doc.contains("engines") && !doc["engines"].is_null()) {
		const json& engines = doc["engines"];
		if (!engines.is_array())
			throw ConfigurationError("engines must be a list");

		for (const auto& entry : engines) {
			if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string())
				throw ConfigurationError("Every engine needs a name");

			EngineSettings engine;
			engine.name = entry["name"].get<std::string>();
			json keys = json::object();
			for (const auto& [key, value] : entry.items()) {
				if (key == "network") {
					if (!value.is_null() && !value.is_string() && !value.is_object())
						throw ConfigurationError("Engine " + engine.name + ": network must be a name or an object");
					engine.network = value.is_object() ? NetworkSettingsDecoder::normalize(value) : value;
				} else if (key == "timeout") {
					if (value.is_null())
						continue;
					engine.timeout = get_double(value, "Engine " + engine.name + ": timeout");
					if (*engine.timeout <= 0)
						throw ConfigurationError("Engine " + engine.name + ": timeout must be positive");
				} else if (NetworkSettingsDecoder::isNetworkKey(key)) {
					keys[key] = value;
				}
			}
			engine.keys = NetworkSettingsDecoder::normalize(keys);
			settings.engines.push_back(std::move(engine));
		}
	}

	if (doc.contains("transport"))
		settings.transport = decode_transport(doc["transport"]);

	if (doc.contains("log_level")) {
		if (!doc["log_level"].is_string())
			throw ConfigurationError("log_level must be a string");
		settings.logLevel = doc["log_level"].get<std::string>();
		log::parseLevel(settings.logLevel);
	}
	if (doc.contains("log_file") && !doc["log_file"].is_null()) {
		if (!doc["log_file"].is_string())
			throw ConfigurationError("log_file must be a string");
		settings.logFile = doc["log_file"].get<std::string>();
	}
	return settings;
}

Settings Settings::load(const std::string& path) {
	std::ifstream in(path);
	if (!in)
		throw ConfigurationError("Cannot open settings file " + path);

	json doc;
	try {
		doc = json::parse(in);
	} catch (const json::parse_error& e) {
		throw ConfigurationError("Cannot parse " + path + ": " + e.what());
	}
	return fromJson(doc);
}

} // namespace searchnet
