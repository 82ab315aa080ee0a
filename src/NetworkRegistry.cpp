#include "NetworkRegistry.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <set>
#include <stdexcept>

namespace searchnet {

using json = nlohmann::json;

NetworkRegistry::~NetworkRegistry() {
	this->shutdown();
}

std::shared_ptr<NetworkRegistry> NetworkRegistry::fromSettings(const Settings& settings, ClientFactory factory,
																bool check) {
	auto registry = std::make_shared<NetworkRegistry>();
	const json& defaults = settings.outgoing.defaults;

	auto create = [&](const std::string& name, const json& overrides) {
		json merged = NetworkSettingsDecoder::merge(defaults, overrides);
		registry->add(name, std::make_shared<Network>(name, NetworkSettingsDecoder::decode(merged), factory));
	};

	create(DEFAULT_NAME, json::object());
	create("ipv4", {{"source_ips", "0.0.0.0"}});
	create("ipv6", {{"source_ips", "::"}});

	for (const auto& [name, overrides] : settings.outgoing.networks)
		create(name, overrides);

	for (const auto& engine : settings.engines) {
		if (engine.network.is_null())
			create(engine.name, engine.keys);
		else if (engine.network.is_object())
			create(engine.name, engine.network);
	}

	// A reference may name another engine that is itself a reference
	std::vector<const EngineSettings*> pending;
	for (const auto& engine : settings.engines) {
		if (engine.network.is_string())
			pending.push_back(&engine);
	}
	while (!pending.empty()) {
		std::vector<const EngineSettings*> unresolved;
		for (const auto* engine : pending) {
			const std::string target = engine->network.get<std::string>();
			bool waiting = false;
			for (const auto* other : pending)
				waiting = waiting || (other != engine && other->name == target);
			if (waiting || !registry->contains(target))
				unresolved.push_back(engine);
			else
				registry->add(engine->name, registry->get(target));
		}
		if (unresolved.size() == pending.size()) {
			const auto* engine = pending.front();
			throw ConfigurationError("Engine " + engine->name + ": unknown network " +
									 engine->network.get<std::string>());
		}
		pending = std::move(unresolved);
	}

	for (const auto& engine : settings.engines) {
		if (engine.timeout)
			registry->setTimeout(engine.name, *engine.timeout);
	}

	if (!registry->contains("image_proxy"))
		create("image_proxy", {{"enable_http2", false}});
	if (!registry->contains("autocomplete"))
		create("autocomplete", json::object());

	if (check && !registry->checkAll())
		throw ConfigurationError("Invalid network configuration");
	return registry;
}

void NetworkRegistry::add(const std::string& name, std::shared_ptr<Network> network) {
	if (!network)
		throw std::invalid_argument("Network " + name + " is null");
	this->networks_[name] = std::move(network);
}

std::shared_ptr<Network> NetworkRegistry::get(const std::string& name) const {
	auto it = this->networks_.find(name.empty() ? DEFAULT_NAME : name);
	if (it == this->networks_.end())
		throw ConfigurationError("Unknown network: " + name);
	return it->second;
}

std::shared_ptr<Network> NetworkRegistry::getOrDefault(const std::string& name) const {
	auto it = this->networks_.find(name);
	if (it != this->networks_.end())
		return it->second;
	return this->get(DEFAULT_NAME);
}

bool NetworkRegistry::contains(const std::string& name) const {
	return this->networks_.count(name) > 0;
}

std::optional<double> NetworkRegistry::timeoutFor(const std::string& name) const {
	auto it = this->timeouts_.find(name);
	if (it == this->timeouts_.end())
		return std::nullopt;
	return it->second;
}

void NetworkRegistry::setTimeout(const std::string& name, double timeout) {
	if (timeout <= 0)
		throw std::invalid_argument("Network " + name + ": timeout must be positive");
	this->timeouts_[name] = timeout;
}

std::vector<std::string> NetworkRegistry::names() const {
	std::vector<std::string> out;
	out.reserve(this->networks_.size());
	for (const auto& [name, network] : this->networks_)
		out.push_back(name);
	return out;
}

std::vector<std::shared_ptr<Network>> NetworkRegistry::distinct() const {
	std::vector<std::shared_ptr<Network>> out;
	std::set<const Network*> seen;
	for (const auto& [name, network] : this->networks_) {
		if (seen.insert(network.get()).second)
			out.push_back(network);
	}
	return out;
}

bool NetworkRegistry::checkAll() {
	bool ok = true;
	for (const auto& network : this->distinct()) {
		if (!network->checkConfiguration())
			ok = false;
	}
	return ok;
}

void NetworkRegistry::shutdown() {
	std::call_once(this->shutdownOnce_, [this]() {
		for (const auto& network : this->distinct())
			network->close();
		log::get("registry")->debug("Closed {} networks", this->distinct().size());
	});
}

} // namespace searchnet
