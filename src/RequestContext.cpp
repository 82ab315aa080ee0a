#include "RequestContext.hpp"

namespace searchnet {

RequestContext::RequestContext(Network& network, std::optional<double> timeout,
							   std::optional<Clock::time_point> startTime)
	: network_(&network),
	  strategy_(&network.retryStrategy()),
	  retries_(network.settings().retries),
	  startTime_(startTime.value_or(Clock::now())),
	  timeout_(timeout && *timeout > 0 ? *timeout : DEFAULT_TIMEOUT) {}

double RequestContext::remainingTime(std::optional<double> overrideTimeout) const {
	double budget = overrideTimeout && *overrideTimeout > 0 ? *overrideTimeout : this->timeout_;
	double elapsed = std::chrono::duration<double>(Clock::now() - this->startTime_).count();
	return budget + OVERHEAD - elapsed;
}

std::shared_ptr<HttpClient> RequestContext::boundClient(const ClientOverrides& overrides) {
	auto& slot = this->clients_[overrides];
	if (!slot || slot->isClosed())
		slot = this->network_->getClient(overrides.verify, overrides.maxRedirects);
	return slot;
}

bool RequestContext::hasClient(const ClientOverrides& overrides) const {
	auto it = this->clients_.find(overrides);
	return it != this->clients_.end() && it->second && !it->second->isClosed();
}

std::shared_ptr<HttpClient> RequestContext::newClient(const ClientOverrides& overrides) {
	return this->network_->getClient(overrides.verify, overrides.maxRedirects);
}

void RequestContext::discardClient(const ClientOverrides& overrides) {
	auto it = this->clients_.find(overrides);
	if (it == this->clients_.end())
		return;
	this->network_->discardClient(it->second);
	this->clients_.erase(it);
}

void RequestContext::resetClient(bool discard) {
	if (discard) {
		for (auto& [overrides, client] : this->clients_)
			this->network_->discardClient(client);
	}
	this->clients_.clear();
}

Response RequestContext::send(const HttpRequest& request, const RequestPolicy& policy, const SendOptions& options) {
	return this->strategy_->send(*this, request, policy, options);
}

Response RequestContext::request(const HttpRequest& request, const RequestPolicy& policy, const SendOptions& options) {
	return this->call([&](RequestContext& ctx) { return ctx.send(request, policy, options); });
}

} // namespace searchnet
