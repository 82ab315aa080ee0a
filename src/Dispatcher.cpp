#include "Dispatcher.hpp"
#include "Errors.hpp"
#include "HttpClient.hpp"
#include "Log.hpp"
#include "utils.hpp"

#include <future>
#include <stdexcept>

namespace searchnet {

static bool has_header(const std::vector<std::string>& headers, std::string_view name) {
	for (const auto& header : headers) {
		auto colon = header.find(':');
		if (colon != std::string::npos && util::iequals(std::string_view(header).substr(0, colon), name))
			return true;
	}
	return false;
}

static std::unique_ptr<Transport> make_transport(const Settings& settings) {
	log::init(settings.logLevel, settings.logFile);
	return std::make_unique<Transport>(settings.transport);
}

Dispatcher::Dispatcher(const Settings& settings, bool check)
	: transport_(make_transport(settings)),
	  registry_(NetworkRegistry::fromSettings(settings, CurlHttpClient::factory(*this->transport_), check)),
	  requestTimeout_(settings.outgoing.requestTimeout) {
	log::get("dispatcher")->debug("{} networks ready", this->registry_->names().size());
}

Dispatcher::Dispatcher(std::shared_ptr<NetworkRegistry> registry, double requestTimeout)
	: registry_(std::move(registry)), requestTimeout_(requestTimeout) {
	if (!this->registry_)
		throw std::invalid_argument("Dispatcher: no network registry");
}

Dispatcher::~Dispatcher() {
	this->shutdown();
}

void Dispatcher::shutdown() {
	std::call_once(this->shutdownOnce_, [this]() {
		this->registry_->shutdown();
		if (this->transport_)
			this->transport_->stop();
	});
}

HttpRequest Dispatcher::buildRequest(const std::string& method, const std::string& url,
									 const RequestOptions& options) {
	HttpRequest request;
	request.methodName = util::toupper(method);
	request.url = url;

	if (!options.params.empty()) {
		if (request.url.find('?') == std::string::npos)
			request.url += '?';
		else if (request.url.back() != '?' && request.url.back() != '&')
			request.url += '&';
		for (size_t i = 0; i < options.params.size(); ++i) {
			if (i) request.url += '&';
			request.url += util::urlEncode(options.params[i].first) + "=" + util::urlEncode(options.params[i].second);
		}
	}

	for (const auto& [name, value] : options.headers)
		request.headers.push_back(name + ": " + value);

	if (!options.cookies.empty() && !has_header(request.headers, "Cookie")) {
		std::string cookie = "Cookie: ";
		bool first = true;
		for (const auto& [name, value] : options.cookies) {
			if (!first) cookie += "; ";
			cookie += name + "=" + value;
			first = false;
		}
		request.headers.push_back(std::move(cookie));
	}

	if (options.content) {
		request.body = *options.content;
	} else if (options.json) {
		request.body = options.json->dump();
		if (!has_header(request.headers, "Content-Type"))
			request.headers.push_back("Content-Type: application/json");
	} else if (!options.data.empty()) {
		request.body = util::encodeForm(options.data);
		if (!has_header(request.headers, "Content-Type"))
			request.headers.push_back("Content-Type: application/x-www-form-urlencoded");
	}
	return request;
}

RequestPolicy Dispatcher::buildPolicy(const std::string& method, const RequestOptions& options) {
	RequestPolicy policy;
	auto m = HttpRequest::method2Enum(method);
	policy.followRedirects = options.allowRedirects.value_or(m == HttpRequest::GET || m == HttpRequest::OPTIONS);
	return policy;
}

SendOptions Dispatcher::buildSendOptions(const RequestOptions& options, bool stream) {
	SendOptions send;
	send.timeout = options.timeout;
	send.overrides.verify = options.verify;
	send.overrides.maxRedirects = options.maxRedirects;
	send.stream = stream;
	return send;
}

Response Dispatcher::run(const std::string& method, const std::string& url, const RequestOptions& options,
						 const std::string& network, bool stream,
						 std::optional<RequestContext::Clock::time_point> startTime) {
	double timeout = options.timeout.value_or(this->defaultTimeout(network));
	auto ctx = this->registry_->get(network)->getContext(timeout, startTime);
	Response response = ctx.request(buildRequest(method, url, options), buildPolicy(method, options),
									buildSendOptions(options, stream));
	if (options.raiseForHttpError)
		response.raiseForStatus();
	return response;
}

Response Dispatcher::request(const std::string& method, const std::string& url, const RequestOptions& options,
							 const std::string& network) {
	return this->run(method, url, options, network, false);
}

Response Dispatcher::request(RequestContext& ctx, const std::string& method, const std::string& url,
							 const RequestOptions& options) {
	Response response = ctx.send(buildRequest(method, url, options), buildPolicy(method, options),
								 buildSendOptions(options));
	if (options.raiseForHttpError)
		response.raiseForStatus();
	return response;
}

Response Dispatcher::stream(const std::string& method, const std::string& url, const RequestOptions& options,
							const std::string& network) {
	return this->run(method, url, options, network, true);
}

std::vector<MultiResult> Dispatcher::multiRequest(const std::vector<RequestDescriptor>& requests,
												  const std::string& network, std::optional<double> timeout) {
	const auto startTime = RequestContext::Clock::now();

	std::vector<std::future<Response>> futures;
	futures.reserve(requests.size());
	for (const auto& descriptor : requests) {
		futures.push_back(std::async(std::launch::async, [this, &descriptor, &network, timeout, startTime]() {
			RequestOptions options = descriptor.options;
			if (!options.timeout)
				options.timeout = timeout;
			return this->run(descriptor.method, descriptor.url, options, network, false, startTime);
		}));
	}

	std::vector<MultiResult> results(requests.size());
	for (size_t i = 0; i < futures.size(); ++i) {
		try {
			results[i].response.emplace(futures[i].get());
		} catch (const std::exception&) {
			results[i].error = std::current_exception();
		}
	}
	return results;
}

} // namespace searchnet
