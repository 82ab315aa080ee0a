#pragma once

#include "Errors.hpp"
#include "HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace searchnet {
namespace mock {

// What the next send does
struct Step {
	enum Kind { Status, Disconnect, TransportFailure, Tls };

	Kind kind = Status;
	long status = 200;
	std::string body;
	double delay = 0; // seconds, capped by the request timeout

	static Step ok(std::string body = "") { return Step{Status, 200, std::move(body), 0}; }
	static Step http(long status) { return Step{Status, status, "", 0}; }
	static Step disconnect() { return Step{Disconnect, 0, "", 0}; }
	static Step failure(double delay = 0) { return Step{TransportFailure, 0, "", delay}; }
	static Step tls() { return Step{Tls, 0, "", 0}; }
};

struct Attempt {
	int client;	// serial of the client that sent
	std::string url;
	float timeout;
	bool stream;
	std::optional<std::string> sourceAddress;
	std::optional<ProxySet> proxies;
};

/**
 * Steps shared by every client of a factory, optionally bound to one URL.
 * Once empty every send answers 200. Records each attempt.
 */
class Script {
public:
	void push(Step step) {
		std::lock_guard<std::mutex> lk(this->mutex_);
		this->steps_.push_back(std::move(step));
	}

	void pushFor(const std::string& url, Step step) {
		std::lock_guard<std::mutex> lk(this->mutex_);
		this->byUrl_[url].push_back(std::move(step));
	}

	Step next(const std::string& url) {
		std::lock_guard<std::mutex> lk(this->mutex_);
		auto it = this->byUrl_.find(url);
		if (it != this->byUrl_.end() && !it->second.empty()) {
			Step step = std::move(it->second.front());
			it->second.pop_front();
			return step;
		}
		if (this->steps_.empty())
			return Step::ok();
		Step step = std::move(this->steps_.front());
		this->steps_.pop_front();
		return step;
	}

	void record(Attempt attempt) {
		std::lock_guard<std::mutex> lk(this->mutex_);
		this->attempts_.push_back(std::move(attempt));
	}

	std::vector<Attempt> attempts() const {
		std::lock_guard<std::mutex> lk(this->mutex_);
		return this->attempts_;
	}

	size_t attemptCount() const {
		std::lock_guard<std::mutex> lk(this->mutex_);
		return this->attempts_.size();
	}

private:
	mutable std::mutex mutex_;
	std::deque<Step> steps_;
	std::map<std::string, std::deque<Step>> byUrl_;
	std::vector<Attempt> attempts_;
};

class MockHttpClient : public HttpClient {
public:
	MockHttpClient(std::shared_ptr<Script> script, ClientConfig config, int serial)
		: script_(std::move(script)), config_(std::move(config)), serial_(serial) {}

	Response send(const HttpRequest& request, const RequestPolicy& policy) override {
		return this->respond(request, policy, false);
	}

	Response stream(const HttpRequest& request, const RequestPolicy& policy) override {
		return this->respond(request, policy, true);
	}

	void close() override {
		this->closed_.store(true);
		++this->closeCount_;
	}
	bool isClosed() const override { return this->closed_.load(); }

	const ClientConfig& config() const { return this->config_; }
	int serial() const { return this->serial_; }
	int closeCount() const { return this->closeCount_.load(); }

	// Requests as received, in order
	std::vector<HttpRequest> requests() const {
		std::lock_guard<std::mutex> lk(this->mutex_);
		return this->requests_;
	}
	std::vector<RequestPolicy> policies() const {
		std::lock_guard<std::mutex> lk(this->mutex_);
		return this->policies_;
	}

private:
	Response respond(const HttpRequest& request, const RequestPolicy& policy, bool stream) {
		if (this->closed_.load())
			throw TransportError("Client is closed");

		{
			std::lock_guard<std::mutex> lk(this->mutex_);
			this->requests_.push_back(request);
			this->policies_.push_back(policy);
		}
		Step step = this->script_->next(request.url);
		this->script_->record(Attempt{this->serial_, request.url, policy.timeout, stream, this->config_.sourceAddress,
									  this->config_.proxies});

		if (step.delay > 0) {
			// Like curl, a timed out transfer gives up slightly after its deadline
			bool timedOut = policy.timeout > 0 && step.delay > policy.timeout;
			double wait = timedOut ? policy.timeout + 0.005 : step.delay;
			std::this_thread::sleep_for(std::chrono::duration<double>(wait));
			if (timedOut)
				throw TimeoutError("Operation timed out", CURLE_OPERATION_TIMEDOUT);
		}

		switch (step.kind) {
			case Step::Disconnect:
				throw RemoteDisconnectedError("Server disconnected without sending a response", CURLE_GOT_NOTHING);
			case Step::TransportFailure:
				throw TransportError("Could not connect", CURLE_COULDNT_CONNECT);
			case Step::Tls:
				throw TlsError("SSL peer certificate was not OK", CURLE_PEER_FAILED_VERIFICATION);
			case Step::Status:
				break;
		}

		HttpResponse native;
		native.status = step.status;
		native.effectiveUrl = request.url;
		native.body = step.body;
		return Response(std::move(native), request.methodName, request.url);
	}

	std::shared_ptr<Script> script_;
	ClientConfig config_;
	int serial_;
	std::atomic<bool> closed_{false};
	std::atomic<int> closeCount_{0};

	mutable std::mutex mutex_;
	std::vector<HttpRequest> requests_;
	std::vector<RequestPolicy> policies_;
};

/**
 * ClientFactory producing MockHttpClients over one Script. Copies share
 * their state, so a copy can be handed to a Network.
 */
class MockFactory {
public:
	MockFactory() : state_(std::make_shared<State>()) {}

	std::shared_ptr<Script> script() const { return this->state_->script; }

	ClientFactory factory() const {
		auto state = this->state_;
		return [state](const ClientConfig& config) -> std::shared_ptr<HttpClient> {
			std::lock_guard<std::mutex> lk(state->mutex);
			auto client = std::make_shared<MockHttpClient>(state->script, config, static_cast<int>(state->clients.size()));
			state->clients.push_back(client);
			return client;
		};
	}

	std::vector<std::shared_ptr<MockHttpClient>> clients() const {
		std::lock_guard<std::mutex> lk(this->state_->mutex);
		return this->state_->clients;
	}

	size_t created() const {
		std::lock_guard<std::mutex> lk(this->state_->mutex);
		return this->state_->clients.size();
	}

private:
	struct State {
		std::mutex mutex;
		std::shared_ptr<Script> script = std::make_shared<Script>();
		std::vector<std::shared_ptr<MockHttpClient>> clients;
	};

	std::shared_ptr<State> state_;
};

} // namespace mock
} // namespace searchnet
