#include "Transport.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <regex>
#include <thread>

namespace searchnet {

static void ensure_curl_global() {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw TransportError("curl_global_init failed", rc);
		std::atexit([]{ curl_global_cleanup(); });
	});
}

inline static double current_time() {
	return std::chrono::duration<double>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

// TransportSettings implementation
void TransportSettings::applyCurlMultiSettings(CURLM* handle) const {
#if LIBCURL_VERSION_NUM >= 0x081000
	curl_multi_setopt(handle, CURLMOPT_NETWORK_CHANGED, CURLMNWC_CLEAR_CONNS | CURLMNWC_CLEAR_DNS);
#endif
	curl_multi_setopt(handle, CURLMOPT_MAX_HOST_CONNECTIONS, this->maxHostConnections);
	curl_multi_setopt(handle, CURLMOPT_MAX_TOTAL_CONNECTIONS, this->maxTotalConnections);
	curl_multi_setopt(handle, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
}

// HttpTransfer implementation
HttpTransfer::HttpTransfer(HttpRequest request, RequestPolicy policy, Configure configure, std::shared_ptr<void> keepAlive) :
	errorBuffer_(new char[CURL_ERROR_SIZE]),
	request(std::move(request)), policy(std::move(policy)),
	configure_(std::move(configure)), keepAlive_(std::move(keepAlive)) {
	ensure_curl_global();

	this->errorBuffer_[0] = '\0';
	this->curlEasy = curl_easy_init();
	this->reset();
}

HttpTransfer::~HttpTransfer() {
	this->release();
}

void HttpTransfer::release() {
	// The easy handle goes first, keepAlive_ may own its share handle
	if (this->curlEasy)
		curl_easy_cleanup(this->curlEasy);
	curl_slist_free_all(this->headers_);
	this->curlEasy = NULL;
	this->headers_ = NULL;
}

HttpTransfer::HttpTransfer(HttpTransfer&& other) noexcept
	: curlEasy(std::exchange(other.curlEasy, nullptr)),
	  headers_(std::exchange(other.headers_, nullptr)),
	  errorBuffer_(std::move(other.errorBuffer_)),
	  contentLength(other.contentLength),
	  request(std::move(other.request)),
	  response(std::move(other.response)),
	  policy(std::move(other.policy)),
	  configure_(std::move(other.configure_)),
	  keepAlive_(std::move(other.keepAlive_)),
	  sink_(std::move(other.sink_)),
	  streaming_(other.streaming_),
	  headPublished_(other.headPublished_) {
	this->rebind_callbacks();
}

HttpTransfer& HttpTransfer::operator=(HttpTransfer&& other) noexcept {
	if (this != &other) {
		// Clean up current resources
		this->release();

		// Move from other
		this->curlEasy = std::exchange(other.curlEasy, nullptr);
		this->headers_ = std::exchange(other.headers_, nullptr);
		this->errorBuffer_ = std::move(other.errorBuffer_);
		this->contentLength = other.contentLength;
		this->request = std::move(other.request);
		this->response = std::move(other.response);
		this->policy = std::move(other.policy);
		this->configure_ = std::move(other.configure_);
		this->keepAlive_ = std::move(other.keepAlive_);
		this->sink_ = std::move(other.sink_);
		this->streaming_ = other.streaming_;
		this->headPublished_ = other.headPublished_;

		// Update callback data pointers to this
		this->rebind_callbacks();
	}
	return *this;
}

void HttpTransfer::rebind_callbacks() {
	if (this->curlEasy) {
		curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
		curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
	}
}

const HttpResponse& HttpTransfer::getResponse() const {
	return this->response;
}

HttpResponse HttpTransfer::detachResponse() {
	return std::move(this->response);
}

void HttpTransfer::setSink(const std::shared_ptr<BodyStream>& sink) {
	this->sink_ = sink;
	this->streaming_ = static_cast<bool>(sink);
}

void HttpTransfer::finalize_transfer(CURLcode code) {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &this->response.status);
	curl_easy_getinfo(this->curlEasy, CURLINFO_HTTP_VERSION, &this->response.httpVersion);

	char* effectiveUrl = nullptr;
	curl_easy_getinfo(this->curlEasy, CURLINFO_EFFECTIVE_URL, &effectiveUrl);
	this->response.effectiveUrl = effectiveUrl ? effectiveUrl : this->request.url;

	curl_off_t queue = 0, connect, appConnect, preTransfer, startTransfer, total, redir;
#if LIBCURL_VERSION_NUM >= 0x080600
	curl_easy_getinfo(this->curlEasy, CURLINFO_QUEUE_TIME_T, &queue);
#endif
	curl_easy_getinfo(this->curlEasy, CURLINFO_CONNECT_TIME_T, &connect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_APPCONNECT_TIME_T, &appConnect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_PRETRANSFER_TIME_T, &preTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_STARTTRANSFER_TIME_T, &startTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);
	curl_easy_getinfo(this->curlEasy, CURLINFO_REDIRECT_TIME_T, &redir);

	// appConnect stays 0 without TLS
	if (appConnect < connect)
		appConnect = connect;

	constexpr float us2s = 1e-6f;
	this->response.transferInfo.queue = queue * us2s;
	this->response.transferInfo.connect = std::max<curl_off_t>(connect - queue, 0) * us2s;
	this->response.transferInfo.appConnect = (appConnect - connect) * us2s;
	this->response.transferInfo.preTransfer = std::max<curl_off_t>(preTransfer - appConnect, 0) * us2s;
	this->response.transferInfo.startTransfer = std::max<curl_off_t>(startTransfer - preTransfer, 0) * us2s;
	this->response.transferInfo.receiveTransfer = std::max<curl_off_t>(total - startTransfer, 0) * us2s;
	this->response.transferInfo.total = total * us2s;
	this->response.transferInfo.redir = redir * us2s;

	this->response.transferInfo.completeAt = current_time();

	this->response.curlCode = code;
	if (code != CURLE_OK)
		this->response.error = this->errorBuffer_[0] ? this->errorBuffer_.get() : curl_easy_strerror(code);
}

void HttpTransfer::reset() {
	if(!this->curlEasy)
		this->curlEasy = curl_easy_init();
	else
		curl_easy_reset(this->curlEasy);
	if (!this->curlEasy)
		throw TransportError("curl_easy_init failed");

	this->response = HttpResponse();
	this->contentLength = 0;
	this->headPublished_ = false;
	this->errorBuffer_[0] = '\0';

	curl_easy_setopt(this->curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_.get());
	curl_easy_setopt(this->curlEasy, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_ACCEPT_ENCODING, "");
	curl_easy_setopt(this->curlEasy, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, this->request.url.c_str());
	curl_easy_setopt(this->curlEasy, CURLOPT_FOLLOWLOCATION, this->policy.followRedirects ? 1L : 0L);
	if (this->policy.timeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, static_cast<long>(this->policy.timeout * 1000));
	if (this->policy.connTimeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(this->policy.connTimeout * 1000));
	if (this->policy.curlBufferSize) {
		long buf_size = std::clamp(this->policy.curlBufferSize, 1024u, static_cast<uint32_t>(CURL_MAX_READ_SIZE));
		curl_easy_setopt(this->curlEasy, CURLOPT_BUFFERSIZE, buf_size);
	}

	if(this->headers_)
		curl_slist_free_all(this->headers_);
	this->headers_ = NULL;
	for (const auto& header : this->request.headers) {
		this->headers_ = curl_slist_append(this->headers_, header.c_str());
	}
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	switch (HttpRequest::method2Enum(this->request.methodName)) {
		case HttpRequest::HEAD: {
			curl_easy_setopt(this->curlEasy, CURLOPT_NOBODY, 1L);
			break;
		}
		case HttpRequest::GET: {
			curl_easy_setopt(this->curlEasy, CURLOPT_HTTPGET, 1L);
			break;
		}
		case HttpRequest::POST: {
			curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
			curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(this->request.body.size()));
			curl_easy_setopt(this->curlEasy, CURLOPT_COPYPOSTFIELDS, this->request.body.c_str());
			break;
		}
		default: {
			curl_easy_setopt(this->curlEasy, CURLOPT_CUSTOMREQUEST, util::toupper(this->request.methodName).c_str());
			if (this->request.body.size()) {
				curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(this->request.body.size()));
				curl_easy_setopt(this->curlEasy, CURLOPT_COPYPOSTFIELDS, this->request.body.c_str());
			}
		}
	}

	if (this->configure_)
		this->configure_(this->curlEasy);

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	this->rebind_callbacks();
}

void HttpTransfer::publish_head() {
	if (this->headPublished_)
		return;
	auto sink = this->sink_.lock();
	if (!sink)
		return;

	HttpResponse head;
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &head.status);
	curl_easy_getinfo(this->curlEasy, CURLINFO_HTTP_VERSION, &head.httpVersion);
	char* effectiveUrl = nullptr;
	curl_easy_getinfo(this->curlEasy, CURLINFO_EFFECTIVE_URL, &effectiveUrl);
	head.effectiveUrl = effectiveUrl ? effectiveUrl : this->request.url;
	head.headers = this->response.headers;
	head.transferInfo = this->response.transferInfo;

	sink->publishHead(head);
	this->headPublished_ = true;
}

size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	const size_t len = size * nmemb;

	if (transfer->streaming_) {
		auto sink = transfer->sink_.lock();
		if (!sink)
			return 0; // Consumer is gone, abort

		transfer->publish_head();
		switch (sink->push(static_cast<const char*>(ptr), len)) {
			case BodyStream::PushResult::Accepted:
				return len;
			case BodyStream::PushResult::Pause:
				return CURL_WRITEFUNC_PAUSE;
			default:
				return 0;
		}
	}

	if(transfer->contentLength > transfer->response.body.capacity())
		transfer->response.body.reserve(transfer->contentLength);

	transfer->response.body.append((char*)ptr, len);
	return len;
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);

	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	if (sv.empty()) {
		// End of a header block. Interim and followed-redirect blocks are not the final head.
		if (transfer->streaming_) {
			long status = 0;
			curl_easy_getinfo(transfer->curlEasy, CURLINFO_RESPONSE_CODE, &status);
			char* redirectUrl = nullptr;
			curl_easy_getinfo(transfer->curlEasy, CURLINFO_REDIRECT_URL, &redirectUrl);
			bool interim = status >= 100 && status < 200;
			bool redirect = transfer->policy.followRedirects && redirectUrl && status >= 300 && status < 400;
			if (!interim && !redirect)
				transfer->publish_head();
		}
		return len;
	}
	if (sv.rfind("HTTP/", 0) == 0) {
		// New status line: keep only the headers of the last response
		transfer->response.headers.clear();
		transfer->contentLength = 0;
		return len;
	}

	transfer->response.headers.emplace_back(sv);

	// Parse content-length for pre-allocation
	static const std::regex contentLengthRegex("^content-length:\\s*(\\d+)", std::regex::icase);
	std::match_results<std::string_view::const_iterator> match;
	if (std::regex_search(sv.begin(), sv.end(), match, contentLengthRegex)) {
		transfer->contentLength = std::strtoull(match[1].str().c_str(), nullptr, 10);
	}

	return len;
}

// Transport::TransferState implementation
Transport::TransferState::TransferState(std::shared_future<HttpResponse>&& future, CURL* curl, Transport* transport)
	: future(future), curl(curl), transport_(transport) {}

void Transport::TransferState::cancel() {
	State expected = this->state.load(std::memory_order_acquire);
	do {
		// Completed and cancelled transfers may outlive their transport
		if (expected == State::Completed || expected == State::Cancel)
			return;
	} while (!this->state.compare_exchange_weak(expected, State::Cancel, std::memory_order_acq_rel));

	{
		std::unique_lock<std::mutex> lk(transport_->mutex_);
		transport_->events_.emplace(this->curl);
	}
	transport_->wakeup();
}

void Transport::TransferState::resume() {
	State expected = State::Ongoing;
	if (!this->state.compare_exchange_strong(expected, State::Resume, std::memory_order_acq_rel)) {
		// If not from Ongoing, discard
		return;
	}

	{
		std::unique_lock<std::mutex> lk(transport_->mutex_);
		transport_->events_.emplace(this->curl);
	}
	transport_->wakeup();
}

Transport::TransferState::State Transport::TransferState::get_state() {
	return this->state.load(std::memory_order_acquire);
}

// Transport::TransferTask implementation
Transport::TransferTask::TransferTask(HttpTransfer t, Transport* transport)
	: transfer(std::move(t)),
	  state(transport->make_state(this->promise.get_future().share(), this->transfer.curlEasy)) {}

std::shared_ptr<Transport::TransferState> Transport::make_state(std::shared_future<HttpResponse> future, CURL* curl) {
	return std::shared_ptr<TransferState>(new TransferState(std::move(future), curl, this));
}

// Transport implementation
Transport::Transport(TransportSettings settings)
	: settings_(std::move(settings)),
	  logger_(log::get("transport")),
	  sema_(std::max<size_t>(settings_.maxTransfers, 1), std::max<size_t>(settings_.maxTransfers, 1)) {
	ensure_curl_global();

	this->multi_ = curl_multi_init();
	if (!this->multi_)
		throw TransportError("curl_multi_init failed");
	this->settings_.applyCurlMultiSettings(this->multi_);
	this->worker_ = std::thread(&Transport::worker_loop, this);

	this->logger_->debug("Transport started ({}, max {} transfers)", curl_version(), this->settings_.maxTransfers);
}

Transport::~Transport() {
	this->stop();
	if (this->worker_.joinable())
		this->worker_.join();

	curl_multi_cleanup(this->multi_);
}

void Transport::stop() {
	if (!this->stop_.exchange(true)) {
		this->logger_->debug("Transport stopping");
		this->wakeup();
	}
}

void Transport::wakeup() {
	curl_multi_wakeup(this->multi_);
}

std::shared_ptr<Transport::TransferState> Transport::submit(HttpTransfer transfer, float acquireTimeout) {
	if (this->stop_.load())
		throw TransportError("The transport is stopped", CURLE_ABORTED_BY_CALLBACK);

	if (acquireTimeout > 0) {
		if (!this->sema_.try_acquire_for(std::chrono::duration<float>(acquireTimeout)))
			throw TimeoutError("No transfer slot became available in time");
	} else {
		this->sema_.acquire();
	}

	TransferTask task(std::move(transfer), this);
	std::shared_ptr<TransferState> state = task.state;

	{
		std::unique_lock lk(this->mutex_);
		if (this->stop_.load()) {
			this->sema_.release();
			throw TransportError("The transport is stopped", CURLE_ABORTED_BY_CALLBACK);
		}
		this->requests.emplace(std::move(task));
	}
	this->wakeup();

	return state;
}

void Transport::worker_loop() {
	while (1) {
		int still_running = 0;
		CURLMcode mc;
		do {
			mc = curl_multi_perform(this->multi_, &still_running);
		} while (mc == CURLM_CALL_MULTI_PERFORM);
		if (mc != CURLM_OK) [[unlikely]]
			this->logger_->error("curl_multi_perform failed: {}", curl_multi_strerror(mc));

		// Harvest results
		CURLMsg* msg;
		do {
			int msgq = 0;
			msg = curl_multi_info_read(this->multi_, &msgq);
			if (msg && (msg->msg == CURLMSG_DONE)) {
				CURL* easy = msg->easy_handle;
				CURLcode curlCode = msg->data.result;
				curl_multi_remove_handle(this->multi_, easy);
				this->sema_.release();

				auto mit = this->curl2Task.find(easy);
				if (mit != this->curl2Task.end() && mit->second)
					this->handle_completion(mit->second.value(), curlCode);
			}
		} while (msg);

		long t = -1;
		curl_multi_timeout(this->multi_, &t);

		int poll_timeout;
		if (t < 0)
			poll_timeout = this->settings_.pollMs;
		else if (t == 0)
			poll_timeout = 0;
		else
			poll_timeout = (int)std::min<long>(t, this->settings_.pollMs);

		curl_multi_poll(this->multi_, nullptr, 0, poll_timeout, NULL);

		// Handle stop
		if (this->stop_.load()) [[unlikely]] {
			std::unique_lock<std::mutex> lk(this->mutex_);

			for (auto it = this->transfers.begin(); it != this->transfers.end(); ++it) {
				curl_multi_remove_handle(this->multi_, it->transfer.curlEasy);
				this->sema_.release();
				this->fail_task(*it, CURLE_ABORTED_BY_CALLBACK, "The transport stopped while the transfer was running");
			}
			this->curl2Task.clear();
			this->transfers.clear();

			while (!this->requests.empty()) {
				this->fail_task(this->requests.front(), CURLE_ABORTED_BY_CALLBACK, "The transport stopped before the transfer started");
				this->requests.pop();
				this->sema_.release();
			}

			// Exit the worker loop
			break;
		}

		// Handle events
		this->handle_events();

		// Add new request
		std::vector<TransferTask> pendingTasks;
		{
			std::unique_lock<std::mutex> lk(this->mutex_);

			pendingTasks.reserve(this->requests.size());
			while (!this->requests.empty()) {
				pendingTasks.emplace_back(std::move(this->requests.front()));
				this->requests.pop();
			}
		}

		for (auto&& task : pendingTasks) {
			// Cancelled before it reached the loop
			if (task.state->get_state() == TransferState::Cancel) {
				this->sema_.release();
				this->fail_task(task, CURLE_ABORTED_BY_CALLBACK, "The transfer was cancelled");
				continue;
			}

			this->transfers.emplace_back(std::move(task));
			auto it = std::prev(this->transfers.end());
			CURL* easy = it->transfer.curlEasy;

			mc = curl_multi_add_handle(this->multi_, easy);
			if (mc != CURLM_OK) [[unlikely]] {
				this->sema_.release();
				this->fail_task(*it, CURLE_FAILED_INIT, std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
				this->transfers.erase(it);
				continue;
			}
			this->curl2Task[easy] = it;
		}
	}
}

void Transport::handle_events() {
	std::vector<CURL*> events;
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		events.reserve(this->events_.size());
		while (!this->events_.empty()) {
			events.push_back(this->events_.front());
			this->events_.pop();
		}
	}

	for (CURL* curlEasy : events) {
		if (!curlEasy)
			continue;

		auto mit = this->curl2Task.find(curlEasy);
		if (mit == this->curl2Task.end() || !mit->second)
			continue;

		auto it = mit->second.value();
		TransferState::State state = it->state->state.load(std::memory_order_acquire);

		switch (state) {
			case TransferState::Cancel:
				this->handle_cancel(*it);
				this->curl2Task.erase(curlEasy);
				this->transfers.erase(it);
				break;
			case TransferState::Resume:
				this->handle_resume(*it);
				break;
			default:
				break;
		}
	}
}

void Transport::handle_cancel(TransferTask& task) {
	curl_multi_remove_handle(this->multi_, task.transfer.curlEasy);
	this->sema_.release();
	this->fail_task(task, CURLE_ABORTED_BY_CALLBACK, "The transfer was cancelled");
}

void Transport::handle_resume(TransferTask& task) {
	TransferState::State expected = TransferState::Resume;
	task.state->state.compare_exchange_strong(expected, TransferState::Ongoing, std::memory_order_acq_rel);
	// May call body_cb synchronously with the data held back while paused
	curl_easy_pause(task.transfer.curlEasy, CURLPAUSE_CONT);
}

void Transport::handle_completion(std::list<TransferTask>::iterator it, CURLcode curlCode) {
	it->transfer.finalize_transfer(curlCode);
	it->state->state.store(TransferState::Completed, std::memory_order_release);

	if (auto sink = it->transfer.sink_.lock())
		sink->finish(curlCode, it->transfer.response.error, it->transfer.response);

	if (curlCode != CURLE_OK)
		this->logger_->debug("Transfer of {} failed: {}", it->transfer.request.url, it->transfer.response.error);

	it->promise.set_value(it->transfer.detachResponse());

	this->curl2Task.erase(it->transfer.curlEasy);
	this->transfers.erase(it);
}

void Transport::fail_task(TransferTask& task, CURLcode code, const std::string& reason) {
	// Before the sink: a stream released here must not enqueue a cancel
	TransferState::State expected = TransferState::Ongoing;
	task.state->state.compare_exchange_strong(expected, TransferState::Completed, std::memory_order_acq_rel);
	expected = TransferState::Resume;
	task.state->state.compare_exchange_strong(expected, TransferState::Completed, std::memory_order_acq_rel);

	if (auto sink = task.transfer.sink_.lock())
		sink->finish(code, reason, task.transfer.response);

	task.promise.set_exception(std::make_exception_ptr(TransportError(reason, code)));
}

// BodyStream implementation
BodyStream::BodyStream(size_t bufferLimit) : limit_(std::max<size_t>(bufferLimit, 1)) {}

BodyStream::~BodyStream() {
	this->close();
}

BodyStream::PushResult BodyStream::push(const char* data, size_t len) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	if (this->closed_)
		return PushResult::Abort;
	if (this->buffered_ >= this->limit_) {
		// curl hands the same data again once resumed
		this->paused_ = true;
		return PushResult::Pause;
	}

	this->chunks_.emplace_back(data, len);
	this->buffered_ += len;
	this->cv_.notify_all();
	return PushResult::Accepted;
}

void BodyStream::publishHead(const HttpResponse& head) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	if (this->headReady_)
		return;
	this->head_ = head;
	this->head_.body.clear();
	this->headReady_ = true;
	this->cv_.notify_all();
}

void BodyStream::finish(CURLcode code, const std::string& error, const HttpResponse& head) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	if (!this->headReady_) {
		this->head_ = head;
		this->head_.body.clear();
		this->headReady_ = true;
	}
	if (!this->finished_) {
		this->finished_ = true;
		this->code_ = code;
		this->error_ = error;
	}
	this->cv_.notify_all();
}

bool BodyStream::waitHead(float timeout) {
	std::unique_lock<std::mutex> lk(this->mutex_);
	auto ready = [&]() { return this->headReady_ || this->finished_; };
	if (timeout <= 0) {
		this->cv_.wait(lk, ready);
		return true;
	}
	return this->cv_.wait_for(lk, std::chrono::duration<float>(timeout), ready);
}

HttpResponse BodyStream::head() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->head_;
}

CURLcode BodyStream::result() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->code_;
}

std::string BodyStream::error() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->error_;
}

bool BodyStream::finished() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->finished_;
}

void BodyStream::attach(std::weak_ptr<Transport::TransferState> state) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->state_ = std::move(state);
}

void BodyStream::holdResource(std::shared_ptr<void> resource) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->resources_.push_back(std::move(resource));
}

std::optional<std::string> BodyStream::next() {
	std::unique_lock<std::mutex> lk(this->mutex_);
	this->cv_.wait(lk, [&]() { return !this->chunks_.empty() || this->finished_; });

	if (!this->chunks_.empty()) {
		std::string chunk = std::move(this->chunks_.front());
		this->chunks_.pop_front();
		this->buffered_ -= chunk.size();

		bool resume = this->paused_ && this->buffered_ <= this->limit_ / 2;
		if (resume)
			this->paused_ = false;
		auto state = this->state_.lock();
		lk.unlock();

		if (resume && state)
			state->resume();
		return chunk;
	}

	if (this->code_ != CURLE_OK && !this->closed_) {
		CURLcode code = this->code_;
		std::string error = this->error_;
		lk.unlock();
		throwTransportError(code, error);
	}
	return std::nullopt;
}

void BodyStream::close() {
	std::shared_ptr<Transport::TransferState> state;
	std::vector<std::shared_ptr<void>> resources;
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		if (this->closed_)
			return;
		this->closed_ = true;
		this->finished_ = true;
		this->chunks_.clear();
		this->buffered_ = 0;
		state = this->state_.lock();
		resources.swap(this->resources_);
		this->cv_.notify_all();
	}

	if (state)
		state->cancel();
}

} // namespace searchnet
