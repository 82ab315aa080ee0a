#pragma once

#include "models.hpp"
#include "utils.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

#include <spdlog/logger.h>

namespace searchnet {

struct TransportSettings {
	size_t maxTransfers = 64;		// transfers running in the event loop at once
	long maxHostConnections = 0;	// 0 means unlimited
	long maxTotalConnections = 0;	// 0 means unlimited
	long pollMs = 100;
	size_t streamBufferLimit = 1 << 20; // bytes buffered per stream before the transfer is paused

	void applyCurlMultiSettings(CURLM* handle) const;
};

class BodyStream;

/**
 * One curl easy handle plus the request it performs and the response it
 * fills. configure is applied after the defaults on every reset(), it carries
 * the client's egress settings. keepAlive is released only after the easy
 * handle is cleaned up (a curl share handle must outlive its users).
 */
class HttpTransfer {
public:
	using Configure = std::function<void(CURL*)>;

	explicit HttpTransfer(HttpRequest request, RequestPolicy policy = RequestPolicy(),
						  Configure configure = nullptr, std::shared_ptr<void> keepAlive = nullptr);
	~HttpTransfer();

	// Moveable, Not copyable
	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;
	HttpTransfer(HttpTransfer&& other) noexcept;
	HttpTransfer& operator=(HttpTransfer&& other) noexcept;

	const HttpRequest& getRequest() const { return this->request; }
	const HttpResponse& getResponse() const;
	HttpResponse detachResponse();

	// Body chunks go to the sink instead of the response
	void setSink(const std::shared_ptr<BodyStream>& sink);

	void finalize_transfer(CURLcode code = CURLE_OK);
	void reset();

private:
	friend class Transport;

	CURL* curlEasy = NULL;
	struct curl_slist* headers_ = NULL;
	std::unique_ptr<char[]> errorBuffer_;
	size_t contentLength = 0;

	HttpRequest request;
	HttpResponse response;
	RequestPolicy policy;

	Configure configure_;
	std::shared_ptr<void> keepAlive_;
	std::weak_ptr<BodyStream> sink_;
	bool streaming_ = false;
	bool headPublished_ = false;

	void rebind_callbacks();
	void release();
	void publish_head();

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
};

/**
 * A curl multi handle driven by one worker thread. Callers submit
 * transfers and wait on the returned state's future.
 */
class Transport {
public:
	class TransferState {
	public:
		enum State { Ongoing, Completed, Resume, Cancel };
		std::shared_future<HttpResponse> future;

		void resume();
		void cancel();
		State get_state();

	private:
		std::atomic<State> state = State::Ongoing;
		CURL* curl; // Only for look-up
		Transport* transport_;

		explicit TransferState(std::shared_future<HttpResponse>&& future, CURL* curl, Transport* transport);

		friend class Transport;
	};

	explicit Transport(TransportSettings settings = TransportSettings());
	~Transport();

	Transport(const Transport&) = delete;
	Transport& operator=(const Transport&) = delete;

	/**
	 * Hand a transfer to the event loop. Blocks while maxTransfers are
	 * running, at most acquireTimeout seconds (<=0 waits indefinitely).
	 * Throws TimeoutError when no slot frees up in time and TransportError
	 * once the transport is stopped.
	 */
	std::shared_ptr<TransferState> submit(HttpTransfer transfer, float acquireTimeout = 0);

	// Fail every queued and running transfer and exit the event loop
	void stop();
	bool stopped() const { return this->stop_.load(); }

	const TransportSettings& settings() const { return this->settings_; }

private:
	void worker_loop();
	void wakeup();
	std::shared_ptr<TransferState> make_state(std::shared_future<HttpResponse> future, CURL* curl);

	class TransferTask {
	private:
		HttpTransfer transfer;
		std::promise<HttpResponse> promise;
		std::shared_ptr<TransferState> state;

		explicit TransferTask(HttpTransfer t, Transport* transport);

		friend class Transport;
	};

	using TaskIter = std::optional<std::list<TransferTask>::iterator>;

	void handle_events();
	void handle_cancel(TransferTask& task);
	void handle_resume(TransferTask& task);
	void handle_completion(std::list<TransferTask>::iterator it, CURLcode curlCode);
	void fail_task(TransferTask& task, CURLcode code, const std::string& reason);

	TransportSettings settings_;
	std::shared_ptr<spdlog::logger> logger_;

	std::thread worker_;

	std::queue<TransferTask> requests;
	std::list<TransferTask> transfers;
	std::map<CURL*, TaskIter> curl2Task;
	std::queue<CURL*> events_;

	CURLM* multi_ = NULL;

	std::atomic<bool> stop_{false};
	std::mutex mutex_;
	BoundedSemaphore sema_;

	friend class TransferState;
};

/**
 * Consumer side of a streamed transfer. The worker pushes body chunks; once
 * streamBufferLimit bytes are buffered the transfer is paused and resumed
 * after the consumer drained half of it. Closing (or destroying) the stream
 * cancels the transfer.
 */
class BodyStream {
public:
	enum class PushResult { Accepted, Pause, Abort };

	explicit BodyStream(size_t bufferLimit);
	~BodyStream();

	BodyStream(const BodyStream&) = delete;
	BodyStream& operator=(const BodyStream&) = delete;

	// Worker side
	PushResult push(const char* data, size_t len);
	void publishHead(const HttpResponse& head);
	void finish(CURLcode code, const std::string& error, const HttpResponse& head);

	// Consumer side
	bool waitHead(float timeout);
	HttpResponse head() const;
	CURLcode result() const;
	std::string error() const;
	bool finished() const;

	void attach(std::weak_ptr<Transport::TransferState> state);
	void holdResource(std::shared_ptr<void> resource);

	/**
	 * Next chunk of the body, nullopt at the end.
	 * Throws the TransportError subclass matching the failure when the
	 * transfer did not complete.
	 */
	std::optional<std::string> next();
	void close();

private:
	mutable std::mutex mutex_;
	std::condition_variable cv_;

	const size_t limit_;
	std::deque<std::string> chunks_;
	size_t buffered_ = 0;
	bool paused_ = false;

	bool headReady_ = false;
	bool finished_ = false;
	bool closed_ = false;
	HttpResponse head_;
	CURLcode code_ = CURLE_OK;
	std::string error_;

	std::weak_ptr<Transport::TransferState> state_;
	std::vector<std::shared_ptr<void>> resources_;
};

} // namespace searchnet
