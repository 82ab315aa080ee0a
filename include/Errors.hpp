#pragma once

#include "Response.hpp"

#include <stdexcept>
#include <string>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace searchnet {

class NetworkError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Invalid proxy, IP address or network option, failed Tor verification. Never retried.
class ConfigurationError : public NetworkError {
public:
	using NetworkError::NetworkError;
};

// Connection refused, TLS failure, malformed or missing response.
class TransportError : public NetworkError {
public:
	explicit TransportError(const std::string& what, CURLcode code = CURLE_OK)
		: NetworkError(what), code_(code) {}

	CURLcode curlCode() const noexcept { return this->code_; }

private:
	CURLcode code_;
};

// The peer closed the connection without sending a response.
class RemoteDisconnectedError : public TransportError {
public:
	using TransportError::TransportError;
};

class TlsError : public TransportError {
public:
	using TransportError::TransportError;
};

class TimeoutError : public TransportError {
public:
	explicit TimeoutError(const std::string& what, CURLcode code = CURLE_OPERATION_TIMEDOUT)
		: TransportError(what, code) {}
};

class HttpStatusError : public NetworkError {
public:
	explicit HttpStatusError(Response response);

	const Response& response() const noexcept { return this->response_; }

private:
	Response response_;
};

/**
 * Raised by engine code (or by the retry loop itself for a retry-triggering
 * status) when a response is usable but another attempt may do better.
 * Consumed by the retry loop: once the budget is spent the carried response
 * is returned instead.
 */
class SoftRetryError : public NetworkError {
public:
	explicit SoftRetryError(Response response, const std::string& reason = "soft retry");

	const Response& response() const noexcept { return this->response_; }

private:
	Response response_;
};

// Throws the TransportError subclass matching a curl result code.
[[noreturn]] void throwTransportError(CURLcode code, const std::string& detail = "");

} // namespace searchnet
