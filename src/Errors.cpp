#include "Errors.hpp"

#include <utility>

namespace searchnet {

static std::string describe_status(const Response& response) {
	return std::to_string(response.status()) + " for " + response.method() + " " + response.url();
}

HttpStatusError::HttpStatusError(Response response)
	: NetworkError("HTTP error " + describe_status(response)), response_(std::move(response)) {}

SoftRetryError::SoftRetryError(Response response, const std::string& reason)
	: NetworkError(reason + ": " + describe_status(response)), response_(std::move(response)) {}

void throwTransportError(CURLcode code, const std::string& detail) {
	std::string message = curl_easy_strerror(code);
	if (!detail.empty())
		message += ": " + detail;

	switch (code) {
		case CURLE_OPERATION_TIMEDOUT:
			throw TimeoutError(message, code);
		case CURLE_GOT_NOTHING:
		case CURLE_SEND_ERROR:
		case CURLE_RECV_ERROR:
		case CURLE_PARTIAL_FILE:
			throw RemoteDisconnectedError(message, code);
		case CURLE_SSL_CONNECT_ERROR:
		case CURLE_SSL_CERTPROBLEM:
		case CURLE_SSL_CIPHER:
		case CURLE_SSL_CACERT_BADFILE:
		case CURLE_SSL_ENGINE_NOTFOUND:
		case CURLE_SSL_ENGINE_SETFAILED:
		case CURLE_SSL_ISSUER_ERROR:
		case CURLE_SSL_CRL_BADFILE:
		case CURLE_SSL_SHUTDOWN_FAILED:
		case CURLE_PEER_FAILED_VERIFICATION:
		case CURLE_USE_SSL_FAILED:
			throw TlsError(message, code);
		default:
			throw TransportError(message, code);
	}
}

} // namespace searchnet
