#pragma once

#include "models.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace searchnet {

class BodyStream;

/**
 * What callers get back from the dispatcher. Wraps the transport's native
 * HttpResponse instead of mutating it.
 *
 * A streamed response has an empty body; its content is read through
 * stream(). Destroying the last copy (or calling close()) releases the
 * connection even when the stream was not read to the end.
 */
class Response {
public:
	Response() = default;
	explicit Response(HttpResponse native, std::string method = "GET", std::string url = "");

	long status() const { return this->native_.status; }
	bool ok() const { return !isError(this->native_.status); }

	const std::string& method() const { return this->method_; }
	const std::string& url() const { return this->url_; }
	const std::string& text() const { return this->native_.body; }
	nlohmann::json json() const;

	// Case-insensitive, first match wins
	std::optional<std::string> header(std::string_view name) const;

	// Seconds spent in the transfer as reported by curl
	double elapsed() const { return this->native_.transferInfo.total; }

	const HttpResponse& native() const { return this->native_; }

	// Throws HttpStatusError when !ok()
	void raiseForStatus() const;

	bool isStream() const { return static_cast<bool>(this->stream_); }
	BodyStream& stream() const;
	void attachStream(std::shared_ptr<BodyStream> stream);
	void close();

	static bool isError(long status) { return status >= 400; }

private:
	HttpResponse native_;
	std::string method_;
	std::string url_;
	std::shared_ptr<BodyStream> stream_;
};

} // namespace searchnet
