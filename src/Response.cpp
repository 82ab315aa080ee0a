#include "Response.hpp"
#include "Errors.hpp"
#include "Transport.hpp"

#include <stdexcept>
#include <utility>

namespace searchnet {

Response::Response(HttpResponse native, std::string method, std::string url)
	: native_(std::move(native)), method_(util::toupper(method)), url_(std::move(url)) {
	if (this->url_.empty())
		this->url_ = this->native_.effectiveUrl;
}

nlohmann::json Response::json() const {
	return nlohmann::json::parse(this->native_.body);
}

std::optional<std::string> Response::header(std::string_view name) const {
	for (const auto& line : this->native_.headers) {
		auto colon = line.find(':');
		if (colon == std::string::npos)
			continue;
		if (!util::iequals(std::string_view(line).substr(0, colon), name))
			continue;

		size_t begin = colon + 1;
		while (begin < line.size() && (line[begin] == ' ' || line[begin] == '\t'))
			++begin;
		size_t end = line.size();
		while (end > begin && (line[end - 1] == ' ' || line[end - 1] == '\t'))
			--end;
		return line.substr(begin, end - begin);
	}
	return std::nullopt;
}

void Response::raiseForStatus() const {
	if (!this->ok())
		throw HttpStatusError(*this);
}

BodyStream& Response::stream() const {
	if (!this->stream_)
		throw std::logic_error("Response is not a streamed response");
	return *this->stream_;
}

void Response::attachStream(std::shared_ptr<BodyStream> stream) {
	this->stream_ = std::move(stream);
}

void Response::close() {
	if (this->stream_)
		this->stream_->close();
}

} // namespace searchnet
