#include "Log.hpp"
#include "Errors.hpp"
#include "utils.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace searchnet {
namespace log {

namespace {

struct Registry {
	std::mutex mutex;
	std::vector<spdlog::sink_ptr> sinks;
	spdlog::level::level_enum level = spdlog::level::info;
};

Registry& registry() {
	static Registry instance;
	return instance;
}

std::vector<spdlog::sink_ptr> default_sinks() {
	return {std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
}

} // namespace

spdlog::level::level_enum parseLevel(const std::string& level) {
	const std::string l = util::tolower(level);
	if (l == "trace") return spdlog::level::trace;
	if (l == "debug") return spdlog::level::debug;
	if (l == "info") return spdlog::level::info;
	if (l == "warn" || l == "warning") return spdlog::level::warn;
	if (l == "err" || l == "error") return spdlog::level::err;
	if (l == "critical") return spdlog::level::critical;
	if (l == "off") return spdlog::level::off;
	throw ConfigurationError("Unknown log level: " + level);
}

void init(spdlog::level::level_enum level, const std::string& file) {
	auto& reg = registry();
	std::lock_guard<std::mutex> lk(reg.mutex);

	reg.sinks = default_sinks();
	if (!file.empty())
		reg.sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
	reg.level = level;

	spdlog::apply_all([&](std::shared_ptr<spdlog::logger> logger) {
		if (logger->name().rfind("searchnet.", 0) == 0)
			logger->set_level(level);
	});
}

void init(const std::string& level, const std::string& file) {
	init(parseLevel(level), file);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
	const std::string fullName = "searchnet." + name;

	auto& reg = registry();
	std::lock_guard<std::mutex> lk(reg.mutex);

	if (auto logger = spdlog::get(fullName))
		return logger;

	if (reg.sinks.empty())
		reg.sinks = default_sinks();

	auto logger = std::make_shared<spdlog::logger>(fullName, reg.sinks.begin(), reg.sinks.end());
	logger->set_level(reg.level);
	logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
	spdlog::register_logger(logger);
	return logger;
}

} // namespace log
} // namespace searchnet
