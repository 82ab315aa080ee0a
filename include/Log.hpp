#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace searchnet {
namespace log {

/**
 * Configure the sinks shared by every searchnet logger: a colored stderr
 * sink, plus a file sink when file is non-empty.
 * Loggers created before init() keep their old sinks; call it first.
 */
void init(spdlog::level::level_enum level = spdlog::level::info, const std::string& file = "");
void init(const std::string& level, const std::string& file = "");

// "trace", "debug", "info", "warn"/"warning", "err"/"error", "critical", "off"
spdlog::level::level_enum parseLevel(const std::string& level);

// Named logger "searchnet.<name>", created on first use
std::shared_ptr<spdlog::logger> get(const std::string& name);

} // namespace log
} // namespace searchnet
