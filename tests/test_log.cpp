#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Log.hpp"

using namespace searchnet;

// --- LogTest ---

TEST(LogTest, ParseLevel) {
	EXPECT_EQ(log::parseLevel("debug"), spdlog::level::debug);
	EXPECT_EQ(log::parseLevel("WARNING"), spdlog::level::warn);
	EXPECT_EQ(log::parseLevel("error"), spdlog::level::err);
	EXPECT_EQ(log::parseLevel("off"), spdlog::level::off);
	EXPECT_THROW(log::parseLevel("verbose"), ConfigurationError);
}

TEST(LogTest, NamedLoggersAreShared) {
	auto first = log::get("test.shared");
	auto second = log::get("test.shared");
	EXPECT_EQ(first.get(), second.get());
	EXPECT_EQ(first->name(), "searchnet.test.shared");
}

TEST(LogTest, InitAppliesTheLevelToExistingLoggers) {
	auto logger = log::get("test.level");
	log::init("debug");
	EXPECT_EQ(logger->level(), spdlog::level::debug);
	EXPECT_EQ(log::get("test.level.late")->level(), spdlog::level::debug);

	log::init(spdlog::level::warn);
	EXPECT_EQ(logger->level(), spdlog::level::warn);
	log::init(spdlog::level::info);
}
