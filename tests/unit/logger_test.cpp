#include <catch2/catch.hpp>

#include <finbot/util/logger.h>

#include "common/test_utils.h"

using namespace finbot;

TEST_CASE("ParseLogLevel accepts names in any case", "[logger]")
{
    REQUIRE(ParseLogLevel("DEBUG") == LogLevel::debug);
    REQUIRE(ParseLogLevel("warning") == LogLevel::warn);
    REQUIRE(ParseLogLevel("Error") == LogLevel::error);
    REQUIRE(ParseLogLevel("verbose") == LogLevel::info);
}

TEST_CASE("Logger writes event-tagged lines at or above its level", "[logger]")
{
    test::TempDir dir;
    const auto path = dir.path() / "finbot.log";

    Logger logger;
    logger.SetFile(path.string());
    logger.SetLevel(LogLevel::info);

    logger.Debug("index.load", "hidden");
    logger.Info("index.save", "saved 3 passages");
    logger.Error("pipeline.generate", "backend down");

    const std::string text = test::ReadFile(path);
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[INFO] [index.save] saved 3 passages") != std::string::npos);
    REQUIRE(text.find("[ERROR] [pipeline.generate] backend down") != std::string::npos);
}
