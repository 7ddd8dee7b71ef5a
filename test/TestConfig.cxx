#include <gtest/gtest.h>

#include "Config.hxx"
#include "HttpException.hxx"
#include "Logger.hxx"

#include "FitsFixtures.hxx"

#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace fitsview;

TEST(ConfigTest, ParsesLogLevels) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    try {
        parse_log_level("loud");
        FAIL() << "unknown level accepted";
    } catch (HttpException const& e) {
        EXPECT_EQ(e.get_response_code().get_code(), 500);
    }
}

TEST(ConfigTest, ReadsEnvironment) {
    setenv("FITSVIEW_DATA_ROOT", "/srv/fits", 1);
    setenv("FITSVIEW_LOG_LEVEL", "debug", 1);
    setenv("FITSVIEW_LOG_FILE", "/tmp/fitsview.log", 1);
    Config config = Config::from_environment();
    EXPECT_EQ(config.data_root, fs::path("/srv/fits"));
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.log_file, "/tmp/fitsview.log");

    unsetenv("FITSVIEW_LOG_LEVEL");
    unsetenv("FITSVIEW_LOG_FILE");
    config = Config::from_environment();
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_TRUE(config.log_file.empty());
    unsetenv("FITSVIEW_DATA_ROOT");
}

TEST(LoggerTest, WritesToConfiguredFile) {
    test::TempDir dir;
    Config config;
    config.log_level = spdlog::level::debug;
    config.log_file = (dir / "fitsview.log").string();
    logger::init_logger(config);
    spdlog::debug("opened {}", "multi.fits");
    spdlog::trace("not written");
    logger::flush();

    std::ifstream in(config.log_file.c_str());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("[debug] [pid "), std::string::npos);
    EXPECT_NE(contents.str().find("opened multi.fits"), std::string::npos);
    EXPECT_EQ(contents.str().find("not written"), std::string::npos);

    // Route later tests back to standard error
    config.log_file.clear();
    config.log_level = spdlog::level::warn;
    logger::init_logger(config);
}
