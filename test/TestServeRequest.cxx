#include <gtest/gtest.h>

#include "Logger.hxx"
#include "serve_request.hxx"

#include "FitsFixtures.hxx"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace fitsview;
using fitsview::test::TempDir;

class ServeRequestTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::write_multi_hdu_file(dir_ / "multi.fits");
        setenv("SERVER_PROTOCOL", "HTTP/1.1", 1);
        setenv("PATH_INFO", "/fitsview/metadata", 1);
        setenv("QUERY_STRING", "path=multi.fits", 1);
        setenv("FITSVIEW_DATA_ROOT", dir_.path().string().c_str(), 1);
        setenv("FITSVIEW_LOG_LEVEL", "warn", 1);
        unsetenv("FITSVIEW_LOG_FILE");

        // A fresh process logs to standard output until told otherwise
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
                "", std::make_shared<spdlog::sinks::stdout_sink_mt>()));
    }

    void TearDown() override {
        unsetenv("SERVER_PROTOCOL");
        unsetenv("REQUEST_METHOD");
        unsetenv("PATH_INFO");
        unsetenv("QUERY_STRING");
        unsetenv("FITSVIEW_DATA_ROOT");
        unsetenv("FITSVIEW_LOG_LEVEL");
    }

    std::string serve(std::string const& method, int* status = nullptr) {
        setenv("REQUEST_METHOD", method.c_str(), 1);
        ::testing::internal::CaptureStdout();
        int const rc = serve_request(0, nullptr, std::cout);
        std::cout.flush();
        if (status != nullptr) {
            *status = rc;
        }
        return ::testing::internal::GetCapturedStdout();
    }

    TempDir dir_;
};

TEST_F(ServeRequestTest, ServesMetadata) {
    int status = -1;
    std::string out = serve("GET", &status);
    EXPECT_EQ(status, 0);
    EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << out;
    EXPECT_NE(out.find("\"n_extensions\""), std::string::npos);
}

TEST_F(ServeRequestTest, StatusLineComesFirstOnConfigError) {
    setenv("FITSVIEW_LOG_LEVEL", "bogus", 1);
    int status = 0;
    std::string out = serve("GET", &status);
    EXPECT_EQ(status, 1);
    EXPECT_EQ(out.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u) << out;
    EXPECT_NE(out.find("FITSVIEW_LOG_LEVEL"), std::string::npos);
}

TEST_F(ServeRequestTest, OmitsErrorBodyForHead) {
    setenv("FITSVIEW_LOG_LEVEL", "bogus", 1);
    std::string out = serve("HEAD");
    EXPECT_EQ(out.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u) << out;
    ASSERT_GE(out.size(), 4u);
    EXPECT_EQ(out.substr(out.size() - 4), "\r\n\r\n");
    EXPECT_EQ(out.find("FITSVIEW_LOG_LEVEL"), std::string::npos);
}

TEST(LoggerTest, BootstrapLoggerWritesToStandardError) {
    logger::init_bootstrap_logger();
    auto const& sinks = spdlog::default_logger()->sinks();
    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_sink_mt>(sinks[0]), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), FITSVIEW_LOGGER_TAG);
}
