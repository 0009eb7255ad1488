#include <gtest/gtest.h>
#include <stillhere/logger.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace stillhere {
namespace {

using testing_helpers::LogCapture;

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(level_to_string(Logger::Level::Info), "INFO");
    EXPECT_STREQ(level_to_string(Logger::Level::Warning), "WARNING");

    EXPECT_EQ(level_from_string("DEBUG"), Logger::Level::Debug);
    EXPECT_EQ(level_from_string("warn"), Logger::Level::Warning);
    EXPECT_EQ(level_from_string("off"), Logger::Level::Off);
    EXPECT_FALSE(level_from_string("verbose").has_value());
}

TEST(LoggerTest, FormatsArguments) {
    LogCapture logs;
    STILLHERE_LOG_INFO("device {} fires at {}", "d1", 110);
    EXPECT_TRUE(logs.contains("device d1 fires at 110"));
}

TEST(LoggerTest, FiltersBelowLevel) {
    LogCapture logs;
    Logger::instance().set_level(Logger::Level::Warning);

    STILLHERE_LOG_INFO("hidden");
    STILLHERE_LOG_ERROR("shown");

    EXPECT_FALSE(logs.contains("hidden"));
    EXPECT_TRUE(logs.contains("shown"));
    EXPECT_FALSE(Logger::instance().should_log(Logger::Level::Debug));
}

TEST(LoggerTest, BadFormatStringDoesNotThrow) {
    LogCapture logs;
    EXPECT_NO_THROW(STILLHERE_LOG_INFO("missing {} {}", 1));
    EXPECT_TRUE(logs.contains("[FORMAT ERROR]"));
}

TEST(LoggerTest, FileDestinationAppendsLines) {
    auto path = std::filesystem::temp_directory_path() /
                ("stillhere_log_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".log");

    ASSERT_TRUE(Logger::instance().init_file(path.string()));
    EXPECT_EQ(Logger::instance().destination(), Logger::Destination::File);
    STILLHERE_LOG_WARN("written to {}", "file");
    Logger::instance().init_console();

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("[WARNING] written to file"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(LoggerTest, CaptureEndingWhileAnotherThreadLogs) {
    std::atomic<bool> running{true};
    std::thread writer;
    {
        LogCapture logs;
        writer = std::thread([&running]() {
            while (running) {
                STILLHERE_LOG_DEBUG("background line");
            }
        });
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!logs.contains("background line") && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        EXPECT_TRUE(logs.contains("background line"));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    running = false;
    writer.join();

    EXPECT_EQ(Logger::instance().destination(), Logger::Destination::Console);
}

TEST(LoggerTest, InitFileFailsForUnwritablePath) {
    EXPECT_FALSE(Logger::instance().init_file("/nonexistent-dir/stillhere.log"));
    EXPECT_EQ(Logger::instance().destination(), Logger::Destination::Console);
}

}  // namespace
}  // namespace stillhere
