#include "termbar/common/logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace termbar::common;

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

LoggingConfig fileLogging(const fs::path& path, LogLevel level) {
    LoggingConfig logging{};
    logging.level = level;
    logging.log_file = path.string();
    logging.rotation_size_mb = 1;
    logging.max_files = 1;
    logging.format = LogFormat::TEXT;
    return logging;
}

}

class LoggerTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("termbar_logger_test_" + std::to_string(getpid()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        Logger::instance().shutdown();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

TEST_F(LoggerTest, SilentUntilInitialized) {
    EXPECT_FALSE(Logger::instance().shouldLog(LogLevel::ERROR));
    ComponentLog("Bar").error("not written | n={}", 1);
}

TEST_F(LoggerTest, ComponentLinesCarryTag) {
    fs::path path = dir / "termbar.log";
    Logger::instance().initialize(LogMode::FILE_ONLY, fileLogging(path, LogLevel::DEBUG));

    ComponentLog("Bar").debug("Started | desc={} | total={}", "copy", 10);
    ComponentLog("Monitor").warn("Refresh failed, stopping");
    Logger::instance().flush();

    std::string contents = readFile(path);
    EXPECT_NE(contents.find("[Bar] Started | desc=copy | total=10"), std::string::npos);
    EXPECT_NE(contents.find("[Monitor] Refresh failed, stopping"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersComponentLines) {
    fs::path path = dir / "filtered.log";
    Logger::instance().initialize(LogMode::FILE_ONLY, fileLogging(path, LogLevel::WARN));

    EXPECT_TRUE(Logger::instance().shouldLog(LogLevel::ERROR));
    EXPECT_FALSE(Logger::instance().shouldLog(LogLevel::DEBUG));

    ComponentLog("Output").debug("hidden");
    ComponentLog("Output").warn("Frame write failed | stream={}", "stderr");
    Logger::instance().flush();

    std::string contents = readFile(path);
    EXPECT_EQ(contents.find("hidden"), std::string::npos);
    EXPECT_NE(contents.find("[Output] Frame write failed | stream=stderr"), std::string::npos);
}
