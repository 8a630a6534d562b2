#include "termbar/common/config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace termbar;
using namespace termbar::common;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("termbar_config_test_" + std::to_string(getpid()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
        Config::instance().load((dir / "missing.toml").string());
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path path = dir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    auto& config = Config::instance();
    EXPECT_TRUE(config.load((dir / "missing.toml").string()));
    EXPECT_EQ(config.global().logging.level, LogLevel::WARN);
    EXPECT_DOUBLE_EQ(config.barDefaults().mininterval, 0.1);
    EXPECT_EQ(config.barDefaults().animation, bar::Animation::TQDM);
}

TEST_F(ConfigTest, LoadsBarAndLoggingSections) {
    std::string path = writeFile("termbar.toml", R"(
[bar]
mininterval = 0.5
miniters = 4
ncols = 40
animation = "fira-code"
colour = "bright_green"
unit = "B"
unit_scale = true
unit_divisor = 1024
output = "stdout"
leave = false

[logging]
level = "debug"
format = "json"
max_files = 5
)");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getConfigPath(), path);

    bar::BarOptions options = config.barDefaults();
    EXPECT_DOUBLE_EQ(options.mininterval, 0.5);
    EXPECT_EQ(options.miniters, 4u);
    ASSERT_TRUE(options.ncols.has_value());
    EXPECT_EQ(*options.ncols, 40);
    EXPECT_EQ(options.animation, bar::Animation::FIRA_CODE);
    EXPECT_EQ(options.colour, "bright_green");
    EXPECT_EQ(options.unit, "B");
    EXPECT_TRUE(options.unit_scale);
    EXPECT_EQ(options.unit_divisor, 1024u);
    EXPECT_EQ(options.output, term::Stream::STDOUT);
    EXPECT_FALSE(options.leave);

    EXPECT_EQ(config.global().logging.level, LogLevel::DEBUG);
    EXPECT_EQ(config.global().logging.format, LogFormat::JSON);
    EXPECT_EQ(config.global().logging.max_files, 5u);
}

TEST_F(ConfigTest, InvalidValueRejectsWholeFile) {
    std::string path = writeFile("bad_value.toml", R"(
[bar]
mininterval = 2.0
animation = "sparkles"
)");

    auto& config = Config::instance();
    EXPECT_FALSE(config.load(path));
    EXPECT_DOUBLE_EQ(config.barDefaults().mininterval, 0.1);
}

TEST_F(ConfigTest, InvalidColourRejected) {
    std::string path = writeFile("bad_colour.toml", "[bar]\ncolour = \"#zzzzzz\"\n");
    EXPECT_FALSE(Config::instance().load(path));
    EXPECT_EQ(Config::instance().barDefaults().colour, "default");
}

TEST_F(ConfigTest, FailedReloadKeepsPreviousSettings) {
    std::string good = writeFile("good.toml", "[bar]\nunit = \"rows\"\nmininterval = 0.25\n");
    std::string bad = writeFile("bad.toml", "[bar]\nunit = \"files\"\nncols = -4\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(good));
    EXPECT_FALSE(config.load(bad));

    EXPECT_EQ(config.barDefaults().unit, "rows");
    EXPECT_DOUBLE_EQ(config.barDefaults().mininterval, 0.25);
    EXPECT_EQ(config.getConfigPath(), bad);
}

TEST_F(ConfigTest, MalformedFileRejected) {
    std::string path = writeFile("broken.toml", "[bar\nmininterval = \n");
    EXPECT_FALSE(Config::instance().load(path));
}

TEST_F(ConfigTest, EnvironmentPathSearchedFirst) {
    std::string path = writeFile("env.toml", "[bar]\nunit = \"rows\"\n");
    setenv("TERMBAR_CONFIG", path.c_str(), 1);

    auto& config = Config::instance();
    auto paths = config.getConfigSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), path);

    auto best = config.findBestConfig();
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, path);

    ASSERT_TRUE(config.load());
    EXPECT_EQ(config.barDefaults().unit, "rows");

    unsetenv("TERMBAR_CONFIG");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}
