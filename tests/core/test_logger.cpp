#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "basis_trade/core/logger.hpp"

using namespace basis_trade;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);

        // Close file handles before removing the directory
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
        });
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) const {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config;
    config.destination = LogDestination::FILE;
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(Logger::instance().is_initialized());
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::DEBUG, "Debug");
    Logger::instance().log(LogLevel::INFO, "Info");
    Logger::instance().log(LogLevel::WARNING, "Warning");
    Logger::instance().log(LogLevel::ERR, "Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, MacrosRespectMinLevel) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));
    Logger::instance().set_level(LogLevel::ERR);

    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };
    DEBUG("skipped " << count());
    ERROR("written " << count());

    EXPECT_EQ(evaluated, 1);
    EXPECT_EQ(cout_buffer.str(), "written 1\n");
}

TEST_F(LoggerTest, MessageFormattingIncludesLevelAndComponent) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::register_component("BacktestEngine");
    WARN("Formatted " << 42);

    EXPECT_EQ(cout_buffer.str(), "[WARNING] [BacktestEngine] Formatted 42\n");
}

TEST_F(LoggerTest, ComponentIsPerThread) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));
    Logger::register_component("Main");

    std::thread worker([]() {
        Logger::register_component("Worker");
    });
    worker.join();

    INFO("after worker");
    EXPECT_EQ(cout_buffer.str(), "[Main] after worker\n");
}

TEST_F(LoggerTest, ScopedComponentRestoresPreviousTag) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));
    Logger::register_component("Outer");

    {
        ScopedLogComponent scope("Inner");
        EXPECT_EQ(Logger::current_component(), "Inner");
        WARN("inside");
        {
            ScopedLogComponent nested("Nested");
            WARN("nested");
        }
        WARN("back inside");
    }
    WARN("outside");

    EXPECT_EQ(Logger::current_component(), "Outer");
    EXPECT_EQ(cout_buffer.str(),
              "[Inner] inside\n[Nested] nested\n[Inner] back inside\n[Outer] outside\n");
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 2;
    Logger::instance().initialize(config);

    // "12345678\n" is 9 bytes, the second write crosses the limit
    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationSilent) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "bt_basis";
    config.max_files = 3;

    LoggerConfig restored;
    restored.from_json(config.to_json());

    EXPECT_EQ(restored.min_level, LogLevel::DEBUG);
    EXPECT_EQ(restored.destination, LogDestination::BOTH);
    EXPECT_EQ(restored.filename_prefix, "bt_basis");
    EXPECT_EQ(restored.max_files, 3u);
}

TEST_F(LoggerTest, UnknownLevelNameKeepsFallback) {
    EXPECT_EQ(level_from_string("ERROR", LogLevel::INFO), LogLevel::ERR);
    EXPECT_EQ(level_from_string("verbose", LogLevel::INFO), LogLevel::INFO);

    LoggerConfig config;
    config.from_json({{"min_level", "LOUD"}});
    EXPECT_EQ(config.min_level, LogLevel::INFO);
}
