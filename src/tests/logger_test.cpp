#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "common/storage_error.hpp"
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace chunkvault::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDir> dir;
    std::filesystem::path log_file;

    void SetUp() override {
        dir = std::make_unique<TempDir>("logger_test");
        log_file = dir->path() / "logs" / "chunkvault.log";

        init_logging(log_file.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
        init_test_logging();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(std::filesystem::exists(log_file));
    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Filtered debug message";
    BOOST_LOG_TRIVIAL(info) << "Filtered info message";
    BOOST_LOG_TRIVIAL(warning) << "Visible warning message";

    EXPECT_FALSE(log_contains("Filtered debug message"));
    EXPECT_FALSE(log_contains("Filtered info message"));
    EXPECT_TRUE(log_contains("Visible warning message"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
    disable_logging();
    BOOST_LOG_TRIVIAL(error) << "Message while disabled";
    enable_logging();
    BOOST_LOG_TRIVIAL(error) << "Message after enabling";

    EXPECT_FALSE(log_contains("Message while disabled"));
    EXPECT_TRUE(log_contains("Message after enabling"));
}

TEST_F(LoggerTest, ReinitializationAppends) {
    BOOST_LOG_TRIVIAL(info) << "Before restart";
    init_logging(log_file.string(), boost::log::trivial::info);
    BOOST_LOG_TRIVIAL(info) << "After restart";

    EXPECT_TRUE(log_contains("Before restart"));
    EXPECT_TRUE(log_contains("After restart"));
}

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 4;
    const int messages_per_thread = 25;
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, messages_per_thread]() {
            for (int j = 0; j < messages_per_thread; ++j) {
                BOOST_LOG_TRIVIAL(info) << "Thread " << i << " message " << j;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < num_threads; ++i) {
        EXPECT_TRUE(log_contains("Thread " + std::to_string(i) + " message " +
                                 std::to_string(messages_per_thread - 1)));
    }
}

TEST(SeverityParsingTest, NamesAreCaseInsensitive) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("DEBUG"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("Info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("verbose"), chunkvault::InvalidConfiguration);
}
