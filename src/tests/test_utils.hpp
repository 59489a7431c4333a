#ifndef CHUNKVAULT_TEST_UTILS_HPP
#define CHUNKVAULT_TEST_UTILS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

// Set logging severity level and configure logging
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::core::get()->set_logging_enabled(true);
    boost::log::add_common_attributes();
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<unsigned> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
             "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::unique_ptr<std::stringstream> create_test_stream(const std::string& content) {
    auto ss = std::make_unique<std::stringstream>();
    if (!content.empty()) {
        ss->write(content.c_str(), static_cast<std::streamsize>(content.length()));
        ss->seekg(0);
    }
    return ss;
}

// Deterministic pseudo-random payload
inline std::string make_payload(std::size_t size, unsigned seed = 7) {
    std::string data(size, '\0');
    unsigned state = seed;
    for (std::size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<char>((state >> 16) & 0xFF);
    }
    return data;
}

#endif // CHUNKVAULT_TEST_UTILS_HPP
