#ifndef ECRS_TEST_UTILS_HPP
#define ECRS_TEST_UTILS_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>
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
        boost::log::keywords::format = "[%TimeStamp%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::add_common_attributes();
}

// Deterministic content, byte i is (i * 7 + 3) mod 256
inline std::vector<uint8_t> make_pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 7 + 3) & 0xFF);
    }
    return data;
}

inline std::stringstream make_stream(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    ss.seekg(0);
    return ss;
}

#endif // ECRS_TEST_UTILS_HPP
