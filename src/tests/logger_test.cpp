#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace ecrs::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    log_dir = std::filesystem::temp_directory_path() /
      ("logger_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(log_dir);
    log_file = log_dir / "ecrs.log";
  }

  void TearDown() override {
    // Ensure all logs are written
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();

    if (std::filesystem::exists(log_dir)) {
      std::filesystem::remove_all(log_dir);
    }
  }

  std::string log_contents() {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
  }
};

TEST_F(LoggerTest, WritesMessagesAtOrAboveLevel) {
  init_logging(log_file.string(), severity_level::info);

  BOOST_LOG_TRIVIAL(debug) << "Hidden debug message";
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  const std::string content = log_contents();
  EXPECT_NE(content.find("[info] Test info message"), std::string::npos);
  EXPECT_NE(content.find("[error] Test error message"), std::string::npos);
  EXPECT_EQ(content.find("Hidden debug message"), std::string::npos);
}

TEST_F(LoggerTest, LevelCanBeChanged) {
  init_logging(log_file.string(), severity_level::error);
  BOOST_LOG_TRIVIAL(info) << "Before change";
  set_log_level(severity_level::trace);
  BOOST_LOG_TRIVIAL(trace) << "After change";

  const std::string content = log_contents();
  EXPECT_EQ(content.find("Before change"), std::string::npos);
  EXPECT_NE(content.find("After change"), std::string::npos);
}

TEST_F(LoggerTest, ParsesSeverityNames) {
  EXPECT_EQ(parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(parse_severity("warning"), severity_level::warning);
  EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
  EXPECT_FALSE(parse_severity("loud").has_value());
  EXPECT_FALSE(parse_severity("").has_value());
}
