#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"

using namespace gridstore::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    log_dir = std::filesystem::temp_directory_path() /
      ("logger_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    // Parent directories are created by init_logging
    log_file = log_dir / "nested" / "gridstore.log";
    init_logging(log_file.string(), boost::log::trivial::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    std::filesystem::remove_all(log_dir);
  }

  std::string log_content() {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
  }

  bool log_contains(const std::string& text) {
    return log_content().find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, WritesToFile) {
  ASSERT_TRUE(std::filesystem::exists(log_file));
  EXPECT_TRUE(log_contains("Logger: Logging to"));

  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  EXPECT_TRUE(log_contains("[info] Test info message"));
  EXPECT_TRUE(log_contains("[error] Test error message"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    BOOST_LOG_TRIVIAL(info) << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(boost::log::trivial::warning);

  BOOST_LOG_TRIVIAL(debug) << "Should not appear";
  BOOST_LOG_TRIVIAL(warning) << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ReinitializingAppends) {
  BOOST_LOG_TRIVIAL(info) << "Before restart";
  init_logging(log_file.string());
  BOOST_LOG_TRIVIAL(debug) << "Below default level";
  BOOST_LOG_TRIVIAL(info) << "After restart";

  EXPECT_TRUE(log_contains("Before restart"));
  EXPECT_TRUE(log_contains("After restart"));
  EXPECT_FALSE(log_contains("Below default level"));
}

TEST(LogLevelTest, ParsesNames) {
  auto level = parse_log_level("debug");
  ASSERT_TRUE(level.has_value());
  EXPECT_EQ(*level, boost::log::trivial::debug);

  level = parse_log_level("WARNING");
  ASSERT_TRUE(level.has_value());
  EXPECT_EQ(*level, boost::log::trivial::warning);

  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_FALSE(parse_log_level("").has_value());
}
