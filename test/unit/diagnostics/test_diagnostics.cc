#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "pqharness/diagnostics/error_handler.hpp"
#include "pqharness/diagnostics/logger.hpp"
#include "test_utils.hpp"

using namespace pqharness;
using namespace pqharness::diagnostics;
using ::testing::HasSubstr;

/**
 * @brief Logger tests capture output through the callback sink
 */
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& logger = Logger::instance();
    saved_level_ = logger.get_level();
    logger.set_console_output(false);
    logger.set_callback([this](LogLevel level, const std::string& message) {
      levels_.push_back(level);
      messages_.push_back(message);
    });
  }

  void TearDown() override {
    auto& logger = Logger::instance();
    logger.set_callback(nullptr);
    logger.set_console_output(true);
    logger.set_format("{timestamp} [{level}] [{component}] [{operation}] {message}");
    logger.set_level(saved_level_);
    logger.set_enabled(true);
  }

  LogLevel saved_level_{LogLevel::INFO};
  std::vector<LogLevel> levels_;
  std::vector<std::string> messages_;
};

TEST_F(LoggerTest, FormatsPlaceholders) {
  auto& logger = Logger::instance();
  logger.set_level(LogLevel::DEBUG);
  logger.set_format("[{level}] {component}/{operation}: {message}");

  logger.info("background_server", "bind", "listening");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "[INFO] background_server/bind: listening");
}

TEST_F(LoggerTest, FiltersBelowLevel) {
  auto& logger = Logger::instance();
  logger.set_level(LogLevel::WARNING);

  PQHARNESS_LOG_DEBUG("test", "filter", "hidden");
  PQHARNESS_LOG_INFO("test", "filter", "hidden");
  PQHARNESS_LOG_WARNING("test", "filter", "shown");
  PQHARNESS_LOG_ERROR("test", "filter", "shown");

  ASSERT_EQ(levels_.size(), 2u);
  EXPECT_EQ(levels_[0], LogLevel::WARNING);
  EXPECT_EQ(levels_[1], LogLevel::ERROR);
}

TEST_F(LoggerTest, DisabledLoggerIsSilent) {
  auto& logger = Logger::instance();
  logger.set_enabled(false);
  logger.critical("test", "disabled", "nothing");
  EXPECT_TRUE(messages_.empty());
}

TEST_F(LoggerTest, FileSinkReceivesMessages) {
  pqharness::test::TempDir dir;
  std::string path = (dir.path() / "harness.log").string();

  auto& logger = Logger::instance();
  logger.set_level(LogLevel::INFO);
  logger.set_format("{level} {message}");
  logger.set_file_output(path);
  logger.info("test", "file", "written to disk");
  logger.flush();
  logger.set_file_output("");

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_THAT(content.str(), HasSubstr("INFO written to disk"));
}

TEST(LogLevelParseTest, AcceptsNamesCaseInsensitively) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
  EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARNING);
  EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
  EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_FALSE(parse_log_level("").has_value());
}

// ============================================================================
// ERROR HANDLER
// ============================================================================

class ErrorHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& handler = ErrorHandler::instance();
    handler.reset_stats();
    handler.clear_callbacks();
    handler.set_min_error_level(ErrorLevel::INFO);
    Logger::instance().set_console_output(false);
  }

  void TearDown() override {
    ErrorHandler::instance().clear_callbacks();
    Logger::instance().set_console_output(true);
  }
};

TEST_F(ErrorHandlerTest, LeakIsCriticalRelease) {
  std::vector<ErrorInfo> seen;
  ErrorHandler::instance().register_callback([&](const ErrorInfo& info) { seen.push_back(info); });

  error_reporting::report_leak("background_server", "join", "worker abandoned");

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].level, ErrorLevel::CRITICAL);
  EXPECT_EQ(seen[0].category, ErrorCategory::RELEASE);
  EXPECT_THAT(seen[0].get_summary(), HasSubstr("[background_server] [join] worker abandoned"));
  EXPECT_TRUE(ErrorHandler::instance().has_errors("background_server"));
}

TEST_F(ErrorHandlerTest, StatsCountByLevelAndCategory) {
  error_reporting::report_configuration_warning("configuration", "parse", "bad value");
  error_reporting::report_timeout("peer", "read", "timed out");
  error_reporting::report_system_error("background_server", "accept", "refused",
                                       boost::system::errc::make_error_code(boost::system::errc::connection_refused));

  auto stats = ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.total_errors, 3u);
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(ErrorLevel::WARNING)], 1u);
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(ErrorLevel::ERROR)], 2u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::TIMEOUT)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::SYSTEM)], 1u);

  auto recent = ErrorHandler::instance().get_recent_errors(1);
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_TRUE(recent[0].boost_error);
}

TEST_F(ErrorHandlerTest, HarnessFailureCategories) {
  error_reporting::report_framing_error("peer", "receive", "bad length");
  error_reporting::report_connection_error("client", "connect", "refused");
  error_reporting::report_query_error("client", "exec", "fatal");

  auto stats = ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(ErrorLevel::ERROR)], 3u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::FRAMING)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::CONNECTION)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::QUERY)], 1u);
}

TEST_F(ErrorHandlerTest, MinLevelFiltersReports) {
  ErrorHandler::instance().set_min_error_level(ErrorLevel::ERROR);
  error_reporting::report_configuration_warning("configuration", "parse", "ignored");
  EXPECT_EQ(ErrorHandler::instance().get_error_stats().total_errors, 0u);
  ErrorHandler::instance().set_min_error_level(ErrorLevel::INFO);
}

TEST_F(ErrorHandlerTest, ResetClearsHistory) {
  error_reporting::report_release_error("resource_stack", "release", "secondary");
  ASSERT_TRUE(ErrorHandler::instance().has_errors("resource_stack"));
  ErrorHandler::instance().reset_stats();
  EXPECT_FALSE(ErrorHandler::instance().has_errors("resource_stack"));
  EXPECT_EQ(ErrorHandler::instance().get_error_stats().total_errors, 0u);
}
