/**
 * @file test_logger.cpp
 * @brief Tests for StdioLogger line format, enable/disable and file redirection.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "dronet/obs/logger.hpp"

namespace {

std::string temp_log(const char* name) {
  auto p = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove(p);
  return p.string();
}

std::string slurp(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream s;
  s << in.rdbuf();
  return s.str();
}

} // namespace

/**
 * @test Redirect_WritesNodePrefixedLines
 */
TEST(Logger, Redirect_WritesNodePrefixedLines) {
  const auto path = temp_log("dronet_logger_format.log");
  dronet::obs::StdioLogger log;
  ASSERT_TRUE(log.redirect_to_file(path));
  EXPECT_EQ(log.file(), path);

  log.status(3, "Node started as Drone");
  log.error(12, "The current node 12 has no neighbour node 4.");

  EXPECT_EQ(slurp(path),
            "[NODE 3] Node started as Drone\n"
            "[NODE 12] Error: The current node 12 has no neighbour node 4.\n");
  const auto c = log.snapshot();
  EXPECT_EQ(c.status_lines, 1u);
  EXPECT_EQ(c.error_lines, 1u);
  EXPECT_EQ(c.suppressed, 0u);

  log.redirect_to_console();
  EXPECT_TRUE(log.file().empty());
  std::filesystem::remove(path);
}

/**
 * @test Redirect_Appends
 */
TEST(Logger, Redirect_Appends) {
  const auto path = temp_log("dronet_logger_append.log");
  {
    std::ofstream pre(path);
    pre << "existing\n";
  }
  dronet::obs::StdioLogger log;
  ASSERT_TRUE(log.redirect_to_file(path));
  log.status(1, "more");
  EXPECT_EQ(slurp(path), "existing\n[NODE 1] more\n");
  log.redirect_to_console();
  std::filesystem::remove(path);
}

TEST(Logger, Redirect_BadPath_KeepsDestination) {
  dronet::obs::StdioLogger log;
  EXPECT_FALSE(log.redirect_to_file("/nonexistent-dir/for/sure/x.log"));
  EXPECT_TRUE(log.file().empty());
}

/**
 * @test Construct_BadFile_ReportsErrorOnConsole
 * @brief A log file that cannot be opened leaves the console sink in place and is reported.
 */
TEST(Logger, Construct_BadFile_ReportsErrorOnConsole) {
  dronet::obs::StdioLogger log(dronet::obs::LogConfig{.enabled = true, .file = "/nonexistent-dir/for/sure/x.log"});
  EXPECT_TRUE(log.file().empty());
  EXPECT_EQ(log.snapshot().error_lines, 1u);
  EXPECT_EQ(log.snapshot().status_lines, 0u);

  auto made = dronet::obs::make_logger(dronet::obs::LogConfig{.enabled = true, .file = "/nonexistent-dir/y.log"});
  EXPECT_TRUE(made->file().empty());
  EXPECT_EQ(made->snapshot().error_lines, 1u);
}

/**
 * @test Disabled_WritesNothing
 * @brief While disabled, lines are counted as suppressed and never reach the sink.
 */
TEST(Logger, Disabled_WritesNothing) {
  const auto path = temp_log("dronet_logger_disabled.log");
  dronet::obs::StdioLogger log(dronet::obs::LogConfig{.enabled = false, .file = path});
  EXPECT_FALSE(log.enabled());
  log.status(1, "hidden");
  log.error(1, "hidden too");
  EXPECT_EQ(slurp(path), "");
  EXPECT_EQ(log.snapshot().suppressed, 2u);

  log.enable();
  EXPECT_TRUE(log.enabled());
  log.status(1, "visible");
  EXPECT_EQ(slurp(path), "[NODE 1] visible\n");

  log.redirect_to_console();
  std::filesystem::remove(path);
}

TEST(Logger, NullLogger_CountsOnly) {
  auto sink = dronet::obs::null_logger();
  ASSERT_TRUE(sink);
  EXPECT_FALSE(sink->enabled());
  const auto before = sink->snapshot().suppressed;
  sink->status(1, "x");
  sink->error(1, "y");
  EXPECT_EQ(sink->snapshot().suppressed, before + 2);
  EXPECT_EQ(sink.get(), dronet::obs::null_logger().get());
}

TEST(Logger, MakeLogger_FromConfig) {
  const auto path = temp_log("dronet_logger_make.log");
  auto log = dronet::obs::make_logger(dronet::obs::LogConfig{.enabled = true, .file = path});
  ASSERT_TRUE(log);
  EXPECT_EQ(log->file(), path);
  log->status(7, "hello");
  EXPECT_EQ(slurp(path), "[NODE 7] hello\n");
  log->redirect_to_console();
  std::filesystem::remove(path);
}
