#include <gtest/gtest.h>

#include <string>

#include "logger.hpp"
#include "test_helpers.hpp"

namespace rangefetch {
namespace utils {
namespace {

TEST(LoggerTest, VerbosityMapsToConsoleLevel) {
  EXPECT_EQ(Logger::levelFromVerbosity(0), LogLevel::WARN);
  EXPECT_EQ(Logger::levelFromVerbosity(1), LogLevel::INFO);
  EXPECT_EQ(Logger::levelFromVerbosity(2), LogLevel::DEBUG);
  EXPECT_EQ(Logger::levelFromVerbosity(7), LogLevel::DEBUG);
}

TEST(LoggerTest, FileSinkTakesEveryLevel) {
  test::TempDir dir;
  LogConfig config;
  config.logDir = dir.file("logs");
  config.fileName = "test.log";
  config.consoleLevel = LogLevel::ERROR;
  Logger::initialize(config);

  LOG(DEBUG) << "debug line " << 1;
  LOG(WARN) << "warn line";

  std::string contents = test::readFile(dir.file("logs/test.log"));
  EXPECT_NE(contents.find("[DEBUG]"), std::string::npos);
  EXPECT_NE(contents.find("debug line 1"), std::string::npos);
  EXPECT_NE(contents.find("[WARN]"), std::string::npos);
  EXPECT_NE(contents.find("logger_test.cpp"), std::string::npos);

  LogConfig quiet;
  quiet.fileEnabled = false;
  Logger::initialize(quiet);
}

TEST(LoggerTest, RotatesAtSizeLimit) {
  test::TempDir dir;
  LogConfig config;
  config.logDir = dir.file("logs");
  config.fileName = "rotate.log";
  config.maxFileSize = 64;
  config.maxBackupFiles = 2;
  config.consoleLevel = LogLevel::FATAL;
  Logger::initialize(config);

  for (int i = 0; i < 10; ++i) {
    LOG(INFO) << "line " << i << " padded to push the file over its limit";
  }
  EXPECT_TRUE(std::filesystem::exists(dir.file("logs/rotate.log.1")));
  EXPECT_TRUE(std::filesystem::exists(dir.file("logs/rotate.log.2")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("logs/rotate.log.3")));

  LogConfig quiet;
  quiet.fileEnabled = false;
  Logger::initialize(quiet);
}

}  // namespace
}  // namespace utils
}  // namespace rangefetch
