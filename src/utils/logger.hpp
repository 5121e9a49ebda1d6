#pragma once

#include <cstddef>
#include <sstream>
#include <string>

namespace rangefetch {
namespace utils {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

struct LogConfig {
  std::string logDir;       // log directory, e.g. "logs"
  std::string fileName;     // file name inside logDir
  size_t maxFileSize;       // rotate once the file reaches this many bytes
  size_t maxBackupFiles;    // rotated files kept as <file>.1 .. <file>.N
  LogLevel consoleLevel;    // stderr threshold; the file sink takes everything
  bool fileEnabled;
  LogConfig()
      : logDir("logs"),
        fileName("rangefetch.log"),
        maxFileSize(10 * 1024 * 1024),  // 10 MB
        maxBackupFiles(3),
        consoleLevel(LogLevel::INFO),
        fileEnabled(true) {}
};

class Logger {
 public:
  // Optional. Without it messages go to stderr at INFO and above only.
  static void initialize(const LogConfig& config = LogConfig());

  static void setConsoleLevel(LogLevel level);

  // -v count of the CLI: 0 WARN, 1 INFO, 2+ DEBUG.
  static LogLevel levelFromVerbosity(int verbosity);

  class LogStream {
   public:
    LogStream(LogLevel level, const char* file, const char* function, int line);
    ~LogStream();

    template <typename T>
    LogStream& operator<<(const T& msg) {
      oss_ << msg;
      return *this;
    }

   private:
    LogLevel level_;
    std::ostringstream oss_;
  };

 private:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

}  // namespace utils
}  // namespace rangefetch

// LOG(INFO) << "message";
#define LOG(level)                                                  \
  ::rangefetch::utils::Logger::LogStream(                           \
      ::rangefetch::utils::LogLevel::level, __FILE__, __FUNCTION__, \
      __LINE__)
