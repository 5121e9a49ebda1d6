#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <system_error>

namespace rangefetch {
namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
LogConfig log_config;
std::string log_file_path;
bool file_sink_ready = false;

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// Strips the directories from __FILE__.
const char* baseName(const char* path) {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec)) {
    return;
  }
  auto size = std::filesystem::file_size(log_file_path, ec);
  if (ec || size < log_config.maxFileSize) return;

  log_file.close();
  for (size_t i = log_config.maxBackupFiles; i > 0; --i) {
    std::string old_name =
        log_file_path + (i == 1 ? "" : ("." + std::to_string(i - 1)));
    std::string new_name = log_file_path + "." + std::to_string(i);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

void openLogFile() {
  file_sink_ready = false;
  if (!log_config.fileEnabled) return;
  std::error_code ec;
  std::filesystem::create_directories(log_config.logDir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory " << log_config.logDir
              << ": " << ec.message() << std::endl;
    return;
  }
  log_file_path =
      (std::filesystem::path(log_config.logDir) / log_config.fileName)
          .string();
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
    return;
  }
  file_sink_ready = true;
}
}  // namespace

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  log_config = config;
  if (log_config.logDir.empty()) log_config.logDir = "logs";
  if (log_config.fileName.empty()) log_config.fileName = "rangefetch.log";
  if (!log_config.maxFileSize) log_config.maxFileSize = 10 * 1024 * 1024;
  openLogFile();
}

void Logger::setConsoleLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_config.consoleLevel = level;
}

LogLevel Logger::levelFromVerbosity(int verbosity) {
  if (verbosity <= 0) return LogLevel::WARN;
  if (verbosity == 1) return LogLevel::INFO;
  return LogLevel::DEBUG;
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : level_(level), oss_() {
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << baseName(file) << ":" << line << " " << func << ": ";
}

Logger::LogStream::~LogStream() {
  oss_ << "\n";
  std::string msg = oss_.str();
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level_ >= log_config.consoleLevel) std::cerr << msg;
    if (file_sink_ready) {
      rotateLogsIfNeeded();
      if (log_file.is_open()) log_file << msg, log_file.flush();
    }
  }
}

}  // namespace utils
}  // namespace rangefetch
