#include <gflags/gflags.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>

#include "Downloader/Downloader.hpp"
#include "Transport/CurlTransport.hpp"
#include "utils/logger.hpp"
#include "utils/size_parser.hpp"

DEFINE_int32(workers, 0, "Number of download workers (0 for host concurrency)");
DEFINE_string(chunk_size, "",
              "Fixed chunk size, e.g. 10MB, 512KiB, 2.5MiB or plain bytes. "
              "Empty splits the file into one chunk per worker");
DEFINE_int32(max_attempts, 5,
             "Attempts per chunk before the download fails (0 = unlimited)");
DEFINE_int32(poll_interval_ms, 100,
             "How long to wait for a worker result before checking that "
             "workers are alive");
DEFINE_int32(connect_timeout_s, 30, "Connect timeout per request");
DEFINE_int32(low_speed_limit, 1024,
             "Bytes per second below which a transfer counts as stalled");
DEFINE_int32(low_speed_time_s, 30,
             "Seconds a transfer may stay stalled before it is aborted");
DEFINE_int32(verbose, 1, "Console verbosity: 0 warnings, 1 info, 2 debug");
DEFINE_string(log_dir, "logs", "Directory of the log file");
DEFINE_bool(log_to_file, true, "Also write every log line to a file");
DEFINE_uint64(log_max_file_size, 10 * 1024 * 1024,
              "Log file size that triggers rotation");
DEFINE_uint64(log_max_backups, 3, "Rotated log files to keep");

namespace {

bool validateFlags() {
  if (FLAGS_workers < 0) {
    std::cerr << "--workers must not be negative" << std::endl;
    return false;
  }
  if (FLAGS_max_attempts < 0) {
    std::cerr << "--max_attempts must not be negative" << std::endl;
    return false;
  }
  if (FLAGS_connect_timeout_s < 0) {
    std::cerr << "--connect_timeout_s must not be negative" << std::endl;
    return false;
  }
  if (FLAGS_low_speed_limit < 0) {
    std::cerr << "--low_speed_limit must not be negative" << std::endl;
    return false;
  }
  if (FLAGS_low_speed_time_s < 0) {
    std::cerr << "--low_speed_time_s must not be negative" << std::endl;
    return false;
  }
  if (FLAGS_poll_interval_ms <= 0) {
    std::cerr << "--poll_interval_ms must be positive" << std::endl;
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("<url> <output> [flags]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc != 3) {
    std::cerr << "Usage: " << argv[0]
              << " <url> <output> [--workers=N] [--chunk_size=10MB]"
              << std::endl;
    return 1;
  }
  if (!validateFlags()) return 1;

  rangefetch::utils::LogConfig logCfg;
  logCfg.logDir = FLAGS_log_dir;
  logCfg.maxFileSize = FLAGS_log_max_file_size;
  logCfg.maxBackupFiles = FLAGS_log_max_backups;
  logCfg.consoleLevel =
      rangefetch::utils::Logger::levelFromVerbosity(FLAGS_verbose);
  logCfg.fileEnabled = FLAGS_log_to_file;
  rangefetch::utils::Logger::initialize(logCfg);

  rangefetch::DownloadOptions options;
  options.url = argv[1];
  options.outputPath = argv[2];
  options.numWorkers = static_cast<size_t>(FLAGS_workers);
  options.maxAttempts = static_cast<unsigned>(FLAGS_max_attempts);
  options.pollInterval = std::chrono::milliseconds(FLAGS_poll_interval_ms);

  try {
    rangefetch::validateUrl(options.url);
    if (!FLAGS_chunk_size.empty()) {
      options.chunkSize = rangefetch::utils::parseByteSize(FLAGS_chunk_size);
    }

    rangefetch::CurlGlobal curlGlobal;
    rangefetch::CurlTransportOptions transportOptions;
    transportOptions.url = options.url;
    transportOptions.connectTimeoutSec = FLAGS_connect_timeout_s;
    transportOptions.lowSpeedLimit = FLAGS_low_speed_limit;
    transportOptions.lowSpeedTimeSec = FLAGS_low_speed_time_s;

    rangefetch::Downloader downloader(
        options,
        std::make_shared<rangefetch::CurlTransport>(transportOptions));
    rangefetch::DownloadReport report = downloader.run();

    LOG(INFO) << "Downloaded "
              << rangefetch::utils::formatByteSize(report.totalSize) << " in "
              << report.chunkCount << " chunks, elapsed = "
              << report.elapsed.count() / 1000.0 << " s";
    if (report.workerErrors > 0) {
      LOG(WARN) << report.workerErrors
                << " workers ended with errors after the download completed";
    }
  } catch (const std::exception& e) {
    LOG(FATAL) << e.what();
    return 1;
  }

  gflags::ShutDownCommandLineFlags();
  return 0;
}
