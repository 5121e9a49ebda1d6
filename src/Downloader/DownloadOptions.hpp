#ifndef RANGEFETCH_DOWNLOAD_OPTIONS_HPP_
#define RANGEFETCH_DOWNLOAD_OPTIONS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "ChunkPlanner.hpp"

namespace rangefetch {

// Worker count used when none is configured: the host's parallelism.
size_t defaultWorkerCount();

struct DownloadOptions {
  std::string url;
  std::string outputPath;
  size_t numWorkers = 0;  // 0 = defaultWorkerCount()
  // Set: fixed-size chunks. Unset: one chunk per worker.
  std::optional<uint64_t> chunkSize;
  // Times a chunk is handed to a worker before the download fails.
  // 0 keeps re-queueing forever.
  unsigned maxAttempts = 5;
  // How long the coordinator waits for a result before checking that
  // workers are still alive.
  std::chrono::milliseconds pollInterval{100};

  // Throws std::invalid_argument.
  void validate() const;

  size_t resolvedWorkers() const;
  PartitionPolicy partition() const;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_DOWNLOAD_OPTIONS_HPP_
