#include "DownloadOptions.hpp"

#include <tbb/info.h>

#include <stdexcept>

namespace rangefetch {

size_t defaultWorkerCount() {
  int concurrency = tbb::info::default_concurrency();
  return concurrency > 0 ? static_cast<size_t>(concurrency) : 8;
}

void DownloadOptions::validate() const {
  if (url.empty()) {
    throw std::invalid_argument("download URL is empty");
  }
  if (outputPath.empty()) {
    throw std::invalid_argument("output path is empty");
  }
  if (chunkSize && *chunkSize == 0) {
    throw std::invalid_argument("chunk size must be greater than zero");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("poll interval must be positive");
  }
}

size_t DownloadOptions::resolvedWorkers() const {
  return numWorkers > 0 ? numWorkers : defaultWorkerCount();
}

PartitionPolicy DownloadOptions::partition() const {
  if (chunkSize) return PartitionPolicy::byChunkSize(*chunkSize);
  return PartitionPolicy::byWorkerCount(resolvedWorkers());
}

}  // namespace rangefetch
