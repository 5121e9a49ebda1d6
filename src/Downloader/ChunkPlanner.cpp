#include "ChunkPlanner.hpp"

#include <algorithm>
#include <stdexcept>

namespace rangefetch {

std::string PartitionPolicy::describe() const {
  if (kind_ == Kind::WorkerCount) {
    return "worker count " + std::to_string(value_);
  }
  return "chunk size " + std::to_string(value_) + " bytes";
}

std::vector<Chunk> planChunks(uint64_t totalSize,
                              const PartitionPolicy& policy) {
  if (policy.value() == 0) {
    throw std::invalid_argument("partition policy needs a non-zero " +
                                policy.describe());
  }
  std::vector<Chunk> chunks;
  if (totalSize == 0) return chunks;

  uint64_t count = 0;
  uint64_t chunkSize = 0;
  if (policy.kind() == PartitionPolicy::Kind::WorkerCount) {
    // No empty ranges when there are more workers than bytes.
    count = std::min(policy.value(), totalSize);
    chunkSize = totalSize / count;
  } else {
    chunkSize = std::min(policy.value(), totalSize);
    count = totalSize / chunkSize;
  }

  chunks.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    Chunk chunk;
    chunk.id = static_cast<size_t>(i);
    chunk.start = i * chunkSize;
    chunk.end =
        (i == count - 1) ? (totalSize - 1) : (chunk.start + chunkSize - 1);
    chunks.push_back(chunk);
  }
  return chunks;
}

}  // namespace rangefetch
