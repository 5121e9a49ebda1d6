#ifndef RANGEFETCH_CHUNK_PLANNER_HPP_
#define RANGEFETCH_CHUNK_PLANNER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "Chunk.hpp"

namespace rangefetch {

class PartitionPolicy {
 public:
  enum class Kind { WorkerCount, ChunkSize };

  // Split into as many chunks as there are workers.
  static PartitionPolicy byWorkerCount(uint64_t workers) {
    return PartitionPolicy(Kind::WorkerCount, workers);
  }
  // Split into fixed-size chunks, the last one taking the remainder.
  static PartitionPolicy byChunkSize(uint64_t bytes) {
    return PartitionPolicy(Kind::ChunkSize, bytes);
  }

  Kind kind() const { return kind_; }
  uint64_t value() const { return value_; }
  std::string describe() const;

 private:
  PartitionPolicy(Kind kind, uint64_t value) : kind_(kind), value_(value) {}

  Kind kind_;
  uint64_t value_;
};

/**
 * @brief Cuts [0, totalSize) into consecutive Pending chunks with ids 0..n-1.
 *
 * Chunks tile the resource exactly: chunk[i].end + 1 == chunk[i+1].start and
 * the last chunk ends at totalSize - 1. A zero-sized resource has no chunks.
 * Throws std::invalid_argument for a zero worker count or chunk size.
 */
std::vector<Chunk> planChunks(uint64_t totalSize,
                              const PartitionPolicy& policy);

}  // namespace rangefetch

#endif  // RANGEFETCH_CHUNK_PLANNER_HPP_
