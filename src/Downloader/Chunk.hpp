#ifndef RANGEFETCH_CHUNK_HPP_
#define RANGEFETCH_CHUNK_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace rangefetch {

enum class ChunkStatus { Pending, Downloaded, Failed };

inline const char* toString(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::Pending:
      return "pending";
    case ChunkStatus::Downloaded:
      return "downloaded";
    case ChunkStatus::Failed:
      return "failed";
  }
  return "unknown";
}

// One inclusive byte range [start, end] of the remote resource. The id is
// also its position in the merged output.
struct Chunk {
  size_t id = 0;
  uint64_t start = 0;
  uint64_t end = 0;
  ChunkStatus status = ChunkStatus::Pending;
  unsigned attempts = 0;

  uint64_t length() const { return end - start + 1; }
};

inline std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
  return os << "chunk{id=" << chunk.id << ", range=" << chunk.start << "-"
            << chunk.end << ", status=" << toString(chunk.status)
            << ", attempts=" << chunk.attempts << "}";
}

// A chunk to fetch, or std::nullopt telling one worker to stop.
using Task = std::optional<Chunk>;

}  // namespace rangefetch

#endif  // RANGEFETCH_CHUNK_HPP_
