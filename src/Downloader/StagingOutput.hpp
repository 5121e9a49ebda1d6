#ifndef RANGEFETCH_STAGING_OUTPUT_HPP_
#define RANGEFETCH_STAGING_OUTPUT_HPP_

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "Chunk.hpp"

namespace rangefetch {

/**
 * @brief Output file assembled from one staging file per chunk.
 *
 * Workers write `<destination>.part<id>` files, which never overlap, so no
 * locking is needed on that side. The coordinator alone appends them to the
 * destination in id order and removes them.
 */
class StagingOutput {
 public:
  explicit StagingOutput(const std::string& destination);
  ~StagingOutput();

  // Creates or truncates the destination. Throws PreconditionError.
  void open();

  // Worker side. Replaces any staging file left by an earlier attempt.
  // Throws OutputError.
  void writeChunk(const Chunk& chunk, const std::string& data) const;

  // Coordinator side. Appends the staging file of `chunk` to the
  // destination and deletes it. Throws StagingError when the staging file
  // is missing or does not hold exactly chunk.length() bytes (the chunk can
  // be fetched again), OutputError when the destination write fails.
  void mergeChunk(const Chunk& chunk);

  // Flushes and closes the destination, checking its final size.
  void finalize(uint64_t expectedSize);

  // Removes staging files of the given chunks, ignoring missing ones.
  void discardStaging(const std::vector<Chunk>& chunks) const;

  std::string stagingPath(size_t chunkId) const;
  const std::string& destination() const { return destination_; }
  uint64_t bytesMerged() const { return bytesMerged_; }

 private:
  StagingOutput(const StagingOutput&) = delete;
  StagingOutput& operator=(const StagingOutput&) = delete;

  std::string destination_;
  std::ofstream out_;
  uint64_t bytesMerged_;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_STAGING_OUTPUT_HPP_
