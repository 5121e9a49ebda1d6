#ifndef RANGEFETCH_ERRORS_HPP_
#define RANGEFETCH_ERRORS_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rangefetch {

// Raised before any worker starts: no size metadata, probe failure, output
// file that cannot be created.
class PreconditionError : public std::runtime_error {
 public:
  explicit PreconditionError(const std::string& what)
      : std::runtime_error(what) {}
};

// Per-chunk failures. Workers turn these into a failed result, the
// coordinator decides whether the chunk is tried again.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what)
      : std::runtime_error(what) {}
};

class OutputError : public std::runtime_error {
 public:
  explicit OutputError(const std::string& what) : std::runtime_error(what) {}
};

// A staging file that is missing or short at merge time.
class StagingError : public std::runtime_error {
 public:
  explicit StagingError(const std::string& what)
      : std::runtime_error(what) {}
};

class ChannelError : public std::runtime_error {
 public:
  explicit ChannelError(const std::string& what)
      : std::runtime_error(what) {}
};

class ChunkFailedError : public std::runtime_error {
 public:
  ChunkFailedError(size_t chunkId, const std::string& what)
      : std::runtime_error(what), chunkId_(chunkId) {}

  size_t chunkId() const { return chunkId_; }

 private:
  size_t chunkId_;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_ERRORS_HPP_
