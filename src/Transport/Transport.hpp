#ifndef RANGEFETCH_TRANSPORT_HPP_
#define RANGEFETCH_TRANSPORT_HPP_

#include <cstdint>
#include <string>

namespace rangefetch {

/**
 * @brief Source of the bytes being downloaded.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  // Total size of the resource. Throws PreconditionError when the size is
  // missing or cannot be read.
  virtual uint64_t fetchContentLength() = 0;

  // Exactly the bytes of [start, end] (inclusive). Throws TransportError.
  virtual std::string fetchRange(uint64_t start, uint64_t end) = 0;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_TRANSPORT_HPP_
