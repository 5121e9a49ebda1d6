#ifndef RANGEFETCH_CURL_TRANSPORT_HPP_
#define RANGEFETCH_CURL_TRANSPORT_HPP_

#include <cstdint>
#include <string>

#include "Transport.hpp"

namespace rangefetch {

// curl_global_init / curl_global_cleanup for the lifetime of main().
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

 private:
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct CurlTransportOptions {
  std::string url;
  long connectTimeoutSec = 30;
  // A transfer slower than lowSpeedLimit bytes/s for lowSpeedTimeSec
  // seconds is aborted, so a stalled range fails instead of hanging.
  long lowSpeedLimit = 1024;
  long lowSpeedTimeSec = 30;
  std::string userAgent = "rangefetch/1.0";
};

// Throws std::invalid_argument unless url is an absolute http(s) URL.
void validateUrl(const std::string& url);

/**
 * @brief Transport over libcurl easy handles.
 *
 * The size probe is a HEAD request; ranges are plain GETs with a Range
 * header. Every call uses its own easy handle so workers share no state.
 * Redirects are not followed.
 */
class CurlTransport : public Transport {
 public:
  // Throws std::invalid_argument on a negative timeout or speed limit.
  explicit CurlTransport(const CurlTransportOptions& options);

  uint64_t fetchContentLength() override;
  std::string fetchRange(uint64_t start, uint64_t end) override;

 private:
  CurlTransportOptions options_;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_CURL_TRANSPORT_HPP_
