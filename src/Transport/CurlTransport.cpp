#include "CurlTransport.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

#include "errors.hpp"
#include "logger.hpp"

namespace rangefetch {

namespace {

struct EasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct UrlDeleter {
  void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

// Body of a range request; refuses anything past the expected length so a
// server that ignores Range cannot stream the whole resource into memory.
struct RangeBuffer {
  std::string data;
  uint64_t expected = 0;
};

size_t write_range(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* buffer = static_cast<RangeBuffer*>(userdata);
  size_t bytes = size * nmemb;
  if (buffer->data.size() + bytes > buffer->expected) {
    return 0;  // CURLE_WRITE_ERROR
  }
  buffer->data.append(ptr, bytes);
  return bytes;
}

EasyHandle newHandle(const CurlTransportOptions& options) {
  EasyHandle curl(curl_easy_init());
  if (!curl) return curl;
  curl_easy_setopt(curl.get(), CURLOPT_URL, options.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   options.connectTimeoutSec);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options.lowSpeedLimit);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                   options.lowSpeedTimeSec);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.userAgent.c_str());
  return curl;
}

long responseCode(CURL* curl) {
  long code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
  return code;
}

}  // namespace

CurlGlobal::CurlGlobal() {
  CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") +
                             curl_easy_strerror(res));
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

void validateUrl(const std::string& url) {
  std::unique_ptr<CURLU, UrlDeleter> handle(curl_url());
  if (!handle) throw std::runtime_error("curl_url failed");
  if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
    throw std::invalid_argument("malformed URL: " + url);
  }

  char* scheme = nullptr;
  char* host = nullptr;
  curl_url_get(handle.get(), CURLUPART_SCHEME, &scheme, 0);
  curl_url_get(handle.get(), CURLUPART_HOST, &host, 0);
  std::string schemeStr = scheme ? scheme : "";
  bool hasHost = host != nullptr && host[0] != '\0';
  curl_free(scheme);
  curl_free(host);

  if (schemeStr != "http" && schemeStr != "https") {
    throw std::invalid_argument("unsupported URL scheme '" + schemeStr +
                                "' in " + url);
  }
  if (!hasHost) throw std::invalid_argument("URL has no host: " + url);
}

CurlTransport::CurlTransport(const CurlTransportOptions& options)
    : options_(options) {
  if (options_.connectTimeoutSec < 0 || options_.lowSpeedLimit < 0 ||
      options_.lowSpeedTimeSec < 0) {
    throw std::invalid_argument(
        "curl timeouts and speed limits must not be negative");
  }
}

uint64_t CurlTransport::fetchContentLength() {
  EasyHandle curl = newHandle(options_);
  if (!curl) throw PreconditionError("curl_easy_init failed for size probe");
  curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HEADER, 0L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw PreconditionError("size probe of " + options_.url +
                            " failed: " + curl_easy_strerror(res));
  }
  long code = responseCode(curl.get());
  if (code < 200 || code >= 300) {
    throw PreconditionError("size probe of " + options_.url +
                            " returned HTTP " + std::to_string(code));
  }

  curl_off_t length = -1;
  res = curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &length);
  if (res != CURLE_OK || length < 0) {
    throw PreconditionError("content-length missing or unparseable for " +
                            options_.url);
  }
  LOG(DEBUG) << "Probe of " << options_.url << ": HTTP " << code
             << ", content-length " << length;
  return static_cast<uint64_t>(length);
}

std::string CurlTransport::fetchRange(uint64_t start, uint64_t end) {
  EasyHandle curl = newHandle(options_);
  if (!curl) throw TransportError("curl_easy_init failed");

  RangeBuffer buffer;
  buffer.expected = end - start + 1;
  buffer.data.reserve(static_cast<size_t>(buffer.expected));
  std::string range = std::to_string(start) + "-" + std::to_string(end);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_range);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw TransportError("range " + range + " failed: " +
                         curl_easy_strerror(res));
  }
  long code = responseCode(curl.get());
  // A 200 only carries the right bytes when the range is the whole body.
  bool wholeBody = code == 200 && start == 0;
  if (code != 206 && !wholeBody) {
    throw TransportError("range " + range + " returned HTTP " +
                         std::to_string(code));
  }
  if (buffer.data.size() != buffer.expected) {
    throw TransportError("range " + range + " short read: got " +
                         std::to_string(buffer.data.size()) + " of " +
                         std::to_string(buffer.expected) + " bytes");
  }
  return std::move(buffer.data);
}

}  // namespace rangefetch
