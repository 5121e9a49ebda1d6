#ifndef RANGEFETCH_TEST_HELPERS_HPP_
#define RANGEFETCH_TEST_HELPERS_HPP_

#include <stdlib.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

#include "Transport.hpp"
#include "errors.hpp"

namespace rangefetch {
namespace test {

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir {
 public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "rangefetch-XXXXXX").string();
    if (mkdtemp(&pattern[0]) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = pattern;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const { return path_; }
  std::string file(const std::string& name) const {
    return (path_ / name).string();
  }

  size_t countFilesContaining(const std::string& needle) const {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(path_)) {
      if (entry.path().filename().string().find(needle) != std::string::npos)
        ++count;
    }
    return count;
  }

 private:
  std::filesystem::path path_;
};

inline std::string makeBody(size_t size) {
  std::string body(size, '\0');
  for (size_t i = 0; i < size; ++i) {
    body[i] = static_cast<char>((i * 31 + i / 251) & 0xff);
  }
  return body;
}

inline std::string readFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(ifs),
                     std::istreambuf_iterator<char>());
}

/**
 * In-memory resource. Ranges can be told to fail a number of times, and
 * every fetch can sleep a random few milliseconds so chunks finish in a
 * shuffled order.
 */
class FakeTransport : public Transport {
 public:
  explicit FakeTransport(std::string body) : body_(std::move(body)) {}

  void failRange(uint64_t start, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[start] = times;
  }
  // Throws a value that is not a std::exception.
  void throwNonStandard(uint64_t start, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    nonStandard_[start] = times;
  }
  // Returns only the first tenth of the range.
  void truncateRange(uint64_t start, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    truncations_[start] = times;
  }
  // Called on the worker thread at the start of every fetch.
  void onFetch(std::function<void(uint64_t)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
  }
  void dropContentLength() { contentLengthMissing_ = true; }
  void shuffleCompletion(unsigned seed, int maxDelayMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    rng_.seed(seed);
    maxDelayMs_ = maxDelayMs;
  }

  uint64_t fetchContentLength() override {
    if (contentLengthMissing_) {
      throw PreconditionError("content-length header not found");
    }
    return body_.size();
  }

  std::string fetchRange(uint64_t start, uint64_t end) override {
    int delayMs = 0;
    bool fail = false;
    bool foreign = false;
    bool truncate = false;
    std::function<void(uint64_t)> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_[start];
      ++totalCalls_;
      if (maxDelayMs_ > 0) {
        delayMs = std::uniform_int_distribution<int>(0, maxDelayMs_)(rng_);
      }
      auto it = failures_.find(start);
      if (it != failures_.end() && it->second > 0) {
        --it->second;
        fail = true;
      }
      foreign = takeOne(nonStandard_, start);
      truncate = takeOne(truncations_, start);
      hook = hook_;
    }
    if (hook) hook(start);
    if (delayMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
    if (fail) {
      throw TransportError("simulated failure at " + std::to_string(start));
    }
    if (foreign) throw 42;
    if (end >= body_.size() || start > end) {
      throw TransportError("range out of bounds");
    }
    size_t length = static_cast<size_t>(end - start + 1);
    if (truncate) length /= 10;
    return body_.substr(static_cast<size_t>(start), length);
  }

  int callsFor(uint64_t start) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(start);
    return it == calls_.end() ? 0 : it->second;
  }
  int totalCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalCalls_;
  }

 private:
  static bool takeOne(std::map<uint64_t, int>& counts, uint64_t start) {
    auto it = counts.find(start);
    if (it == counts.end() || it->second <= 0) return false;
    --it->second;
    return true;
  }

  const std::string body_;
  bool contentLengthMissing_ = false;
  mutable std::mutex mutex_;
  std::map<uint64_t, int> failures_;
  std::map<uint64_t, int> nonStandard_;
  std::map<uint64_t, int> truncations_;
  std::map<uint64_t, int> calls_;
  std::function<void(uint64_t)> hook_;
  int totalCalls_ = 0;
  std::mt19937 rng_;
  int maxDelayMs_ = 0;
};

}  // namespace test
}  // namespace rangefetch

#endif  // RANGEFETCH_TEST_HELPERS_HPP_
