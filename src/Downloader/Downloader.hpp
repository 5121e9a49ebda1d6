#ifndef RANGEFETCH_DOWNLOADER_HPP_
#define RANGEFETCH_DOWNLOADER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Chunk.hpp"
#include "DownloadOptions.hpp"
#include "StagingOutput.hpp"
#include "Transport.hpp"
#include "WorkerPool.hpp"

namespace rangefetch {

struct DownloadReport {
  uint64_t totalSize = 0;
  size_t chunkCount = 0;
  size_t workers = 0;
  size_t retries = 0;       // chunks handed out again after a failure
  size_t workerErrors = 0;  // workers that ended on an error
  std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Downloads one resource in ranges and merges them in order.
 *
 * The downloader owns the chunk table and is its only writer. Workers get
 * copies of chunks through the task channel and report back through the
 * result channel. Every result may unlock a merge: while the next chunk in
 * id order is downloaded, its bytes are appended to the output, so the
 * output grows strictly in id order whatever order ranges complete in.
 *
 * run() throws PreconditionError before any worker starts when the size
 * is unknown or the output cannot be created, ChunkFailedError when a
 * chunk exhausts its attempts, ChannelError when the workers are gone.
 */
class Downloader {
 public:
  Downloader(const DownloadOptions& options,
             std::shared_ptr<Transport> transport);
  ~Downloader();

  DownloadReport run();

  // Callable from any thread. Closes the task channel so every worker
  // exits; a running run() then aborts with ChannelError.
  void cancel();

 private:
  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;

  void downloadChunk(const Chunk& chunk);
  void dispatch(Chunk& chunk);
  void handleResult(const Chunk& result);
  void requeue(Chunk& chunk, const std::string& reason);
  void mergeReady();
  void receiveUntilDownloaded(const WorkerPool& pool);

  DownloadOptions options_;
  std::shared_ptr<Transport> transport_;
  std::unique_ptr<StagingOutput> output_;
  TaskChannel tasks_;
  ResultChannel results_;

  std::vector<Chunk> chunks_;
  size_t expectedId_;
  size_t okCount_;
  size_t retries_;
  bool started_;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_DOWNLOADER_HPP_
