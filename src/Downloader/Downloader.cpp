#include "Downloader.hpp"

#include <stdexcept>
#include <utility>

#include "ChunkPlanner.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "size_parser.hpp"

namespace rangefetch {

Downloader::Downloader(const DownloadOptions& options,
                       std::shared_ptr<Transport> transport)
    : options_(options),
      transport_(std::move(transport)),
      tasks_("task"),
      results_("result"),
      expectedId_(0),
      okCount_(0),
      retries_(0),
      started_(false) {
  if (!transport_) {
    throw std::invalid_argument("Downloader needs a transport");
  }
}

Downloader::~Downloader() {}

DownloadReport Downloader::run() {
  if (started_) {
    throw std::logic_error("Downloader::run called twice");
  }
  started_ = true;
  auto startTime = std::chrono::steady_clock::now();

  options_.validate();
  const size_t workers = options_.resolvedWorkers();
  LOG(INFO) << "Starting download from " << options_.url << " to "
            << options_.outputPath << " with " << workers << " workers.";

  // Everything that can fail before the workers exist.
  const uint64_t fileSize = transport_->fetchContentLength();
  LOG(INFO) << "Remote file size: " << fileSize << " ("
            << utils::formatByteSize(fileSize) << ")";

  const PartitionPolicy policy = options_.partition();
  chunks_ = planChunks(fileSize, policy);
  LOG(INFO) << "Planned " << chunks_.size() << " chunks by "
            << policy.describe();

  output_ = std::make_unique<StagingOutput>(options_.outputPath);
  output_->open();

  WorkerPool pool("download", workers);
  pool.start(tasks_, results_,
             [this](const Chunk& chunk) { downloadChunk(chunk); });

  try {
    for (auto& chunk : chunks_) dispatch(chunk);

    while (true) {
      receiveUntilDownloaded(pool);
      // Final pass over whatever the per-result merges left behind.
      mergeReady();
      if (okCount_ == chunks_.size()) break;
    }
    if (expectedId_ != chunks_.size()) {
      throw std::logic_error("merge stopped at chunk " +
                             std::to_string(expectedId_) + " of " +
                             std::to_string(chunks_.size()));
    }

    // Queued behind every dispatched chunk, so no worker stops early.
    for (size_t i = 0; i < pool.size(); ++i) tasks_.send(std::nullopt);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Download aborted: " << e.what();
    tasks_.close();
    size_t failedWorkers = pool.join();
    if (failedWorkers > 0) {
      LOG(WARN) << failedWorkers << " workers ended with errors";
    }
    output_->discardStaging(chunks_);
    throw;
  }

  DownloadReport report;
  report.workerErrors = pool.join();
  output_->finalize(fileSize);

  report.totalSize = fileSize;
  report.chunkCount = chunks_.size();
  report.workers = workers;
  report.retries = retries_;
  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - startTime);
  LOG(INFO) << "All " << chunks_.size() << " chunks downloaded and merged to "
            << options_.outputPath << " (" << retries_ << " retries)";
  return report;
}

void Downloader::cancel() {
  LOG(WARN) << "Cancelling download of " << options_.url;
  tasks_.close();
}

// Runs on worker threads; touches nothing but its own staging file.
void Downloader::downloadChunk(const Chunk& chunk) {
  std::string data = transport_->fetchRange(chunk.start, chunk.end);
  output_->writeChunk(chunk, data);
}

void Downloader::dispatch(Chunk& chunk) {
  chunk.status = ChunkStatus::Pending;
  ++chunk.attempts;
  tasks_.send(chunk);
  LOG(DEBUG) << "Dispatched " << chunk;
}

void Downloader::receiveUntilDownloaded(const WorkerPool& pool) {
  while (okCount_ < chunks_.size()) {
    auto result = results_.recvFor(options_.pollInterval);
    if (!result) {
      if (pool.activeWorkers() == 0) {
        throw ChannelError("all workers stopped with " +
                           std::to_string(chunks_.size() - okCount_) +
                           " chunks outstanding");
      }
      continue;
    }
    handleResult(*result);
    mergeReady();
  }
}

void Downloader::handleResult(const Chunk& result) {
  Chunk& entry = chunks_.at(result.id);
  if (entry.status == ChunkStatus::Downloaded) {
    LOG(WARN) << "Ignoring duplicate result for " << result;
    return;
  }
  if (result.status == ChunkStatus::Downloaded) {
    entry.status = ChunkStatus::Downloaded;
    ++okCount_;
    LOG(INFO) << "Chunk " << entry.id << " downloaded (" << okCount_ << "/"
              << chunks_.size() << ")";
    return;
  }
  requeue(entry, "download failed");
}

void Downloader::requeue(Chunk& chunk, const std::string& reason) {
  if (options_.maxAttempts > 0 && chunk.attempts >= options_.maxAttempts) {
    chunk.status = ChunkStatus::Failed;
    LOG(ERROR) << "Giving up on " << chunk << ": " << reason;
    throw ChunkFailedError(
        chunk.id, "chunk " + std::to_string(chunk.id) + " failed after " +
                      std::to_string(chunk.attempts) + " attempts: " + reason);
  }
  ++retries_;
  LOG(WARN) << "Re-queueing chunk " << chunk.id << " after attempt "
            << chunk.attempts << ": " << reason;
  dispatch(chunk);
}

void Downloader::mergeReady() {
  while (expectedId_ < chunks_.size() &&
         chunks_[expectedId_].status == ChunkStatus::Downloaded) {
    Chunk& chunk = chunks_[expectedId_];
    try {
      output_->mergeChunk(chunk);
    } catch (const StagingError& e) {
      --okCount_;
      requeue(chunk, e.what());
      return;
    }
    LOG(INFO) << "Merged chunk id=" << chunk.id
              << ", size=" << chunk.length();
    ++expectedId_;
  }
}

}  // namespace rangefetch
