#include "WorkerPool.hpp"

#include <stdexcept>
#include <utility>

#include "logger.hpp"

namespace rangefetch {

WorkerPool::WorkerPool(const std::string& name, size_t size)
    : name_(name), size_(size), active_(0) {}

WorkerPool::~WorkerPool() {
  if (threads_.empty()) return;
  if (tasks_) tasks_->close();
  join();
}

void WorkerPool::start(TaskChannel tasks, ResultChannel results, Job job) {
  if (!threads_.empty()) {
    throw std::logic_error("[WorkerPool] '" + name_ + "' already started");
  }
  job_ = std::move(job);
  tasks_ = tasks;
  contexts_.resize(size_);
  active_ = size_;
  threads_.reserve(size_);
  for (size_t i = 0; i < size_; ++i) {
    contexts_[i].workerId = i;
    threads_.emplace_back(&WorkerPool::workerLoop, this,
                          std::ref(contexts_[i]), tasks, results);
  }
  LOG(INFO) << "[WorkerPool] '" << name_ << "' started " << size_
            << " workers";
}

void WorkerPool::workerLoop(WorkerContext& context, TaskChannel tasks,
                            ResultChannel results) {
  LOG(DEBUG) << "[WorkerPool] worker id=" << context.workerId << " started";
  try {
    while (true) {
      Task task = tasks.recv();
      if (!task) {
        LOG(DEBUG) << "[WorkerPool] worker id=" << context.workerId
                   << " received stop";
        break;
      }
      Chunk chunk = *task;
      LOG(DEBUG) << "[WorkerPool] worker id=" << context.workerId
                 << " received " << chunk;
      try {
        job_(chunk);
        chunk.status = ChunkStatus::Downloaded;
      } catch (const std::exception& e) {
        LOG(ERROR) << "[WorkerPool] worker id=" << context.workerId
                   << " chunk " << chunk.id << " failed: " << e.what();
        chunk.status = ChunkStatus::Pending;
      } catch (...) {
        LOG(ERROR) << "[WorkerPool] worker id=" << context.workerId
                   << " chunk " << chunk.id << " failed: unknown error";
        chunk.status = ChunkStatus::Pending;
      }
      ++context.chunksProcessed;
      results.send(chunk);
    }
  } catch (...) {
    context.error = std::current_exception();
  }
  --active_;
  LOG(INFO) << "[WorkerPool] worker id=" << context.workerId
            << " stopped after " << context.chunksProcessed << " chunks";
}

size_t WorkerPool::join() {
  size_t failed = 0;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  for (const auto& context : contexts_) {
    if (!context.error) continue;
    ++failed;
    try {
      std::rethrow_exception(context.error);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[WorkerPool] worker id=" << context.workerId
                 << " ended with error: " << e.what();
    } catch (...) {
      LOG(ERROR) << "[WorkerPool] worker id=" << context.workerId
                 << " ended with an unknown error";
    }
  }
  threads_.clear();
  contexts_.clear();
  LOG(DEBUG) << "[WorkerPool] '" << name_ << "' joined";
  return failed;
}

}  // namespace rangefetch
