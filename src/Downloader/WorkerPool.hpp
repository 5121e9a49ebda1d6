#ifndef RANGEFETCH_WORKER_POOL_HPP_
#define RANGEFETCH_WORKER_POOL_HPP_

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "Chunk.hpp"
#include "shared_channel.hpp"

namespace rangefetch {

using TaskChannel = utils::SharedChannel<Task>;
using ResultChannel = utils::SharedChannel<Chunk>;

/**
 * @brief Fixed set of threads draining the task channel.
 *
 * Each worker takes one task at a time. A stop signal ends that worker; a
 * chunk is handed to the job and then sent back on the result channel,
 * marked Downloaded if the job returned and Pending if it threw. Workers
 * never retry on their own.
 */
class WorkerPool {
 public:
  // Fetches and persists one chunk; throws on failure.
  using Job = std::function<void(const Chunk&)>;

  WorkerPool(const std::string& name, size_t size);
  // Closes the task channel and joins if join() was never called.
  ~WorkerPool();

  void start(TaskChannel tasks, ResultChannel results, Job job);

  // Joins every worker and logs the ones that ended on an error.
  // Returns how many did.
  size_t join();

  // Workers whose loop is still running.
  size_t activeWorkers() const { return active_.load(); }
  size_t size() const { return size_; }

 private:
  struct WorkerContext {
    size_t workerId = 0;
    size_t chunksProcessed = 0;
    std::exception_ptr error;
  };

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void workerLoop(WorkerContext& context, TaskChannel tasks,
                  ResultChannel results);

  std::string name_;
  size_t size_;
  Job job_;
  std::optional<TaskChannel> tasks_;
  std::vector<std::thread> threads_;
  std::vector<WorkerContext> contexts_;
  std::atomic<size_t> active_;
};

}  // namespace rangefetch

#endif  // RANGEFETCH_WORKER_POOL_HPP_
