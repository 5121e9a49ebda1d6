#ifndef RANGEFETCH_SHARED_CHANNEL_HPP_
#define RANGEFETCH_SHARED_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"

namespace rangefetch {
namespace utils {

/**
 * @brief Multi-producer/multi-consumer FIFO shared between threads.
 *
 * Copies are handles to the same queue, so each participant keeps its own
 * copy. Items come out in the order they went in, across all producers and
 * all consumers taken together.
 *
 * close() drops whatever is still queued and wakes every blocked receiver;
 * from then on every operation throws ChannelError.
 */
template <typename T>
class SharedChannel {
 public:
  explicit SharedChannel(const std::string& name)
      : state_(std::make_shared<State>(name)) {}

  void send(T item) {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->closed) throw closedError("send");
      state_->items.push_back(std::move(item));
    }
    state_->itemsCv.notify_one();
  }

  // Blocks until an item is available.
  T recv() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->itemsCv.wait(
        lock, [this]() { return state_->closed || !state_->items.empty(); });
    if (state_->closed) throw closedError("recv");
    return popFront();
  }

  // Empty optional when nothing is queued.
  std::optional<T> tryRecv() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->closed) throw closedError("try_recv");
    if (state_->items.empty()) return std::nullopt;
    return popFront();
  }

  // Empty optional when nothing arrived within the timeout.
  template <typename Rep, typename Period>
  std::optional<T> recvFor(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    bool ready = state_->itemsCv.wait_for(lock, timeout, [this]() {
      return state_->closed || !state_->items.empty();
    });
    if (state_->closed) throw closedError("recv_for");
    if (!ready) return std::nullopt;
    return popFront();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->closed = true;
      state_->items.clear();
    }
    state_->itemsCv.notify_all();
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->closed;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->items.size();
  }

  const std::string& name() const { return state_->name; }

 private:
  struct State {
    explicit State(const std::string& channelName) : name(channelName) {}

    const std::string name;
    mutable std::mutex mutex;
    std::condition_variable itemsCv;
    std::deque<T> items;
    bool closed = false;
  };

  // Caller holds the mutex and has checked the queue is not empty.
  T popFront() {
    T item = std::move(state_->items.front());
    state_->items.pop_front();
    return item;
  }

  ChannelError closedError(const char* op) const {
    return ChannelError("shared channel " + state_->name + " closed (" + op +
                        ")");
  }

  std::shared_ptr<State> state_;
};

}  // namespace utils
}  // namespace rangefetch

#endif  // RANGEFETCH_SHARED_CHANNEL_HPP_
