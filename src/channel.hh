#pragma once

// Message passing between threads.
//
// `Channel` is a blocking multi-producer / single-consumer queue used to feed
// the orchestrator thread. `Mailbox` (see mailbox.hh) goes the other way and
// wakes up the epoll loop instead of blocking.

#include <condition_variable>
#include <deque>
#include <mutex>

#include "optional.hh"

namespace portal {

// Anything that values of type T can be sent to.
template <typename T> struct Sink {
  virtual ~Sink() = default;

  // Returns false if the receiving end has gone away.
  virtual bool Send(T) = 0;
};

template <typename T> struct Channel : Sink<T> {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<T> queue;
  bool closed = false;

  bool Send(T value) override {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (closed) {
        return false;
      }
      queue.push_back(std::move(value));
    }
    cv.notify_one();
    return true;
  }

  // Blocks until a value is available.
  //
  // Once the channel is closed the remaining values are still delivered.
  // After that an empty Optional is returned.
  Optional<T> Receive() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return !queue.empty() || closed; });
    if (queue.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue.front());
    queue.pop_front();
    return value;
  }

  // Non-blocking variant of Receive.
  Optional<T> TryReceive() {
    std::lock_guard<std::mutex> lock(mutex);
    if (queue.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue.front());
    queue.pop_front();
    return value;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      closed = true;
    }
    cv.notify_all();
  }
};

} // namespace portal
