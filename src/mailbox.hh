#pragma once

#include <deque>
#include <mutex>

#include "channel.hh"
#include "epoll.hh"
#include "fn.hh"

namespace portal {

// Wakes up the epoll loop of the thread that called `Open`. Any thread may
// call `Wake`.
struct Doorbell : epoll::Listener {
  std::mutex mutex;
  bool open = false;

  ~Doorbell() { Close(); }

  // Creates an eventfd & registers it in the current thread's epoll.
  void Open(Status &);

  // Stops delivery. Values sent afterwards are refused.
  void Close();

  // Returns false if the doorbell is closed.
  bool Ring(Fn<void()> while_locked);

  void NotifyRead(Status &) override;

  // Called on the epoll thread after the doorbell rang at least once.
  virtual void Drain() = 0;
};

// Delivers values from other threads to `handler`, running on the epoll
// thread.
template <typename T> struct Mailbox : Doorbell, Sink<T> {
  Fn<void(T)> handler;
  std::deque<T> queue;
  const char *name;

  Mailbox(const char *name) : name(name) {}

  bool Send(T value) override {
    return Ring([&] { queue.push_back(std::move(value)); });
  }

  void Drain() override {
    std::deque<T> batch;
    {
      std::lock_guard<std::mutex> lock(mutex);
      batch.swap(queue);
    }
    for (auto &value : batch) {
      if (handler) {
        handler(std::move(value));
      }
    }
  }

  const char *Name() const override { return name; }
};

} // namespace portal
