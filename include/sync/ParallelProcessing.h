#ifndef PARALLELPROCESSING_H
#define PARALLELPROCESSING_H

#include "sync/MigrationTypes.h"
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <vector>

enum class PopStatus { ITEM, TIMEOUT, CLOSED };

// Bounded hand-off between the reader thread and the writer of one table.
// push() blocks while capacity items are waiting, which is how a slow
// destination throttles the source cursor. Capacity 0 means unbounded.
template <typename T> class ThreadSafeQueue {
private:
  mutable std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable notEmpty;
  std::condition_variable notFull;
  bool closed = false;
  size_t capacity;

public:
  explicit ThreadSafeQueue(size_t maxItems = 0) : capacity(maxItems) {}

  // Returns false if the queue was closed before the item could be added.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mtx);
    notFull.wait(lock, [this] {
      return closed || capacity == 0 || queue.size() < capacity;
    });
    if (closed) {
      return false;
    }
    queue.push(std::move(item));
    notEmpty.notify_one();
    return true;
  }

  // Blocks until an item arrives. Returns false once the queue is closed and
  // drained.
  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    notEmpty.wait(lock, [this] { return !queue.empty() || closed; });
    if (queue.empty()) {
      return false;
    }
    item = std::move(queue.front());
    queue.pop();
    notFull.notify_one();
    return true;
  }

  // Like popBlocking, but gives up after timeout with the queue still open.
  PopStatus popFor(T &item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    if (!notEmpty.wait_for(lock, timeout,
                           [this] { return !queue.empty() || closed; })) {
      return PopStatus::TIMEOUT;
    }
    if (queue.empty()) {
      return PopStatus::CLOSED;
    }
    item = std::move(queue.front());
    queue.pop();
    notFull.notify_one();
    return PopStatus::ITEM;
  }

  // Wakes both sides. A producer blocked in push() gives up, which is how
  // the reader learns that the writer has stopped.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      closed = true;
    }
    notEmpty.notify_all();
    notFull.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
  }
};

namespace ParallelProcessing {
// Unit handed from the reader thread to the writer. Exactly one of: a set of
// rows, the end-of-stream marker, or the exception that stopped the reader.
struct RowChunk {
  std::vector<SourceRow> rows;
  size_t chunkNumber = 0;
  bool isLastChunk = false;
  std::exception_ptr error;
};
} // namespace ParallelProcessing

#endif // PARALLELPROCESSING_H
