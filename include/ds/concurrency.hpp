#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace ds {

// Simple cancellation handle
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
private:
  std::atomic<bool> flag_{false};
};

// Blocking MPMC queue. capacity 0 = unbounded.
template <class T>
class WorkQueue {
public:
  explicit WorkQueue(size_t capacity = 0) : capacity_(capacity) {}

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  // Blocks while full. Returns false once the queue is closed.
  bool push(T item)
  {
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_space_.wait(lk, [&]{ return closed_ || capacity_ == 0 || q_.size() < capacity_; });
      if (closed_) return false;
      q_.push_back(std::move(item));
    }
    cv_items_.notify_one();
    return true;
  }

  // Blocks while empty and open. Empty optional once closed and drained.
  std::optional<T> pop()
  {
    std::optional<T> out;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_items_.wait(lk, [&]{ return closed_ || !q_.empty(); });
      if (q_.empty()) return out;
      out.emplace(std::move(q_.front()));
      q_.pop_front();
    }
    cv_space_.notify_one();
    return out;
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    cv_items_.notify_all();
    cv_space_.notify_all();
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  size_t size() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_items_;
  std::condition_variable cv_space_;
  std::deque<T> q_;
  const size_t capacity_;
  bool closed_{false};
};

using DomainQueue = WorkQueue<std::string>;

// Fixed-size pool of workers draining one DomainQueue.
class WorkerPool {
public:
  using Handler = std::function<void(std::string)>;

  // Starts max(1, threads) workers immediately.
  // `cancel` may be null; when set, workers stop pulling and close the queue.
  WorkerPool(int threads, DomainQueue& queue, Handler handler, Cancellation* cancel = nullptr);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Wait until every worker has exited, then rethrow the first exception a
  // handler let escape (if any). Safe to call more than once.
  void join();

  int size() const;

private:
  struct Impl;
  Impl* impl_;
};

} // namespace ds
