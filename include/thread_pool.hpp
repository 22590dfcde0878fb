#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "blocking_queue.hpp"

// Fixed-size pool of worker threads fed from a bounded queue.
//
// A job that throws does not take its worker down: the exception is logged
// and the worker moves on to the next job.
class ThreadPool {
 public:
  using Job = std::function<void()>;

  // Throws std::invalid_argument if `threads` is less than one.
  ThreadPool(std::string name, int threads, size_t queue_cap);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void start();

  // Blocks while the queue is full. Returns false once the pool is closed.
  bool submit(Job job);

  // Refuses new jobs. Workers finish everything already queued, then exit.
  // Returns the number of jobs that were still queued.
  size_t close();

  // Waits for all workers to exit. Call after close().
  void join();

  // close() + join().
  void stop();

  int threads() const { return threads_; }
  size_t pending() const { return q_.size(); }
  int busy() const { return busy_.load(); }
  const std::string& name() const { return name_; }

 private:
  void worker_loop(int worker_id);

  const std::string name_;
  const int threads_;
  BlockingQueue<Job> q_;
  std::vector<std::thread> workers_;
  std::atomic<bool> started_{false};
  std::atomic<int> busy_{0};
};
