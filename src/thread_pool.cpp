#include "thread_pool.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

ThreadPool::ThreadPool(std::string name, int threads, size_t queue_cap)
    : name_(std::move(name)), threads_(threads), q_(queue_cap) {
  if (threads_ < 1) {
    throw std::invalid_argument(name_ + ": needs at least one thread");
  }
}

ThreadPool::~ThreadPool() { stop(); }

void ThreadPool::start() {
  if (started_.exchange(true)) return;

  workers_.reserve(static_cast<size_t>(threads_));
  for (int i = 0; i < threads_; i++) {
    workers_.emplace_back([this, i]() { worker_loop(i); });
  }
}

bool ThreadPool::submit(Job job) { return q_.push(std::move(job)); }

size_t ThreadPool::close() { return q_.close(); }

void ThreadPool::join() {
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
}

void ThreadPool::stop() {
  close();
  join();
}

void ThreadPool::worker_loop(int worker_id) {
  while (true) {
    auto job = q_.pop();
    if (!job.has_value()) break;  // closed + empty

    busy_.fetch_add(1);
    try {
      (*job)();
    } catch (const std::exception& e) {
      std::cerr << name_ << " worker " << worker_id
                << ": job failed: " << e.what() << "\n";
    }
    busy_.fetch_sub(1);
  }
}
