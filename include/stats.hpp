#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

class Stats {
 public:
  void on_start();
  void on_accept();
  void inc_active();
  void dec_active();
  void inc_requests();
  void inc_handler_errors();
  void inc_protocol_errors();
  void inc_rejected();

  int active() const { return active_.load(); }
  uint64_t connections() const { return connections_.load(); }
  uint64_t requests() const { return total_requests_.load(); }
  uint64_t handler_errors() const { return handler_errors_.load(); }
  uint64_t protocol_errors() const { return protocol_errors_.load(); }
  uint64_t rejected() const { return rejected_.load(); }

  // One line, "key=value" pairs.
  std::string render(int threads) const;

 private:
  std::chrono::steady_clock::time_point start_;
  std::atomic<int> active_{0};
  std::atomic<uint64_t> connections_{0};
  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> handler_errors_{0};
  std::atomic<uint64_t> protocol_errors_{0};
  std::atomic<uint64_t> rejected_{0};
};
