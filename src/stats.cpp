#include "stats.hpp"

#include <sstream>

void Stats::on_start() { start_ = std::chrono::steady_clock::now(); }

void Stats::on_accept() { connections_.fetch_add(1); }

void Stats::inc_active() { active_.fetch_add(1); }

void Stats::dec_active() { active_.fetch_sub(1); }

void Stats::inc_requests() { total_requests_.fetch_add(1); }

void Stats::inc_handler_errors() { handler_errors_.fetch_add(1); }

void Stats::inc_protocol_errors() { protocol_errors_.fetch_add(1); }

void Stats::inc_rejected() { rejected_.fetch_add(1); }

std::string Stats::render(int threads) const {
  auto now = std::chrono::steady_clock::now();
  auto up =
      std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();

  std::ostringstream out;

  out << "uptime=" << up << "s";
  out << " threads=" << threads;
  out << " connections=" << connections_.load();
  out << " active=" << active_.load();
  out << " requests=" << total_requests_.load();
  out << " handler_errors=" << handler_errors_.load();
  out << " protocol_errors=" << protocol_errors_.load();
  out << " rejected=" << rejected_.load();

  return out.str();
}
