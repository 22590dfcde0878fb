#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

// Launch configuration. Resolved once and never mutated; a reload builds a new
// instance instead.
struct Config {
  std::string bind_address = "0.0.0.0";
  uint16_t port = 8080;  // 0 binds an ephemeral port
  int threads = 4;

  // Accepted connections allowed to queue or be in service before the
  // acceptor stops accepting.
  int worker_connections = 1000;
  int backlog = 2048;

  std::chrono::milliseconds graceful_timeout{30000};
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds keepalive{2000};  // 0 disables keep-alive

  size_t limit_request_line = 4094;
  size_t limit_request_fields = 100;
  size_t limit_request_field_size = 8190;
  size_t max_body_size = 16 * 1024 * 1024;

  // "host:port", with IPv6 hosts bracketed.
  std::string endpoint() const;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Looks up an environment variable; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

struct CommandLine {
  Config config;
  bool help = false;
};

// Defaults, then PORT from the environment, then command-line flags.
// Throws ConfigError on any invalid value.
CommandLine parse_command_line(int argc, const char* const* argv,
                               const EnvLookup& env);

// Parses "HOST", "HOST:PORT", ":PORT" or "[V6]:PORT" into cfg.
void apply_bind(Config& cfg, const std::string& bind);

uint16_t parse_port(const std::string& s);

const char* usage();
