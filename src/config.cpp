#include "config.hpp"

#include <cctype>
#include <string>

namespace {

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

int parse_int(const std::string& what, const std::string& s, int lo, int hi) {
  // stoi would accept "12abc" and " 12"
  if (!all_digits(s) || s.size() > 9) {
    throw ConfigError("invalid " + what + ": '" + s + "'");
  }
  int v = std::stoi(s);
  if (v < lo || v > hi) {
    throw ConfigError(what + " out of range [" + std::to_string(lo) + ", " +
                      std::to_string(hi) + "]: " + s);
  }
  return v;
}

}  // namespace

std::string Config::endpoint() const {
  if (bind_address.find(':') != std::string::npos) {
    return "[" + bind_address + "]:" + std::to_string(port);
  }
  return bind_address + ":" + std::to_string(port);
}

uint16_t parse_port(const std::string& s) {
  return static_cast<uint16_t>(parse_int("port", s, 1, 65535));
}

void apply_bind(Config& cfg, const std::string& bind) {
  if (bind.empty()) throw ConfigError("empty bind address");

  std::string host;
  std::string port;

  if (bind.front() == '[') {
    auto close = bind.find(']');
    if (close == std::string::npos) {
      throw ConfigError("unterminated '[' in bind address: " + bind);
    }
    host = bind.substr(1, close - 1);
    std::string rest = bind.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        throw ConfigError("invalid bind address: " + bind);
      }
      port = rest.substr(1);
      if (port.empty()) throw ConfigError("missing port in: " + bind);
    }
  } else {
    auto colon = bind.rfind(':');
    if (colon == std::string::npos) {
      host = bind;
    } else {
      if (bind.find(':') != colon) {
        throw ConfigError("IPv6 bind addresses must be bracketed: " + bind);
      }
      host = bind.substr(0, colon);
      port = bind.substr(colon + 1);
      if (port.empty()) throw ConfigError("missing port in: " + bind);
    }
  }

  if (!host.empty()) cfg.bind_address = host;
  if (!port.empty()) cfg.port = parse_port(port);
}

CommandLine parse_command_line(int argc, const char* const* argv,
                               const EnvLookup& env) {
  CommandLine out;
  Config& cfg = out.config;

  if (env) {
    const char* port = env("PORT");
    // sh -c "... :$PORT" with PORT unset expands to an empty string
    if (port != nullptr && *port != '\0') cfg.port = parse_port(port);
  }

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto need = [&]() -> std::string {
      if (i + 1 >= argc) throw ConfigError("missing value for " + a);
      return argv[++i];
    };

    if (a == "-b" || a == "--bind")
      apply_bind(cfg, need());
    else if (a == "-p" || a == "--port")
      cfg.port = parse_port(need());
    else if (a == "--threads")
      cfg.threads = parse_int("thread count", need(), 1, 256);
    else if (a == "-h" || a == "--help")
      out.help = true;
    else
      throw ConfigError("unknown option: " + a);
  }

  return out;
}

const char* usage() {
  return "Usage: apphost [-b HOST[:PORT]] [-p PORT] [--threads N]\n"
         "\n"
         "  -b, --bind HOST[:PORT]  address to listen on (default 0.0.0.0)\n"
         "  -p, --port PORT         port to listen on (default $PORT or 8080)\n"
         "      --threads N         worker threads, 1-256 (default 4)\n"
         "  -h, --help              show this help\n"
         "\n"
         "Signals: TERM/INT drain and stop, QUIT stops without waiting,\n"
         "HUP reloads the configuration.\n";
}
