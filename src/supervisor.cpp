#include "supervisor.hpp"

#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

int supervise(Server& server, SignalWatcher& signals,
              const ConfigSource& reload_source) {
  std::thread drainer;
  while (server.state() != ServerState::Stopped) {
    int sig = signals.wait_for(std::chrono::milliseconds(250));
    if (sig == 0) continue;

    if (sig == SIGHUP) {
      if (drainer.joinable()) continue;  // already stopping
      std::cerr << "Received SIGHUP, reloading configuration\n";
      try {
        if (!server.reload(reload_source())) {
          std::cerr << "Reload not applied\n";
        }
      } catch (const ConfigError& e) {
        std::cerr << "Reload skipped: " << e.what() << "\n";
      }
      continue;
    }

    if (!drainer.joinable()) {
      std::cerr << "Received " << signal_name(sig) << ", shutting down\n";
      std::string reason = signal_name(sig);
      drainer = std::thread([&server, reason] { server.shutdown(reason); });
      if (sig == SIGQUIT) server.cancel_inflight();
    } else {
      std::cerr << "Received " << signal_name(sig)
                << " while draining, cancelling in-flight requests\n";
      server.cancel_inflight();
    }
  }

  if (drainer.joinable()) drainer.join();
  return 0;
}

int run(int argc, const char* const* argv, const EnvLookup& env,
        SignalWatcher& signals, const Application& app) {
  CommandLine cli;
  try {
    cli = parse_command_line(argc, argv, env);
  } catch (const ConfigError& e) {
    std::cerr << "apphost: " << e.what() << "\n\n" << usage();
    return 2;
  }

  if (cli.help) {
    std::cout << usage();
    return 0;
  }

  Server server(cli.config, app);
  try {
    server.start();
  } catch (const BindError& e) {
    std::cerr << "apphost: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "apphost: " << e.what() << "\n";
    return 1;
  }

  int code = supervise(server, signals, [argc, argv, &env] {
    return parse_command_line(argc, argv, env).config;
  });

  if (server.workers_stranded()) {
    // ~Server would wait for the application to return
    std::cerr << "apphost: exiting with requests still in the application\n";
    std::cout.flush();
    std::_Exit(code);
  }
  return code;
}
