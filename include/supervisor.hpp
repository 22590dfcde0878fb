#pragma once
#include <functional>

#include "app.hpp"
#include "config.hpp"
#include "server.hpp"
#include "signal_watcher.hpp"

// Produces the configuration a SIGHUP reloads to. Throws ConfigError.
using ConfigSource = std::function<Config()>;

// Runs a started server until it has stopped, driven by signals taken from
// `signals`:
//   SIGTERM, SIGINT   graceful shutdown on a helper thread
//   SIGQUIT           shutdown without a grace period
//   a second one      cancels whatever the first left in flight
//   SIGHUP            reload from `reload_source`; ignored while stopping
// Returns the process exit code.
int supervise(Server& server, SignalWatcher& signals,
              const ConfigSource& reload_source);

// The whole process: resolve the configuration, start, supervise.
// Exit codes: 0 after shutdown, 1 if the server could not start, 2 for an
// invalid configuration.
int run(int argc, const char* const* argv, const EnvLookup& env,
        SignalWatcher& signals, const Application& app);
