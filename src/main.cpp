#include <signal.h>

#include <cstdlib>

#include "default_app.hpp"
#include "signal_watcher.hpp"
#include "supervisor.hpp"

namespace {

const char* env_lookup(const char* name) { return std::getenv(name); }

}  // namespace

int main(int argc, char** argv) {
  // Writes to a closed peer report EPIPE instead of killing the process.
  ::signal(SIGPIPE, SIG_IGN);

  // Before any thread exists, so every thread inherits the blocked mask.
  SignalWatcher signals({SIGTERM, SIGINT, SIGQUIT, SIGHUP});

  return run(argc, argv, env_lookup, signals, make_default_app());
}
