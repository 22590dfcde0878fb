#include "signal_watcher.hpp"

#include <pthread.h>

#include <cerrno>
#include <ctime>
#include <system_error>

SignalWatcher::SignalWatcher(std::initializer_list<int> signals) {
  sigemptyset(&set_);
  for (int sig : signals) sigaddset(&set_, sig);

  int rc = pthread_sigmask(SIG_BLOCK, &set_, &previous_);
  if (rc != 0) {
    throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
  }
}

SignalWatcher::~SignalWatcher() {
  pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

int SignalWatcher::wait_for(std::chrono::milliseconds timeout) {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(secs.count());
  ts.tv_nsec = static_cast<long>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs)
          .count());

  while (true) {
    int sig = sigtimedwait(&set_, nullptr, &ts);
    if (sig >= 0) return sig;
    if (errno == EAGAIN) return 0;
    // EINTR: some other, unblocked signal was handled; the window restarts
    if (errno == EINTR) continue;
    throw std::system_error(errno, std::generic_category(), "sigtimedwait");
  }
}

const char* signal_name(int sig) {
  switch (sig) {
    case SIGTERM:
      return "SIGTERM";
    case SIGINT:
      return "SIGINT";
    case SIGQUIT:
      return "SIGQUIT";
    case SIGHUP:
      return "SIGHUP";
    case SIGUSR1:
      return "SIGUSR1";
    case SIGUSR2:
      return "SIGUSR2";
    default:
      return "signal";
  }
}
