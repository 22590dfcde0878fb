#pragma once
#include <signal.h>

#include <chrono>
#include <initializer_list>

// Blocks the given signals in the constructing thread so they are delivered
// synchronously through wait_for() instead of to a handler. Threads created
// afterwards inherit the mask, so construct this before starting any.
class SignalWatcher {
 public:
  explicit SignalWatcher(std::initializer_list<int> signals);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  // Returns the signal number, or 0 if none arrived within `timeout`.
  int wait_for(std::chrono::milliseconds timeout);

 private:
  sigset_t set_;
  sigset_t previous_;
};

const char* signal_name(int sig);
