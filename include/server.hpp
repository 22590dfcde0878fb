#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include "app.hpp"
#include "config.hpp"
#include "protocol.hpp"
#include "stats.hpp"
#include "thread_pool.hpp"

// INIT -> BINDING -> RUNNING -> DRAINING -> STOPPED, or BINDING -> FAILED.
enum class ServerState { Init, Binding, Running, Draining, Stopped, Failed };

const char* to_string(ServerState s);

// The listening socket could not be created, bound or put into listen mode.
class BindError : public std::system_error {
 public:
  BindError(int err, const std::string& what)
      : std::system_error(err, std::generic_category(), what) {}
};

// Serves one Application over HTTP/1.1 from a fixed pool of worker threads.
//
// One acceptor thread owns the listening socket and hands accepted
// connections to the pool. shutdown() stops the acceptor, lets requests that
// are already being handled finish within the grace period, and cancels
// whatever is left after it.
class Server {
 public:
  Server(Config config, Application app);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Binds and starts serving; returns once RUNNING. Throws BindError, or
  // whatever starting the workers threw; the server is FAILED either way.
  void start();

  // Drains and stops. Returns false if the grace period ran out and
  // outstanding connections had to be cancelled. Safe to call more than
  // once and from several threads; later calls wait for the first to finish
  // and return its result.
  //
  // Never waits much past the grace period: workers still inside the
  // application after cancellation are left running (see workers_stranded())
  // and joined by the destructor.
  bool shutdown(const std::string& reason);

  // Ends the grace period of a current or future shutdown immediately.
  void cancel_inflight();

  // Applies a new configuration without dropping accepted connections.
  // Returns false if the server is not running or the new address could not
  // be bound (the old configuration then stays in effect).
  //
  // A changed thread count starts a new pool and retires the old one, which
  // still finishes the connections it holds. Until it has, more than
  // `threads` requests can be in handling at once.
  bool reload(const Config& next);

  // Blocks until STOPPED or FAILED.
  void wait();

  ServerState state() const;

  // True if shutdown() returned while workers were still inside the
  // application. Destroying the server then blocks until they return.
  bool workers_stranded() const;
  uint16_t port() const { return port_.load(); }
  std::shared_ptr<const Config> config() const;
  const Stats& stats() const { return stats_; }

 private:
  void set_state_locked(ServerState s);
  void wake();

  // acceptor thread
  void accept_loop();
  void accept_pending();
  void apply_reload();
  void dispatch(int fd, const std::string& addr, uint16_t port);
  std::unique_ptr<ThreadPool> make_pool(const Config& cfg);
  void join_workers();

  // worker threads
  void serve_connection(int fd, const std::string& addr, uint16_t port,
                        const std::shared_ptr<const Config>& cfg);
  bool serve_request(int fd, RequestReader& reader, const std::string& addr,
                     uint16_t port, const Config& cfg);
  HttpResponse invoke_app(const HttpRequest& req);
  bool begin_request(int fd, bool first);
  bool end_request(int fd);
  void close_unit(int fd);

  const Application app_;

  mutable std::mutex config_mu_;
  std::shared_ptr<const Config> config_;

  mutable std::mutex lifecycle_mu_;
  std::condition_variable lifecycle_cv_;
  ServerState state_ = ServerState::Init;
  bool shutdown_started_ = false;
  bool drained_ = true;
  bool stranded_ = false;

  std::mutex reload_mu_;  // one reload() at a time
  std::shared_ptr<const Config> pending_reload_;
  bool reload_done_ = false;
  bool reload_ok_ = false;

  // Owned by the acceptor thread while it runs.
  int listen_fd_ = -1;
  int wake_fd_ = -1;
  std::atomic<uint16_t> port_{0};
  std::thread acceptor_;

  std::mutex pools_mu_;  // guards swapping pool_ during a reload
  std::unique_ptr<ThreadPool> pool_;
  std::vector<std::unique_ptr<ThreadPool>> retired_pools_;
  int pool_generation_ = 0;

  // Every accepted connection from accept until close, keyed by fd.
  struct Unit {
    bool busy = false;
  };
  std::mutex units_mu_;
  std::condition_variable units_cv_;
  std::unordered_map<int, Unit> units_;
  std::atomic<bool> draining_{false};
  bool cancelled_ = false;
  bool force_cancel_ = false;

  Stats stats_;
};
