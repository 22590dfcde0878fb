#include "server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

// How long shutdown() waits for cancelled connections to let go of their
// workers before leaving them behind.
constexpr std::chrono::milliseconds kCancelWait{1000};

int open_listener(const Config& cfg) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  std::string port = std::to_string(cfg.port);
  const char* host = cfg.bind_address.empty() ? nullptr : cfg.bind_address.c_str();

  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host, port.c_str(), &hints, &res);
  if (rc != 0) {
    throw BindError(EADDRNOTAVAIL, "resolve " + cfg.endpoint() + " (" +
                                       ::gai_strerror(rc) + ")");
  }

  int fd = -1;
  int last_err = EADDRNOTAVAIL;
  for (addrinfo* p = res; p != nullptr; p = p->ai_next) {
    fd = ::socket(p->ai_family, p->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                  p->ai_protocol);
    if (fd < 0) {
      last_err = errno;
      continue;
    }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) == 0 &&
        ::bind(fd, p->ai_addr, p->ai_addrlen) == 0 &&
        ::listen(fd, cfg.backlog) == 0) {
      break;
    }

    last_err = errno;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);

  if (fd < 0) throw BindError(last_err, "bind " + cfg.endpoint());
  return fd;
}

uint16_t local_port(int fd) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd, (sockaddr*)&ss, &len) < 0) {
    perror("getsockname");
    return 0;
  }
  if (ss.ss_family == AF_INET6) {
    return ntohs(((sockaddr_in6*)&ss)->sin6_port);
  }
  return ntohs(((sockaddr_in*)&ss)->sin_port);
}

void describe_peer(const sockaddr_storage& ss, std::string& addr,
                   uint16_t& port) {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (ss.ss_family == AF_INET6) {
    auto* a = (const sockaddr_in6*)&ss;
    inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    port = ntohs(a->sin6_port);
  } else {
    auto* a = (const sockaddr_in*)&ss;
    inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    port = ntohs(a->sin_port);
  }
  addr = buf;
}

void set_send_timeout(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    perror("setsockopt(SO_SNDTIMEO)");
  }
}

RequestLimits limits_for(const Config& cfg) {
  RequestLimits l;
  l.max_line = cfg.limit_request_line;
  l.max_fields = cfg.limit_request_fields;
  l.max_field_size = cfg.limit_request_field_size;
  l.max_body = cfg.max_body_size;
  return l;
}

}  // namespace

const char* to_string(ServerState s) {
  switch (s) {
    case ServerState::Init:
      return "INIT";
    case ServerState::Binding:
      return "BINDING";
    case ServerState::Running:
      return "RUNNING";
    case ServerState::Draining:
      return "DRAINING";
    case ServerState::Stopped:
      return "STOPPED";
    case ServerState::Failed:
      return "FAILED";
  }
  return "UNKNOWN";
}

Server::Server(Config config, Application app)
    : app_(std::move(app)),
      config_(std::make_shared<const Config>(std::move(config))) {}

Server::~Server() {
  shutdown("server destroyed");
  // workers stranded by a timed-out shutdown still use this object
  join_workers();
  if (wake_fd_ >= 0) ::close(wake_fd_);
}

ServerState Server::state() const {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  return state_;
}

bool Server::workers_stranded() const {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  return stranded_;
}

std::shared_ptr<const Config> Server::config() const {
  std::lock_guard<std::mutex> lk(config_mu_);
  return config_;
}

void Server::set_state_locked(ServerState s) {
  std::cerr << "Server " << to_string(state_) << " -> " << to_string(s)
            << "\n";
  state_ = s;
  lifecycle_cv_.notify_all();
}

void Server::wake() {
  uint64_t one = 1;
  if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
    perror("eventfd write");
  }
}

std::unique_ptr<ThreadPool> Server::make_pool(const Config& cfg) {
  return std::make_unique<ThreadPool>(
      "pool-" + std::to_string(++pool_generation_), cfg.threads,
      static_cast<size_t>(cfg.worker_connections));
}

void Server::start() {
  auto cfg = config();
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state_ != ServerState::Init) {
      throw std::logic_error("Server::start called more than once");
    }
    set_state_locked(ServerState::Binding);
  }

  try {
    listen_fd_ = open_listener(*cfg);
    wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) throw BindError(errno, "eventfd");
  } catch (const BindError& e) {
    if (listen_fd_ >= 0) ::close(listen_fd_);
    listen_fd_ = -1;
    std::cerr << "Failed to start: " << e.what() << "\n";
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    set_state_locked(ServerState::Failed);
    throw;
  }

  port_.store(local_port(listen_fd_));
  stats_.on_start();

  try {
    pool_ = make_pool(*cfg);
    pool_->start();
    acceptor_ = std::thread([this] { accept_loop(); });
  } catch (const std::exception& e) {
    std::cerr << "Failed to start workers: " << e.what() << "\n";
    if (pool_) pool_->stop();
    ::close(listen_fd_);
    listen_fd_ = -1;
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    set_state_locked(ServerState::Failed);
    throw;
  }
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    set_state_locked(ServerState::Running);
  }

  Config shown = *cfg;
  shown.port = port_.load();
  std::cerr << "Listening at http://" << shown.endpoint() << " with "
            << cfg->threads << " threads\n";
}

void Server::accept_loop() {
  while (true) {
    pollfd fds[2]{};
    fds[0].fd = wake_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = listen_fd_;
    fds[1].events = POLLIN;

    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      perror("poll");
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }

    if (fds[0].revents & POLLIN) {
      uint64_t n = 0;
      if (::read(wake_fd_, &n, sizeof(n)) < 0 && errno != EAGAIN) {
        perror("eventfd read");
      }
      if (draining_.load()) break;
      apply_reload();
      continue;
    }

    if (fds[1].revents & POLLIN) accept_pending();
  }
}

void Server::accept_pending() {
  while (!draining_.load()) {
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept4(listen_fd_, (sockaddr*)&peer, &len, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno == EINTR || errno == ECONNABORTED) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return;
      int err = errno;
      perror("accept");
      // out of descriptors or memory: back off instead of spinning
      if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      return;
    }

    std::string addr;
    uint16_t port = 0;
    describe_peer(peer, addr, port);
    dispatch(fd, addr, port);
  }
}

void Server::dispatch(int fd, const std::string& addr, uint16_t port) {
  auto cfg = config();
  set_send_timeout(fd, cfg->timeout);

  {
    std::lock_guard<std::mutex> lk(units_mu_);
    units_.emplace(fd, Unit{});
    // accepted while shutdown() was sweeping idle units
    if (draining_.load()) ::shutdown(fd, SHUT_RD);
  }
  stats_.on_accept();
  stats_.inc_active();

  // Blocks while worker_connections are already queued (back-pressure).
  bool ok = pool_->submit(
      [this, fd, addr, port, cfg]() { serve_connection(fd, addr, port, cfg); });

  if (!ok) {
    stats_.inc_rejected();
    send_str(fd, render_response(error_response(503), false, false));
    close_unit(fd);
  }
}

void Server::apply_reload() {
  std::shared_ptr<const Config> next;
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    next.swap(pending_reload_);
  }
  // shutdown() is about to stop this thread; reload() gives up on its own
  if (!next || draining_.load()) return;

  auto current = config();
  bool ok = true;

  if (next->bind_address != current->bind_address ||
      next->port != current->port) {
    try {
      int fd = open_listener(*next);
      // Take what already queued up on the old socket before closing it.
      accept_pending();
      ::close(listen_fd_);
      listen_fd_ = fd;
      port_.store(local_port(fd));
    } catch (const BindError& e) {
      std::cerr << "Reload failed: " << e.what() << "; still listening at "
                << current->endpoint() << "\n";
      ok = false;
    }
  }

  if (ok) {
    if (next->threads != current->threads ||
        next->worker_connections != current->worker_connections) {
      std::unique_ptr<ThreadPool> fresh;
      try {
        fresh = make_pool(*next);
        fresh->start();
      } catch (const std::exception& e) {
        std::cerr << "Reload failed: " << e.what() << "; keeping "
                  << current->threads << " threads\n";
        if (fresh) fresh->stop();
        fresh.reset();
        ok = false;
      }

      if (fresh) {
        std::unique_lock<std::mutex> lk(pools_mu_);
        if (draining_.load()) {
          // shutdown() already closed pool_ and joins that one, not `fresh`
          lk.unlock();
          fresh->stop();
          ok = false;
        } else {
          size_t queued = pool_->close();
          std::cerr << "Retiring " << pool_->name() << " (" << pool_->busy()
                    << " busy, " << queued << " queued)\n";
          retired_pools_.push_back(std::move(pool_));
          pool_ = std::move(fresh);
        }
      }
    }
  }

  if (ok) {
    {
      std::lock_guard<std::mutex> lk(config_mu_);
      config_ = next;
    }

    Config shown = *next;
    shown.port = port_.load();
    std::cerr << "Reloaded: listening at http://" << shown.endpoint()
              << " with " << next->threads << " threads\n";
  }

  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    reload_ok_ = ok;
    reload_done_ = true;
  }
  lifecycle_cv_.notify_all();
}

bool Server::reload(const Config& next) {
  std::lock_guard<std::mutex> serial(reload_mu_);
  std::unique_lock<std::mutex> lk(lifecycle_mu_);
  if (state_ != ServerState::Running) return false;

  pending_reload_ = std::make_shared<const Config>(next);
  reload_done_ = false;
  reload_ok_ = false;
  wake();

  lifecycle_cv_.wait(
      lk, [&] { return reload_done_ || state_ != ServerState::Running; });
  return reload_done_ && reload_ok_;
}

void Server::serve_connection(int fd, const std::string& addr, uint16_t port,
                              const std::shared_ptr<const Config>& cfg) {
  // Releases the unit however this function is left.
  struct Closer {
    Server* server;
    int fd;
    ~Closer() { server->close_unit(fd); }
  } closer{this, fd};

  RequestReader reader(fd, limits_for(*cfg));
  bool first = true;

  while (true) {
    ReadStatus st = reader.wait_for_request(first ? cfg->timeout : cfg->keepalive);
    if (st != ReadStatus::Ok) return;
    if (!begin_request(fd, first)) return;

    bool keep_alive = serve_request(fd, reader, addr, port, *cfg);
    if (!end_request(fd) || !keep_alive) return;
    first = false;
  }
}

bool Server::serve_request(int fd, RequestReader& reader,
                           const std::string& addr, uint16_t port,
                           const Config& cfg) {
  HttpRequest req;
  req.remote_addr = addr;
  req.remote_port = port;

  Deadline deadline = std::chrono::steady_clock::now() + cfg.timeout;
  ReadStatus st = reader.read_head(req, deadline);
  if (st == ReadStatus::Ok) {
    auto expect = req.header("Expect");
    if (expect && req.version_minor == 1 &&
        header_has_token(*expect, "100-continue")) {
      if (!send_str(fd, kContinueResponse)) return false;
    }
    st = reader.read_body(req, deadline);
  }

  if (st != ReadStatus::Ok) {
    int status = status_for(st);
    if (status != 0) {
      stats_.inc_protocol_errors();
      std::cerr << "Bad request from " << addr << ":" << port << ": "
                << to_string(st) << "\n";
      send_str(fd, render_response(error_response(status), false, false));
    }
    return false;
  }

  stats_.inc_requests();
  HttpResponse resp = invoke_app(req);

  bool keep_alive = cfg.keepalive.count() > 0 && wants_keep_alive(req) &&
                    !draining_.load();
  bool sent = send_str(fd, render_response(resp, keep_alive, req.method == "HEAD"));
  return sent && keep_alive;
}

HttpResponse Server::invoke_app(const HttpRequest& req) {
  try {
    HttpResponse resp = app_(req);
    check_response(resp);
    return resp;
  } catch (const std::exception& e) {
    stats_.inc_handler_errors();
    std::cerr << "HandlerError: " << req.method << " " << req.target << ": "
              << e.what() << "\n";
  } catch (...) {
    stats_.inc_handler_errors();
    std::cerr << "HandlerError: " << req.method << " " << req.target
              << ": unknown exception\n";
  }
  return error_response(500);
}

bool Server::begin_request(int fd, bool first) {
  std::lock_guard<std::mutex> lk(units_mu_);
  if (cancelled_) return false;
  // once draining, only connections that were waiting for their first
  // request are still served
  if (draining_.load() && !first) return false;
  units_[fd].busy = true;
  return true;
}

bool Server::end_request(int fd) {
  std::lock_guard<std::mutex> lk(units_mu_);
  units_[fd].busy = false;
  return !draining_.load() && !cancelled_;
}

void Server::close_unit(int fd) {
  {
    // closed under the lock so a cancelling shutdown never sees a reused fd
    std::lock_guard<std::mutex> lk(units_mu_);
    units_.erase(fd);
    ::close(fd);
  }
  stats_.dec_active();
  units_cv_.notify_all();
}

void Server::cancel_inflight() {
  {
    std::lock_guard<std::mutex> lk(units_mu_);
    force_cancel_ = true;
  }
  units_cv_.notify_all();
}

bool Server::shutdown(const std::string& reason) {
  std::unique_lock<std::mutex> lk(lifecycle_mu_);
  lifecycle_cv_.wait(lk, [&] { return state_ != ServerState::Binding; });

  if (state_ == ServerState::Failed) return true;
  if (state_ == ServerState::Init) {
    shutdown_started_ = true;
    set_state_locked(ServerState::Stopped);
    return true;
  }
  if (shutdown_started_) {
    lifecycle_cv_.wait(lk, [&] { return state_ == ServerState::Stopped; });
    return drained_;
  }

  shutdown_started_ = true;
  auto cfg = config();
  std::cerr << "Shutting down (" << reason << "), grace period "
            << cfg->graceful_timeout.count() << "ms\n";
  set_state_locked(ServerState::Draining);
  lk.unlock();

  // Stop accepting. Idle connections are woken so they close; requests that
  // already arrived in full are still read and answered.
  {
    std::lock_guard<std::mutex> ulk(units_mu_);
    draining_.store(true);
    for (const auto& u : units_) {
      if (!u.second.busy) ::shutdown(u.first, SHUT_RD);
    }
  }
  wake();
  {
    // unblocks an acceptor stuck in submit() on a full queue
    std::lock_guard<std::mutex> plk(pools_mu_);
    pool_->close();
  }
  if (acceptor_.joinable()) acceptor_.join();
  {
    // a reload racing the close above may have installed a fresh pool
    std::lock_guard<std::mutex> plk(pools_mu_);
    pool_->close();
  }

  ::close(listen_fd_);
  listen_fd_ = -1;

  Deadline deadline = std::chrono::steady_clock::now() + cfg->graceful_timeout;
  bool drained = true;
  bool stranded = false;
  {
    std::unique_lock<std::mutex> ulk(units_mu_);
    units_cv_.wait_until(ulk, deadline,
                         [&] { return units_.empty() || force_cancel_; });
    if (!units_.empty()) {
      drained = false;
      std::cerr << "warning: DrainTimeout: cancelling " << units_.size()
                << " outstanding connection(s)\n";
      cancelled_ = true;
      for (const auto& u : units_) ::shutdown(u.first, SHUT_RDWR);

      // Cancelled I/O fails at once; an application call does not.
      units_cv_.wait_for(ulk, kCancelWait, [&] { return units_.empty(); });
      if (!units_.empty()) {
        stranded = true;
        std::cerr << "warning: " << units_.size()
                  << " worker(s) still inside the application, not waiting"
                  << " for them\n";
      }
    }
  }

  if (!stranded) join_workers();

  std::cerr << "Server stopped: " << stats_.render(cfg->threads) << "\n";

  lk.lock();
  drained_ = drained;
  stranded_ = stranded;
  set_state_locked(ServerState::Stopped);
  return drained;
}

void Server::join_workers() {
  std::lock_guard<std::mutex> lk(pools_mu_);
  if (pool_) pool_->stop();
  for (auto& p : retired_pools_) p->stop();
  retired_pools_.clear();
}

void Server::wait() {
  std::unique_lock<std::mutex> lk(lifecycle_mu_);
  lifecycle_cv_.wait(lk, [&] {
    return state_ == ServerState::Stopped || state_ == ServerState::Failed;
  });
}
