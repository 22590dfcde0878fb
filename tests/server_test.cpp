#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "server.hpp"
#include "test_client.hpp"

using namespace testing_client;
using std::chrono::milliseconds;

namespace {

Config test_config() {
  Config cfg;
  cfg.bind_address = "127.0.0.1";
  cfg.port = 0;
  cfg.threads = 2;
  cfg.graceful_timeout = milliseconds(3000);
  cfg.timeout = milliseconds(5000);
  cfg.keepalive = milliseconds(2000);
  return cfg;
}

HttpResponse ok_app(const HttpRequest& req) {
  return HttpResponse::text(200, "hello " + req.path);
}

// Holds handlers until released, and reports when the first one entered.
class Gate {
 public:
  void enter() {
    std::unique_lock<std::mutex> lk(mu_);
    entered_++;
    cv_.notify_all();
    cv_.wait(lk, [&] { return released_; });
  }

  bool wait_entered(int n, milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, timeout, [&] { return entered_ >= n; });
  }

  void release() {
    std::lock_guard<std::mutex> lk(mu_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  int entered_ = 0;
  bool released_ = false;
};

// Retries until connecting is refused or `timeout` passes.
bool becomes_unreachable(uint16_t port, milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    int fd = connect_to("127.0.0.1", port);
    if (fd < 0 && errno == ECONNREFUSED) return true;
    if (fd >= 0) ::close(fd);
    std::this_thread::sleep_for(milliseconds(10));
  }
  return false;
}

}  // namespace

TEST(ServerTest, ServesOnTheConfiguredPortOnly) {
  Config cfg = test_config();
  cfg.port = free_port();
  Server server(cfg, ok_app);
  server.start();
  ASSERT_EQ(server.state(), ServerState::Running);
  EXPECT_EQ(server.port(), cfg.port);

  Response r = roundtrip(cfg.port, get("/x"));
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body, "hello /x");

  if (cfg.port < 65535) {
    int fd = connect_to("127.0.0.1", static_cast<uint16_t>(cfg.port + 1));
    EXPECT_LT(fd, 0);
    EXPECT_EQ(errno, ECONNREFUSED);
  }
}

TEST(ServerTest, DefaultConfigurationUsesPort8080) {
  Server server(Config{}, ok_app);
  EXPECT_EQ(server.config()->port, 8080);
  EXPECT_EQ(server.config()->bind_address, "0.0.0.0");
  EXPECT_EQ(server.state(), ServerState::Init);
}

TEST(ServerTest, PortInUseIsABindError) {
  Server first(test_config(), ok_app);
  first.start();

  Config cfg = test_config();
  cfg.port = first.port();
  Server second(cfg, ok_app);
  try {
    second.start();
    FAIL() << "expected BindError";
  } catch (const BindError& e) {
    EXPECT_EQ(e.code().value(), EADDRINUSE);
  }
  EXPECT_EQ(second.state(), ServerState::Failed);
  EXPECT_TRUE(second.shutdown("test"));
  EXPECT_EQ(second.state(), ServerState::Failed);

  // the first server is unaffected
  EXPECT_EQ(roundtrip(first.port(), get("/")).status, 200);
}

TEST(ServerTest, StartTwiceIsALogicError) {
  Server server(test_config(), ok_app);
  server.start();
  EXPECT_THROW(server.start(), std::logic_error);
}

TEST(ServerTest, HandlerFailureIsContained) {
  Server server(test_config(), [](const HttpRequest& req) {
    if (req.path == "/throw") throw std::runtime_error("handler exploded");
    if (req.path == "/bad-status") {
      HttpResponse r;
      r.status = 7;
      return r;
    }
    return HttpResponse::text(200, "fine");
  });
  server.start();

  Response failed = roundtrip(server.port(), get("/throw"));
  ASSERT_TRUE(failed.ok);
  EXPECT_EQ(failed.status, 500);
  EXPECT_EQ(failed.body, "500 Internal Server Error\n");
  EXPECT_EQ(failed.body.find("exploded"), std::string::npos);

  Response malformed = roundtrip(server.port(), get("/bad-status"));
  ASSERT_TRUE(malformed.ok);
  EXPECT_EQ(malformed.status, 500);

  Response next = roundtrip(server.port(), get("/ok"));
  ASSERT_TRUE(next.ok);
  EXPECT_EQ(next.status, 200);
  EXPECT_EQ(next.body, "fine");

  EXPECT_EQ(server.stats().handler_errors(), 2u);
  EXPECT_EQ(server.stats().requests(), 3u);
}

TEST(ServerTest, KeepAliveAndConnectionClose) {
  Server server(test_config(), ok_app);
  server.start();

  int fd = connect_to("127.0.0.1", server.port());
  ASSERT_GE(fd, 0);
  std::string buffer;

  ASSERT_TRUE(send_all(fd, get("/one") + get("/two")));
  Response one = read_response(fd, buffer);
  Response two = read_response(fd, buffer);
  ASSERT_TRUE(one.ok);
  ASSERT_TRUE(two.ok);
  EXPECT_EQ(one.body, "hello /one");
  EXPECT_EQ(two.body, "hello /two");
  EXPECT_TRUE(one.has_header("Connection: keep-alive"));

  ASSERT_TRUE(send_all(fd, get("/three", "Connection: close\r\n")));
  Response three = read_response(fd, buffer);
  ASSERT_TRUE(three.ok);
  EXPECT_TRUE(three.has_header("Connection: close"));
  EXPECT_TRUE(peer_closed(fd, milliseconds(2000)));
  ::close(fd);
}

TEST(ServerTest, ProtocolErrorsGetAnErrorResponse) {
  Server server(test_config(), ok_app);
  server.start();

  Response bad = roundtrip(server.port(), "NONSENSE\r\n\r\n");
  ASSERT_TRUE(bad.ok);
  EXPECT_EQ(bad.status, 400);
  EXPECT_TRUE(bad.has_header("Connection: close"));

  Response version = roundtrip(server.port(), "GET / HTTP/3.0\r\n\r\n");
  EXPECT_EQ(version.status, 505);

  EXPECT_EQ(roundtrip(server.port(), get("/")).status, 200);
  EXPECT_EQ(server.stats().protocol_errors(), 2u);
}

TEST(ServerTest, ExpectContinue) {
  Server server(test_config(), [](const HttpRequest& req) {
    return HttpResponse::text(200, req.body);
  });
  server.start();

  int fd = connect_to("127.0.0.1", server.port());
  ASSERT_GE(fd, 0);
  ASSERT_TRUE(send_all(fd,
                       "POST /up HTTP/1.1\r\nContent-Length: 4\r\n"
                       "Expect: 100-continue\r\n\r\n"));
  std::string buffer;
  Response interim = read_response(fd, buffer);
  ASSERT_TRUE(interim.ok);
  EXPECT_EQ(interim.status, 100);

  ASSERT_TRUE(send_all(fd, "data"));
  Response final_response = read_response(fd, buffer);
  ASSERT_TRUE(final_response.ok);
  EXPECT_EQ(final_response.status, 200);
  EXPECT_EQ(final_response.body, "data");
  ::close(fd);
}

TEST(ServerTest, ConcurrencyIsBoundedByThreadCount) {
  std::mutex mu;
  int running = 0;
  int peak = 0;

  Config cfg = test_config();
  cfg.threads = 2;
  Server server(cfg, [&](const HttpRequest&) {
    {
      std::lock_guard<std::mutex> lk(mu);
      peak = std::max(peak, ++running);
    }
    std::this_thread::sleep_for(milliseconds(50));
    {
      std::lock_guard<std::mutex> lk(mu);
      --running;
    }
    return HttpResponse::text(200, "ok");
  });
  server.start();

  std::vector<std::future<int>> clients;
  for (int i = 0; i < 6; i++) {
    clients.push_back(std::async(std::launch::async, [&] {
      return roundtrip(server.port(), get("/", "Connection: close\r\n")).status;
    }));
  }
  for (auto& c : clients) EXPECT_EQ(c.get(), 200);
  EXPECT_LE(peak, 2);
}

TEST(ServerTest, ShutdownIsIdempotent) {
  Server server(test_config(), ok_app);
  server.start();
  uint16_t port = server.port();

  auto a = std::async(std::launch::async, [&] { return server.shutdown("a"); });
  auto b = std::async(std::launch::async, [&] { return server.shutdown("b"); });
  EXPECT_TRUE(a.get());
  EXPECT_TRUE(b.get());
  EXPECT_EQ(server.state(), ServerState::Stopped);

  EXPECT_TRUE(server.shutdown("again"));
  EXPECT_EQ(server.state(), ServerState::Stopped);
  server.wait();

  int fd = connect_to("127.0.0.1", port);
  EXPECT_LT(fd, 0);
}

TEST(ServerTest, ShutdownBeforeStart) {
  Server server(test_config(), ok_app);
  EXPECT_TRUE(server.shutdown("never started"));
  EXPECT_EQ(server.state(), ServerState::Stopped);
  EXPECT_THROW(server.start(), std::logic_error);
  EXPECT_FALSE(server.reload(test_config()));
}

TEST(ServerTest, InFlightRequestCompletesWhileDraining) {
  Gate gate;
  Server server(test_config(), [&](const HttpRequest&) {
    gate.enter();
    return HttpResponse::text(200, "finished");
  });
  server.start();
  uint16_t port = server.port();

  auto client = std::async(std::launch::async,
                           [&] { return roundtrip(port, get("/slow")); });
  ASSERT_TRUE(gate.wait_entered(1, milliseconds(2000)));

  auto stopping =
      std::async(std::launch::async, [&] { return server.shutdown("test"); });

  // no new connections once draining
  EXPECT_TRUE(becomes_unreachable(port, milliseconds(2000)));
  EXPECT_EQ(server.state(), ServerState::Draining);

  gate.release();
  Response r = client.get();
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body, "finished");
  EXPECT_TRUE(r.has_header("Connection: close"));

  EXPECT_TRUE(stopping.get());
  EXPECT_EQ(server.state(), ServerState::Stopped);
}

TEST(ServerTest, QueuedConnectionIsServedWhileDraining) {
  Gate gate;
  Config cfg = test_config();
  cfg.threads = 1;
  Server server(cfg, [&](const HttpRequest& req) {
    if (req.path == "/slow") gate.enter();
    return HttpResponse::text(200, req.path);
  });
  server.start();
  uint16_t port = server.port();

  auto first = std::async(std::launch::async,
                          [&] { return roundtrip(port, get("/slow")); });
  ASSERT_TRUE(gate.wait_entered(1, milliseconds(2000)));

  // the only worker is busy, so this one waits in the queue
  auto second = std::async(std::launch::async,
                           [&] { return roundtrip(port, get("/queued")); });
  std::this_thread::sleep_for(milliseconds(100));

  auto stopping =
      std::async(std::launch::async, [&] { return server.shutdown("test"); });
  std::this_thread::sleep_for(milliseconds(100));
  gate.release();

  Response a = first.get();
  Response b = second.get();
  EXPECT_EQ(a.status, 200);
  EXPECT_EQ(b.status, 200);
  EXPECT_EQ(b.body, "/queued");
  EXPECT_TRUE(stopping.get());
}

TEST(ServerTest, IdleKeepAliveConnectionDoesNotHoldUpShutdown) {
  Config cfg = test_config();
  cfg.keepalive = milliseconds(10000);
  cfg.graceful_timeout = milliseconds(5000);
  Server server(cfg, ok_app);
  server.start();

  int fd = connect_to("127.0.0.1", server.port());
  ASSERT_GE(fd, 0);
  ASSERT_TRUE(send_all(fd, get("/")));
  Response r = read_response(fd);
  ASSERT_TRUE(r.ok);
  EXPECT_TRUE(r.has_header("Connection: keep-alive"));

  auto started = std::chrono::steady_clock::now();
  EXPECT_TRUE(server.shutdown("test"));
  EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(2000));
  EXPECT_TRUE(peer_closed(fd, milliseconds(1000)));
  ::close(fd);
}

TEST(ServerTest, GracePeriodExpiryCancelsStragglers) {
  Config cfg = test_config();
  cfg.graceful_timeout = milliseconds(200);
  cfg.timeout = milliseconds(20000);
  Server server(cfg, ok_app);
  server.start();

  // half a request: the worker is stuck reading the headers
  int fd = connect_to("127.0.0.1", server.port());
  ASSERT_GE(fd, 0);
  ASSERT_TRUE(send_all(fd, "GET / HTTP/1.1\r\nHost: x\r\n"));
  std::this_thread::sleep_for(milliseconds(100));

  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(server.shutdown("test"));
  EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(3000));
  EXPECT_EQ(server.state(), ServerState::Stopped);
  EXPECT_TRUE(peer_closed(fd, milliseconds(1000)));
  ::close(fd);

  // the recorded outcome is returned again
  EXPECT_FALSE(server.shutdown("again"));
}

TEST(ServerTest, ShutdownDoesNotWaitForSlowHandler) {
  Config cfg = test_config();
  cfg.graceful_timeout = milliseconds(200);
  std::atomic<bool> entered{false};
  Server server(cfg, [&](const HttpRequest&) {
    entered = true;
    std::this_thread::sleep_for(milliseconds(4000));
    return HttpResponse::text(200, "late");
  });
  server.start();

  int fd = connect_to("127.0.0.1", server.port());
  ASSERT_GE(fd, 0);
  ASSERT_TRUE(send_all(fd, get("/slow")));
  for (int i = 0; i < 200 && !entered.load(); i++) {
    std::this_thread::sleep_for(milliseconds(10));
  }
  ASSERT_TRUE(entered.load());

  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(server.shutdown("test"));
  EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(2500));
  EXPECT_EQ(server.state(), ServerState::Stopped);
  EXPECT_TRUE(server.workers_stranded());
  EXPECT_TRUE(peer_closed(fd, milliseconds(1000)));
  ::close(fd);
}

TEST(ServerTest, CancelInflightEndsGracePeriodEarly) {
  Config cfg = test_config();
  cfg.graceful_timeout = milliseconds(30000);
  cfg.timeout = milliseconds(20000);
  Server server(cfg, ok_app);
  server.start();

  int fd = connect_to("127.0.0.1", server.port());
  ASSERT_GE(fd, 0);
  ASSERT_TRUE(send_all(fd, "GET / HTTP/1.1\r\n"));
  std::this_thread::sleep_for(milliseconds(100));

  server.cancel_inflight();
  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(server.shutdown("quit"));
  EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(3000));
  ::close(fd);
}

TEST(ServerTest, ReloadRebindsAndResizesThePool) {
  Server server(test_config(), ok_app);
  server.start();
  uint16_t old_port = server.port();

  Config next = test_config();
  next.port = free_port();
  next.threads = 3;
  ASSERT_TRUE(server.reload(next));

  EXPECT_EQ(server.port(), next.port);
  EXPECT_EQ(server.config()->threads, 3);
  EXPECT_EQ(roundtrip(next.port, get("/after")).body, "hello /after");
  EXPECT_TRUE(becomes_unreachable(old_port, milliseconds(1000)));

  EXPECT_TRUE(server.shutdown("test"));
  EXPECT_FALSE(server.reload(next));
}

TEST(ServerTest, ReloadKeepsServingWhenNewPortIsTaken) {
  Server other(test_config(), ok_app);
  other.start();

  Server server(test_config(), ok_app);
  server.start();
  uint16_t port = server.port();

  Config next = test_config();
  next.port = other.port();
  EXPECT_FALSE(server.reload(next));
  EXPECT_EQ(server.port(), port);
  EXPECT_EQ(server.config()->port, 0);
  EXPECT_EQ(roundtrip(port, get("/still")).status, 200);
}

TEST(ServerTest, ShutdownRacingReloadStillStops) {
  Config next = test_config();
  next.threads = 3;

  for (int i = 0; i < 50; i++) {
    Server server(test_config(), ok_app);
    server.start();

    auto reload = std::async(std::launch::async,
                             [&] { return server.reload(next); });
    auto stop = std::async(std::launch::async,
                           [&] { return server.shutdown("test"); });

    ASSERT_EQ(stop.wait_for(std::chrono::seconds(5)), std::future_status::ready)
        << "iteration " << i;
    EXPECT_TRUE(stop.get());
    reload.get();
    EXPECT_EQ(server.state(), ServerState::Stopped);
    EXPECT_FALSE(server.workers_stranded());
  }
}

TEST(ServerTest, WorkerStartFailureLeavesServerFailed) {
  Config cfg = test_config();
  cfg.port = free_port();
  cfg.threads = 0;
  {
    Server server(cfg, ok_app);
    EXPECT_THROW(server.start(), std::invalid_argument);
    EXPECT_EQ(server.state(), ServerState::Failed);
    EXPECT_TRUE(server.shutdown("test"));
    EXPECT_TRUE(becomes_unreachable(cfg.port, milliseconds(1000)));
  }

  // the port was released
  cfg.threads = 2;
  Server again(cfg, ok_app);
  EXPECT_NO_THROW(again.start());
  EXPECT_EQ(roundtrip(cfg.port, get("/")).status, 200);
}
