#pragma once
#include "session.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace reverso {

struct ServerOptions {
  std::string bind_host{"0.0.0.0"};
  std::uint16_t port{0};
  int backlog{5};
  std::chrono::milliseconds accept_timeout{1000};
  std::chrono::milliseconds grace_period{5000};
  SessionOptions session;
};

// Accepts connections and runs one ServerSession per connection on its own thread.
//
// Shutdown: request_stop() clears the running flag. serve() then stops
// accepting and shuts down every live connection. A connection in the middle
// of writing an Answer is shut down once that write completes. serve() waits
// up to grace_period for the workers, forces the remaining connections closed,
// detaches their threads and returns.
class Server {
public:
  explicit Server(ServerOptions opts);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Binds and listens. Throws TransportError.
  void start();

  // Accept loop; returns after request_stop() once shutdown has completed.
  void serve();

  // Lock-free; safe from a signal handler.
  void request_stop() noexcept { state_->running.store(false); }

  bool running() const { return state_->running.load(); }
  std::uint16_t port() const { return listener_.port(); }
  std::size_t live_connections() const;

  // Workers left running after the last shutdown's grace period.
  std::size_t detached_workers() const { return detached_; }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<TcpTransport> conn;
    std::string peer;
    bool answering{false};
    bool finished{false};
  };

  // Outlives the Server if a worker overstays the grace period.
  struct Shared {
    std::atomic<bool> running{true};
    std::mutex mu;
    std::condition_variable cv;
    std::map<std::uint64_t, Worker> workers;
  };

  class Gate;

  void spawn(std::unique_ptr<TcpTransport> conn, const std::string& peer);
  void reap_finished();
  void shutdown_workers();

  static void worker_main(std::shared_ptr<Shared> state, std::uint64_t id,
                          std::shared_ptr<TcpTransport> conn, std::string peer,
                          SessionOptions opts);

  ServerOptions opts_;
  TcpListener listener_;
  std::shared_ptr<Shared> state_;
  std::uint64_t next_id_{0};
  std::size_t detached_{0};
};

// Routes SIGINT and SIGTERM to server.request_stop() for its lifetime, then
// puts the previous handlers back. One instance at a time.
class StopOnSignal {
public:
  explicit StopOnSignal(Server& server);
  ~StopOnSignal();

  StopOnSignal(const StopOnSignal&) = delete;
  StopOnSignal& operator=(const StopOnSignal&) = delete;

private:
  void (*prev_int_)(int);
  void (*prev_term_)(int);
};

} // namespace reverso
