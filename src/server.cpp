#include "reverso/server.hpp"
#include "reverso/util.hpp"

#include <csignal>
#include <system_error>
#include <utility>
#include <vector>

namespace reverso {

// Marks the worker as answering so shutdown_workers() leaves its socket alone
// until the Answer is fully written.
class Server::Gate : public AnswerGate {
public:
  Gate(Shared& state, std::uint64_t id) : state_(state), id_(id) {}

  bool begin_answer() override {
    std::lock_guard<std::mutex> lock(state_.mu);
    if (!state_.running.load()) return false;
    auto it = state_.workers.find(id_);
    if (it != state_.workers.end()) it->second.answering = true;
    return true;
  }

  void end_answer() noexcept override {
    {
      std::lock_guard<std::mutex> lock(state_.mu);
      auto it = state_.workers.find(id_);
      if (it != state_.workers.end()) {
        Worker& w = it->second;
        w.answering = false;
        // Shutdown skipped this connection while the Answer was going out.
        if (!state_.running.load() && w.conn) w.conn->shutdown();
      }
    }
    state_.cv.notify_all();
  }

private:
  Shared& state_;
  std::uint64_t id_;
};

Server::Server(ServerOptions opts)
  : opts_(std::move(opts)), state_(std::make_shared<Shared>()) {}

Server::~Server() {
  request_stop();
  bool pending;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    pending = !state_->workers.empty();
  }
  if (pending) shutdown_workers();
}

void Server::start() {
  listener_.listen(opts_.bind_host, opts_.port, opts_.backlog);
  log_line("server", "reversal server listening on port " + std::to_string(listener_.port()) +
                     " (Ctrl+C to stop)");
}

std::size_t Server::live_connections() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  std::size_t n = 0;
  for (const auto& kv : state_->workers) {
    if (!kv.second.finished) ++n;
  }
  return n;
}

void Server::serve() {
  while (state_->running.load()) {
    std::string peer;
    std::unique_ptr<TcpTransport> conn;
    try {
      conn = listener_.accept(opts_.accept_timeout, peer);
    } catch (const TransportError& e) {
      if (state_->running.load()) log_line("server", std::string("accept failed: ") + e.what());
      continue;
    }

    if (conn) {
      if (!state_->running.load()) {
        conn->close();
        break;
      }
      spawn(std::move(conn), peer);
    }
    reap_finished();
  }

  log_line("server", "termination requested, shutting down");
  listener_.close();
  shutdown_workers();
  log_line("server", "server resources released");
}

void Server::spawn(std::unique_ptr<TcpTransport> conn, const std::string& peer) {
  std::shared_ptr<TcpTransport> shared_conn(std::move(conn));
  log_line("server", "client " + peer + " connected");

  std::lock_guard<std::mutex> lock(state_->mu);
  const std::uint64_t id = next_id_++;
  Worker& w = state_->workers[id];
  w.conn = shared_conn;
  w.peer = peer;
  try {
    w.thread = std::thread(&Server::worker_main, state_, id, shared_conn, peer, opts_.session);
  } catch (const std::system_error& e) {
    log_line("server", "cannot start worker for " + peer + ": " + e.what());
    state_->workers.erase(id);
    shared_conn->close();
  }
}

void Server::worker_main(std::shared_ptr<Shared> state, std::uint64_t id,
                         std::shared_ptr<TcpTransport> conn, std::string peer,
                         SessionOptions opts) {
  Gate gate(*state, id);
  ServerSession session(*conn, peer, state->running, opts, &gate);
  session.run();

  // Deregister before closing so the dispatcher never shuts down a reused descriptor.
  {
    std::lock_guard<std::mutex> lock(state->mu);
    auto it = state->workers.find(id);
    if (it != state->workers.end()) {
      it->second.finished = true;
      it->second.conn.reset();
    }
  }
  conn->close();
  log_line("server", "client " + peer + " disconnected");
  state->cv.notify_all();
}

void Server::reap_finished() {
  std::vector<std::thread> done;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    for (auto it = state_->workers.begin(); it != state_->workers.end();) {
      if (it->second.finished) {
        done.push_back(std::move(it->second.thread));
        it = state_->workers.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& t : done) {
    if (t.joinable()) t.join();
  }
}

void Server::shutdown_workers() {
  std::vector<std::pair<std::string, std::thread>> exited;
  {
    std::unique_lock<std::mutex> lock(state_->mu);

    std::size_t live = 0;
    for (auto& kv : state_->workers) {
      if (!kv.second.finished) ++live;
    }
    log_line("server", "closing " + std::to_string(live) + " active client connection(s)");
    for (auto& kv : state_->workers) {
      Worker& w = kv.second;
      if (w.finished || !w.conn) continue;
      if (w.answering) {
        log_line("server", "  letting the answer to " + w.peer + " finish first");
        continue;
      }
      w.conn->shutdown();
      log_line("server", "  closed connection to " + w.peer);
    }

    log_line("server", "waiting up to " + std::to_string(opts_.grace_period.count()) +
                       " ms for client threads to exit");
    const auto deadline = std::chrono::steady_clock::now() + opts_.grace_period;
    state_->cv.wait_until(lock, deadline, [this] {
      for (const auto& kv : state_->workers) {
        if (!kv.second.finished) return false;
      }
      return true;
    });

    for (auto& kv : state_->workers) {
      Worker& w = kv.second;
      if (w.finished) {
        exited.emplace_back(w.peer, std::move(w.thread));
      } else {
        log_line("server", "  worker for " + w.peer + " did not exit within the grace period");
        if (w.conn) w.conn->shutdown();
        if (w.thread.joinable()) w.thread.detach();
        ++detached_;
      }
    }
    state_->workers.clear();
  }

  for (auto& e : exited) {
    if (e.second.joinable()) e.second.join();
    log_line("server", "  worker for " + e.first + " exited");
  }
}

// ------------------------------ Signals ------------------------------

static std::atomic<Server*> g_stop_target{nullptr};

static void on_stop_signal(int) {
  Server* s = g_stop_target.load();
  if (s) s->request_stop();
}

StopOnSignal::StopOnSignal(Server& server) {
  g_stop_target.store(&server);
  prev_int_ = std::signal(SIGINT, on_stop_signal);
  prev_term_ = std::signal(SIGTERM, on_stop_signal);
}

StopOnSignal::~StopOnSignal() {
  std::signal(SIGINT, prev_int_ == SIG_ERR ? SIG_DFL : prev_int_);
  std::signal(SIGTERM, prev_term_ == SIG_ERR ? SIG_DFL : prev_term_);
  g_stop_target.store(nullptr);
}

} // namespace reverso
