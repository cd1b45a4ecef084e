#include "reverso/session.hpp"
#include "reverso/framing.hpp"
#include "reverso/text.hpp"
#include "reverso/transport.hpp"
#include "reverso/util.hpp"

#include <thread>
#include <utility>

namespace reverso {

namespace {

struct AnswerScope {
  AnswerGate* gate;
  ~AnswerScope() {
    if (gate) gate->end_answer();
  }
};

} // namespace

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::AwaitInit:        return "AwaitInit";
    case SessionState::Agreed:           return "Agreed";
    case SessionState::AwaitChunkHeader: return "AwaitChunkHeader";
    case SessionState::AwaitChunkBody:   return "AwaitChunkBody";
    case SessionState::Done:             return "Done";
    case SessionState::Failed:           return "Failed";
  }
  return "Unknown";
}

ServerSession::ServerSession(ITransport& t, std::string peer, const std::atomic<bool>& running,
                             SessionOptions opts, AnswerGate* gate)
  : t_(t), peer_(std::move(peer)), running_(running), opts_(opts), gate_(gate) {}

SessionState ServerSession::run() {
  try {
    handshake();
    while (done_ < expected_) {
      if (!serve_chunk()) return state_;
    }
    state_ = SessionState::Done;
    log_line("server", "finished " + std::to_string(done_) + " block(s) for " + peer_);
  } catch (const ProtocolError& e) {
    fail(std::string("protocol error: ") + e.what());
  } catch (const TransportError& e) {
    fail(std::string("transport error: ") + e.what());
  } catch (const std::exception& e) {
    fail(std::string("error: ") + e.what());
  }
  return state_;
}

void ServerSession::handshake() {
  state_ = SessionState::AwaitInit;
  t_.set_recv_timeout(opts_.handshake_timeout);

  Message init = expect_msg(t_, MsgType::Init);
  expected_ = init.block_count;
  state_ = SessionState::Agreed;
  log_line("server", peer_ + " requested reversal of " + std::to_string(expected_) + " block(s)");

  send_msg(t_, Message::agree());
}

// Returns false when the session stopped because the server is shutting down.
bool ServerSession::serve_chunk() {
  if (!running_.load()) {
    fail("server shutting down");
    return false;
  }

  state_ = SessionState::AwaitChunkHeader;
  t_.set_recv_timeout(opts_.chunk_timeout);
  FrameHeader h = recv_header(t_);
  if (h.type != MsgType::Request) {
    throw ProtocolError(std::string("expected Request, got ") + to_string(h.type));
  }

  state_ = SessionState::AwaitChunkBody;
  Message req = recv_body(t_, h);
  if (!is_ascii(req.payload)) throw ProtocolError("payload is not 7-bit ASCII");

  Bytes reversed = reverse_bytes(req.payload);
  std::this_thread::sleep_for(opts_.processing_delay);

  // No Answer once shutdown has begun; the socket is about to be torn down.
  if (!running_.load() || (gate_ && !gate_->begin_answer())) {
    fail("server shutting down");
    return false;
  }
  {
    AnswerScope scope{gate_};
    send_msg(t_, Message::answer(std::move(reversed)));
  }
  ++done_;
  log_line("server", "processed block " + std::to_string(done_) + "/" +
                     std::to_string(expected_) + " for " + peer_);
  return true;
}

void ServerSession::fail(const std::string& why) {
  log_line("server", peer_ + ": " + why + " (in " + to_string(state_) + ")");
  error_ = why;
  state_ = SessionState::Failed;
}

} // namespace reverso
