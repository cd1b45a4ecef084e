#pragma once
#include "reverso.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace reverso {

class ITransport;

enum class SessionState {
  AwaitInit,
  Agreed,
  AwaitChunkHeader,
  AwaitChunkBody,
  Done,
  Failed
};

const char* to_string(SessionState s);

struct SessionOptions {
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds chunk_timeout{30000};
  std::chrono::milliseconds processing_delay{500};  // per chunk, before the Answer goes out
};

// Lets the owner of a connection hold off a forced close while an Answer is
// being written, so the peer never sees half of one.
class AnswerGate {
public:
  virtual ~AnswerGate() = default;

  // False once shutdown has begun; the Answer must not be started.
  virtual bool begin_answer() = 0;
  virtual void end_answer() noexcept = 0;
};

// Server side of one connection: Init/Agree, then n Request/Answer rounds.
//
// The session reads and writes through t but does not close it; the owner
// closes the socket once run() returns. running is the process-wide flag;
// once it drops the session stops at the next chunk boundary. gate, when
// given, brackets every Answer write.
class ServerSession {
public:
  ServerSession(ITransport& t, std::string peer, const std::atomic<bool>& running,
                SessionOptions opts = {}, AnswerGate* gate = nullptr);

  // Drives the connection to Done or Failed and returns the final state.
  // Transport and protocol failures are logged and end in Failed.
  SessionState run();

  SessionState state() const { return state_; }
  std::uint32_t expected_chunks() const { return expected_; }
  std::uint32_t chunks_done() const { return done_; }
  const std::string& error() const { return error_; }

private:
  void handshake();
  bool serve_chunk();
  void fail(const std::string& why);

  ITransport& t_;
  std::string peer_;
  const std::atomic<bool>& running_;
  SessionOptions opts_;
  AnswerGate* gate_;

  SessionState state_{SessionState::AwaitInit};
  std::uint32_t expected_{0};
  std::uint32_t done_{0};
  std::string error_;
};

} // namespace reverso
