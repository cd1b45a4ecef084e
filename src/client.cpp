#include "reverso/client.hpp"
#include "reverso/framing.hpp"
#include "reverso/text.hpp"
#include "reverso/transport.hpp"
#include "reverso/util.hpp"

#include <stdexcept>
#include <utility>

namespace reverso {

static constexpr std::size_t kPreviewChars = 50;

static bool parse_long(const std::string& s, long& out) {
  try {
    std::size_t used = 0;
    out = std::stol(s, &used);
    return used == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

ClientArgs parse_client_args(const std::vector<std::string>& args) {
  ensure(args.size() == 5, "expected 5 arguments");

  long port = 0, lmin = 0, lmax = 0;
  ensure(parse_long(args[1], port) && parse_long(args[3], lmin) && parse_long(args[4], lmax),
         "port, Lmin and Lmax must be integers");
  ensure(port >= 1024 && port <= 65535, "port must be in the range 1024-65535");
  ensure(lmin > 0 && lmin <= lmax && lmax <= (long)kMaxPayload, "invalid chunk size bounds");

  ClientArgs a;
  a.host = args[0];
  a.port = (std::uint16_t)port;
  a.input_path = args[2];
  a.lmin = (std::uint32_t)lmin;
  a.lmax = (std::uint32_t)lmax;
  return a;
}

std::string load_input(const std::string& path) {
  std::string text;
  if (!read_file(path, text)) throw std::runtime_error("cannot read file '" + path + "'");
  ensure(is_printable_ascii(text), "file contains characters outside printable ASCII");
  return text;
}

ClientRun::ClientRun(std::vector<std::string> chunks, ClientOptions opts)
  : chunks_(std::move(chunks)), results_(chunks_.size()), opts_(opts) {
  for (const auto& c : chunks_) {
    ensure(is_printable_ascii(c), "chunk contains non-printable or non-ASCII characters");
    ensure(c.size() <= kMaxPayload, "chunk too large");
  }
}

void ClientRun::execute(ITransport& t, const std::string& host, std::uint16_t port) {
  log_line("client", "connecting to " + host + ":" + std::to_string(port) + "...");
  t.connect(host, port, opts_.connect_timeout);
  log_line("client", "connected to server");
  exchange(t);
}

void ClientRun::exchange(ITransport& t) {
  try {
    handshake(t);
    for (std::size_t i = 0; i < chunks_.size(); ++i) exchange_chunk(t, i);
  } catch (...) {
    // All or nothing: partial results are never handed out.
    for (auto& r : results_) r.reset();
    throw;
  }
}

void ClientRun::handshake(ITransport& t) {
  send_msg(t, Message::init(block_count()));
  log_line("client", "sent Init, block count " + std::to_string(block_count()));

  t.set_recv_timeout(opts_.handshake_timeout);
  expect_msg(t, MsgType::Agree);
  log_line("client", "server agreed");
}

void ClientRun::exchange_chunk(ITransport& t, std::size_t i) {
  const std::string& chunk = chunks_[i];
  const std::string pos = std::to_string(i + 1) + "/" + std::to_string(chunks_.size());

  send_msg(t, Message::request(Bytes(chunk.begin(), chunk.end())));
  log_line("client", "sent block " + pos + ", length " + std::to_string(chunk.size()));

  t.set_recv_timeout(opts_.answer_timeout);
  Message ans = expect_msg(t, MsgType::Answer);
  if (ans.payload.size() != chunk.size()) {
    throw ProtocolError("answer for block " + pos + " has length " +
                        std::to_string(ans.payload.size()) + ", expected " +
                        std::to_string(chunk.size()));
  }
  if (!is_ascii(ans.payload)) throw ProtocolError("answer for block " + pos + " is not ASCII");

  std::string text(ans.payload.begin(), ans.payload.end());
  std::string preview = text.substr(0, kPreviewChars);
  if (text.size() > kPreviewChars) preview += "...";
  log_line("client", "block " + pos + ": " + preview);

  results_[i] = std::move(text);
}

bool ClientRun::complete() const {
  for (const auto& r : results_) {
    if (!r) return false;
  }
  return true;
}

std::string ClientRun::assemble() const {
  return join_chunks(results_);
}

} // namespace reverso
