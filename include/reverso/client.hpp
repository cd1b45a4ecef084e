#pragma once
#include "reverso.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reverso {

class ITransport;

struct ClientOptions {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds handshake_timeout{5000};
  // Must cover the server's per-chunk delay plus transfer time.
  std::chrono::milliseconds answer_timeout{10000};
};

// reverso-client <server_ip> <server_port> <input_file> <Lmin> <Lmax>
struct ClientArgs {
  std::string host;
  std::uint16_t port{0};
  std::string input_path;
  std::uint32_t lmin{0};
  std::uint32_t lmax{0};
};

// Parses the five positional arguments (program name excluded). Throws
// std::runtime_error on a wrong count, a non-integer, a port outside
// 1024-65535 or bounds other than 0 < Lmin <= Lmax <= kMaxPayload.
ClientArgs parse_client_args(const std::vector<std::string>& args);

// File contents, which must be printable ASCII. Throws std::runtime_error.
std::string load_input(const std::string& path);

// One client run: ordered chunks out, reversed chunks back in the same slots.
class ClientRun {
public:
  explicit ClientRun(std::vector<std::string> chunks, ClientOptions opts = {});

  // Connects t to host:port, performs the handshake and exchanges every chunk
  // in order. Throws TransportError or ProtocolError on the first failure,
  // after which results() holds nothing.
  void execute(ITransport& t, const std::string& host, std::uint16_t port);

  // Same over an already connected transport.
  void exchange(ITransport& t);

  bool complete() const;

  // Reversed chunks concatenated in original order. Throws unless complete().
  std::string assemble() const;

  std::uint32_t block_count() const { return (std::uint32_t)chunks_.size(); }
  const std::vector<std::string>& chunks() const { return chunks_; }
  const std::vector<std::optional<std::string>>& results() const { return results_; }

private:
  void handshake(ITransport& t);
  void exchange_chunk(ITransport& t, std::size_t i);

  std::vector<std::string> chunks_;
  std::vector<std::optional<std::string>> results_;
  ClientOptions opts_;
};

} // namespace reverso
