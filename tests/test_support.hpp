#pragma once
#include "reverso/transport.hpp"

#include <sys/socket.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace reverso::test {

// Two connected stream transports backed by socketpair(2).
inline std::pair<std::unique_ptr<TcpTransport>, std::unique_ptr<TcpTransport>> transport_pair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) throw std::runtime_error("socketpair failed");
  return {std::make_unique<TcpTransport>(fds[0]), std::make_unique<TcpTransport>(fds[1])};
}

inline void send_raw(ITransport& t, const Bytes& b) {
  if (!b.empty()) t.send_all(b.data(), b.size());
}

inline Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }

inline std::string text_of(const Bytes& b) { return std::string(b.begin(), b.end()); }

} // namespace reverso::test
