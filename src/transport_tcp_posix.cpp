#include "reverso/transport.hpp"
#include "reverso/util.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace reverso {

static std::string errno_text(const char* what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

static void set_nonblocking(int fd, bool on) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) throw TransportError(errno_text("fcntl(F_GETFL)", errno));
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (::fcntl(fd, F_SETFL, flags) < 0) throw TransportError(errno_text("fcntl(F_SETFL)", errno));
}

// Non-blocking connect bounded by poll(); returns 0 or an errno value.
static int connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms) {
  set_nonblocking(fd, true);
  int err = 0;
  if (::connect(fd, addr, len) != 0) {
    err = errno;
    if (err == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      int rc;
      do {
        rc = ::poll(&pfd, 1, timeout_ms);
      } while (rc < 0 && errno == EINTR);
      if (rc == 0) {
        err = ETIMEDOUT;
      } else if (rc < 0) {
        err = errno;
      } else {
        socklen_t elen = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen) != 0) err = errno;
      }
    }
  }
  if (err == 0) set_nonblocking(fd, false);
  return err;
}

static int connect_tcp(const std::string& host, std::uint16_t port, int timeout_ms) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    throw TransportError("cannot resolve " + host + ": " + ::gai_strerror(rc));
  }

  int fd = -1;
  int last_err = 0;
  for (auto* p = res; p; p = p->ai_next) {
    fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) { last_err = errno; continue; }
    last_err = connect_with_timeout(fd, p->ai_addr, p->ai_addrlen, timeout_ms);
    if (last_err == 0) break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  if (fd < 0) {
    throw TransportError(errno_text(("connect to " + host + ":" + port_str).c_str(), last_err));
  }
  return fd;
}

static int listen_tcp(const std::string& bind_host, std::uint16_t port, int backlog) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_PASSIVE;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(),
                         port_str.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    throw TransportError("cannot resolve bind address " + bind_host + ": " + ::gai_strerror(rc));
  }

  int lfd = -1;
  int last_err = 0;
  for (auto* p = res; p; p = p->ai_next) {
    lfd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (lfd < 0) { last_err = errno; continue; }

    int yes = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(lfd, p->ai_addr, p->ai_addrlen) != 0) { last_err = errno; ::close(lfd); lfd = -1; continue; }
    if (::listen(lfd, backlog) != 0) { last_err = errno; ::close(lfd); lfd = -1; continue; }
    break;
  }
  ::freeaddrinfo(res);
  if (lfd < 0) throw TransportError(errno_text(("listen on port " + port_str).c_str(), last_err));
  return lfd;
}

static std::string peer_name(const sockaddr_storage& ss) {
  char host[INET6_ADDRSTRLEN] = {0};
  std::uint16_t port = 0;
  if (ss.ss_family == AF_INET) {
    const auto* a = (const sockaddr_in*)&ss;
    ::inet_ntop(AF_INET, &a->sin_addr, host, sizeof(host));
    port = ntohs(a->sin_port);
  } else if (ss.ss_family == AF_INET6) {
    const auto* a = (const sockaddr_in6*)&ss;
    ::inet_ntop(AF_INET6, &a->sin6_addr, host, sizeof(host));
    port = ntohs(a->sin6_port);
  } else {
    return "unknown";
  }
  return std::string(host) + ":" + std::to_string(port);
}

// ------------------------------ TcpTransport ------------------------------

TcpTransport::TcpTransport() = default;
TcpTransport::TcpTransport(int connected_fd) : fd_(connected_fd) {}
TcpTransport::~TcpTransport() { close(); }

void TcpTransport::connect(const std::string& host, std::uint16_t port,
                           std::chrono::milliseconds timeout) {
  close();
  fd_ = connect_tcp(host, port, (int)timeout.count());
}

void TcpTransport::set_recv_timeout(std::chrono::milliseconds timeout) {
  ensure(fd_ >= 0, "set_recv_timeout on closed socket");
  struct timeval tv{};
  tv.tv_sec = (time_t)(timeout.count() / 1000);
  tv.tv_usec = (suseconds_t)((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    throw TransportError(errno_text("setsockopt(SO_RCVTIMEO)", errno));
  }
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n) {
  if (fd_ < 0) throw TransportError("send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd_, data + off, n - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) continue;
    if (w <= 0) throw TransportError(errno_text("send failed", errno));
    off += (std::size_t)w;
  }
}

void TcpTransport::recv_all(std::uint8_t* out, std::size_t n) {
  if (fd_ < 0) throw TransportError("recv on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t r = ::recv(fd_, out + off, n - off, 0);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      throw TransportError("recv timed out after " + std::to_string(off) + " of " +
                           std::to_string(n) + " bytes");
    }
    if (r < 0) throw TransportError(errno_text("recv failed", errno));
    if (r == 0) {
      throw TransportError("connection closed after " + std::to_string(off) + " of " +
                           std::to_string(n) + " bytes");
    }
    off += (std::size_t)r;
  }
}

void TcpTransport::shutdown() noexcept {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

// ------------------------------ TcpListener ------------------------------

TcpListener::~TcpListener() { close(); }

void TcpListener::listen(const std::string& bind_host, std::uint16_t port, int backlog) {
  close();
  fd_ = listen_tcp(bind_host, port, backlog);
}

std::unique_ptr<TcpTransport> TcpListener::accept(std::chrono::milliseconds timeout,
                                                  std::string& peer) {
  if (fd_ < 0) throw TransportError("accept on closed listener");

  pollfd pfd{fd_, POLLIN, 0};
  int rc = ::poll(&pfd, 1, (int)timeout.count());
  if (rc < 0 && errno == EINTR) return nullptr;
  if (rc < 0) throw TransportError(errno_text("poll(listen) failed", errno));
  if (rc == 0) return nullptr;

  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  int cfd = ::accept(fd_, (sockaddr*)&ss, &len);
  if (cfd < 0) {
    // The client may have gone away between poll and accept.
    if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN) return nullptr;
    throw TransportError(errno_text("accept failed", errno));
  }
  peer = peer_name(ss);
  return std::make_unique<TcpTransport>(cfd);
}

std::uint16_t TcpListener::port() const {
  ensure(fd_ >= 0, "listener is not bound");
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd_, (sockaddr*)&ss, &len) != 0) {
    throw TransportError(errno_text("getsockname failed", errno));
  }
  if (ss.ss_family == AF_INET6) return ntohs(((const sockaddr_in6*)&ss)->sin6_port);
  return ntohs(((const sockaddr_in*)&ss)->sin_port);
}

void TcpListener::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

} // namespace reverso
