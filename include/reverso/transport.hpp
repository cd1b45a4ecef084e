#pragma once
#include "reverso.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace reverso {

class ITransport {
public:
  virtual ~ITransport() = default;

  // Client-side connect; gives up after timeout
  virtual void connect(const std::string& host, std::uint16_t port,
                       std::chrono::milliseconds timeout) = 0;

  // Applies to every following recv; zero means wait forever
  virtual void set_recv_timeout(std::chrono::milliseconds timeout) = 0;

  // Blocking exact send/recv. Throw TransportError on failure, timeout or EOF.
  virtual void send_all(const std::uint8_t* data, std::size_t n) = 0;
  virtual void recv_all(std::uint8_t* out, std::size_t n) = 0;

  // Aborts pending and future i/o in both directions. Callable from another thread.
  virtual void shutdown() noexcept = 0;

  virtual void close() noexcept = 0;
};

// POSIX TCP transport (Linux/macOS)
class TcpTransport final : public ITransport {
public:
  TcpTransport();
  explicit TcpTransport(int connected_fd);  // takes ownership
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  void connect(const std::string& host, std::uint16_t port,
               std::chrono::milliseconds timeout) override;
  void set_recv_timeout(std::chrono::milliseconds timeout) override;

  void send_all(const std::uint8_t* data, std::size_t n) override;
  void recv_all(std::uint8_t* out, std::size_t n) override;

  void shutdown() noexcept override;
  void close() noexcept override;

  bool is_open() const { return fd_ >= 0; }

private:
  int fd_{-1};
};

class TcpListener {
public:
  TcpListener() = default;
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  void listen(const std::string& bind_host, std::uint16_t port, int backlog);

  // Waits at most timeout for a client. Returns nullptr on timeout or signal.
  // peer receives "host:port" of the accepted client.
  std::unique_ptr<TcpTransport> accept(std::chrono::milliseconds timeout, std::string& peer);

  // Locally bound port (useful after binding port 0)
  std::uint16_t port() const;

  void close() noexcept;

private:
  int fd_{-1};
};

} // namespace reverso
