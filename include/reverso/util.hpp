#pragma once
#include "reverso.hpp"
#include <stdexcept>
#include <string>
#include <cstddef>
#include <cstdint>

namespace reverso {

// Socket-level failures: connect, read, write, timeout, peer close.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Peer sent something the protocol does not allow.
class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

void ensure(bool ok, const char* msg);

void rand_bytes(std::uint8_t* out, std::size_t n);

// Uniform in [lo, hi], inclusive.
std::uint32_t rand_uniform(std::uint32_t lo, std::uint32_t hi);

bool read_file(const std::string& path, std::string& out);
// Replaces path in one step via "<path>.tmp"; on failure path is untouched.
bool write_file(const std::string& path, const std::string& data);

// "2026-01-31 12:34:56.789", local time
std::string timestamp();

// Writes "[<timestamp>] [<tag>] <msg>" to stderr. Safe to call from any thread.
void log_line(const char* tag, const std::string& msg);

} // namespace reverso
