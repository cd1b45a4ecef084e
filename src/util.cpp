#include "reverso/util.hpp"
#include <openssl/rand.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace reverso {

void ensure(bool ok, const char* msg) {
  if (!ok) throw std::runtime_error(msg);
}

void rand_bytes(std::uint8_t* out, std::size_t n) {
  ensure(RAND_bytes(out, (int)n) == 1, "RAND_bytes failed");
}

std::uint32_t rand_uniform(std::uint32_t lo, std::uint32_t hi) {
  ensure(lo <= hi, "rand_uniform: empty range");
  const std::uint64_t span = (std::uint64_t)hi - lo + 1;
  if (span == (std::uint64_t)1 << 32) {
    std::uint8_t b[4];
    rand_bytes(b, sizeof(b));
    return ((std::uint32_t)b[0] << 24) | ((std::uint32_t)b[1] << 16) |
           ((std::uint32_t)b[2] << 8) | (std::uint32_t)b[3];
  }

  // Reject the top partial bucket so every value in the span is equally likely.
  const std::uint64_t limit = ((std::uint64_t)1 << 32) - (((std::uint64_t)1 << 32) % span);
  for (;;) {
    std::uint8_t b[4];
    rand_bytes(b, sizeof(b));
    std::uint64_t v = ((std::uint64_t)b[0] << 24) | ((std::uint64_t)b[1] << 16) |
                      ((std::uint64_t)b[2] << 8) | (std::uint64_t)b[3];
    if (v < limit) return lo + (std::uint32_t)(v % span);
  }
}

bool read_file(const std::string& path, std::string& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  f.seekg(0, std::ios::end);
  std::streamsize n = f.tellg();
  if (n < 0) return false;
  f.seekg(0, std::ios::beg);
  out.resize((std::size_t)n);
  if (n > 0) f.read(&out[0], n);
  return (bool)f;
}

bool write_file(const std::string& path, const std::string& data) {
  // Written beside the target and renamed over it, so path is never left half written.
  const std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    if (!data.empty()) f.write(data.data(), (std::streamsize)data.size());
    f.close();
    if (!f) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t secs = system_clock::to_time_t(now);
  const long ms = (long)(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

  std::tm tm{};
  localtime_r(&secs, &tm);

  char buf[32];
  std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  std::snprintf(buf + n, sizeof(buf) - n, ".%03ld", ms);
  return buf;
}

void log_line(const char* tag, const std::string& msg) {
  // Never destroyed: a detached worker may still log while statics are torn down.
  static std::mutex& mu = *new std::mutex;
  const std::string ts = timestamp();
  std::lock_guard<std::mutex> lock(mu);
  std::cerr << "[" << ts << "] [" << tag << "] " << msg << std::endl;
}

} // namespace reverso
