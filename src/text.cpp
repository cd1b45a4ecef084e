#include "reverso/text.hpp"
#include "reverso/util.hpp"
#include <algorithm>
#include <limits>

namespace reverso {

bool is_printable_ascii(std::string_view text) {
  for (char c : text) {
    const unsigned char u = (unsigned char)c;
    if (u < 0x20 || u > 0x7E) return false;
  }
  return true;
}

bool is_ascii(const Bytes& data) {
  return std::all_of(data.begin(), data.end(), [](std::uint8_t b) { return b < 0x80; });
}

std::vector<std::string> split_chunks(std::string_view text,
                                      std::uint32_t lmin, std::uint32_t lmax,
                                      const LengthPicker& pick) {
  ensure(lmin > 0 && lmin <= lmax, "invalid chunk size range");

  std::vector<std::string> chunks;
  std::size_t off = 0;
  while (off < text.size()) {
    std::uint32_t want = pick(lmin, lmax);
    ensure(want >= lmin && want <= lmax, "chunk length out of range");
    std::size_t len = std::min<std::size_t>(want, text.size() - off);
    chunks.emplace_back(text.substr(off, len));
    off += len;
  }
  ensure(chunks.size() <= (std::numeric_limits<std::uint32_t>::max)(), "too many chunks");
  return chunks;
}

std::vector<std::string> split_chunks(std::string_view text,
                                      std::uint32_t lmin, std::uint32_t lmax) {
  return split_chunks(text, lmin, lmax, rand_uniform);
}

Bytes reverse_bytes(const Bytes& data) {
  return Bytes(data.rbegin(), data.rend());
}

std::string join_chunks(const std::vector<std::optional<std::string>>& parts) {
  std::size_t total = 0;
  for (const auto& p : parts) {
    ensure(p.has_value(), "missing chunk result");
    total += p->size();
  }
  std::string out;
  out.reserve(total);
  for (const auto& p : parts) out += *p;
  return out;
}

std::string derive_output_path(const std::string& input_path) {
  const std::size_t slash = input_path.find_last_of('/');
  const std::size_t base = (slash == std::string::npos) ? 0 : slash + 1;

  // Leading dots belong to the name (".profile" has no extension).
  std::size_t first = base;
  while (first < input_path.size() && input_path[first] == '.') ++first;

  std::size_t dot = input_path.find_last_of('.');
  std::string stem = input_path;
  if (dot != std::string::npos && dot > first && first < input_path.size()) {
    stem = input_path.substr(0, dot);
  }
  return stem + "_reversed.txt";
}

} // namespace reverso
