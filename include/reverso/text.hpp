#pragma once
#include "reverso.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reverso {

// Picks a length in [lo, hi], inclusive.
using LengthPicker = std::function<std::uint32_t(std::uint32_t lo, std::uint32_t hi)>;

// Every character in 0x20..0x7E.
bool is_printable_ascii(std::string_view text);

// Every byte below 0x80.
bool is_ascii(const Bytes& data);

// Splits text into consecutive chunks whose lengths come from pick(lmin, lmax);
// the final chunk holds whatever remains. Empty text yields no chunks.
std::vector<std::string> split_chunks(std::string_view text,
                                      std::uint32_t lmin, std::uint32_t lmax,
                                      const LengthPicker& pick);

// Same, with lengths drawn by rand_uniform.
std::vector<std::string> split_chunks(std::string_view text,
                                      std::uint32_t lmin, std::uint32_t lmax);

Bytes reverse_bytes(const Bytes& data);

// Concatenates in index order. Throws if any slot is unset.
std::string join_chunks(const std::vector<std::optional<std::string>>& parts);

// "dir/notes.txt" -> "dir/notes_reversed.txt"
std::string derive_output_path(const std::string& input_path);

} // namespace reverso
