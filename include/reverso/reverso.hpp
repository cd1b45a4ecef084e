#pragma once
#include <cstdint>
#include <vector>

namespace reverso {
using Bytes = std::vector<std::uint8_t>;
} // namespace reverso
