#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace blext {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Hex digest over the parts, each terminated by '\n'. Order-sensitive.
std::string blake3_fingerprint(std::vector<std::string> const &parts);

}  // namespace blext
