#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace blext {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256(void const *data, size_t length);

std::string sha256_hex(sha256_t const &digest);

// Compare against an expected hex digest (case-insensitive). Throws std::runtime_error
// if expected_hex is not 64 hex characters.
bool sha256_matches(std::string_view expected_hex, sha256_t const &actual_hash);

}  // namespace blext
