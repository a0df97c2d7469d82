#pragma once

#include <cstdint>
#include <filesystem>

namespace blext {

struct extract_options {
  int strip_components{ 0 };
};

// Unpack any libarchive-readable archive into destination. Entries that would land
// outside destination are rejected. Returns the number of regular files written.
// Throws std::runtime_error.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options = {});

bool extract_is_archive_extension(std::filesystem::path const &path);

}  // namespace blext
