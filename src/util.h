#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Lowercase hex, two digits per byte.
std::string util_bytes_to_hex(void const *data, size_t length);

// Inverse of util_bytes_to_hex; either case. Throws std::runtime_error on odd length or a
// non-hex character.
std::vector<unsigned char> util_hex_to_bytes(std::string const &hex);

// 0-15, or -1 for a non-hex character.
int util_hex_char_to_int(char c);

struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Null on failure; errno is left for the caller.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Whole-file reads. Both throw std::runtime_error naming the path.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

std::string util_load_text_file(std::filesystem::path const &path);

// Creates missing parent directories and truncates any existing file.
void util_write_text_file(std::filesystem::path const &path, std::string_view text);

// 1023 -> "1023B", 1536 -> "1.50KB"; binary units up to TB.
std::string util_format_bytes(std::uint64_t bytes);

std::string_view util_trim(std::string_view s);
std::string util_to_lower(std::string_view s);

// Split on a single delimiter; empty fields are kept.
std::vector<std::string> util_split(std::string_view s, char delim);

std::string util_join(std::vector<std::string> const &parts, std::string_view sep);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace blext
