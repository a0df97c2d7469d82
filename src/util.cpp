#include "util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace blext {

namespace {

constexpr char kHexDigits[]{ "0123456789abcdef" };

std::string slurp(std::filesystem::path const &path, char const *who) {
  std::ifstream in{ path, std::ios::binary };
  if (!in) { throw std::runtime_error(std::string{ who } + ": failed to open file: " + path.string()); }
  std::string data{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
  if (in.bad()) { throw std::runtime_error(std::string{ who } + ": failed to read file: " + path.string()); }
  return data;
}

}  // namespace

std::string util_bytes_to_hex(void const *data, size_t length) {
  auto const *bytes{ static_cast<unsigned char const *>(data) };
  std::string hex(length * 2, '0');
  for (size_t i{}; i < length; ++i) {
    hex[2 * i] = kHexDigits[bytes[i] >> 4];
    hex[2 * i + 1] = kHexDigits[bytes[i] & 0x0f];
  }
  return hex;
}

int util_hex_char_to_int(char c) {
  auto const lower{ static_cast<char>(std::tolower(static_cast<unsigned char>(c))) };
  for (int v{ 0 }; v < 16; ++v) {
    if (kHexDigits[v] == lower) { return v; }
  }
  return -1;
}

std::vector<unsigned char> util_hex_to_bytes(std::string const &hex) {
  if (hex.size() % 2) {
    throw std::runtime_error("util_hex_to_bytes: hex string must have even length, got " +
                             std::to_string(hex.size()));
  }
  std::vector<unsigned char> bytes(hex.size() / 2);
  for (size_t i{}; i < hex.size(); ++i) {
    int const nibble{ util_hex_char_to_int(hex[i]) };
    if (nibble < 0) {
      throw std::runtime_error("util_hex_to_bytes: invalid character at position " +
                               std::to_string(i));
    }
    bytes[i / 2] = static_cast<unsigned char>(bytes[i / 2] << 4 | nibble);
  }
  return bytes;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto const data{ slurp(path, "util_load_file") };
  return { data.begin(), data.end() };
}

std::string util_load_text_file(std::filesystem::path const &path) {
  return slurp(path, "util_load_text_file");
}

void util_write_text_file(std::filesystem::path const &path, std::string_view text) {
  if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }
  std::ofstream out{ path, std::ios::binary | std::ios::trunc };
  if (out) { out.write(text.data(), static_cast<std::streamsize>(text.size())); }
  if (!out) { throw std::runtime_error("util_write_text_file: cannot write " + path.string()); }
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };
  if (bytes < 1024) { return std::to_string(bytes) + "B"; }

  double scaled{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };
  for (; scaled >= 1024.0 && unit + 1 < kUnits.size(); ++unit) { scaled /= 1024.0; }

  char buf[32];
  int const n{ std::snprintf(buf, sizeof buf, "%.2f%s", scaled, kUnits[unit]) };
  return { buf, static_cast<std::size_t>(std::max(n, 0)) };
}

std::string_view util_trim(std::string_view s) {
  constexpr std::string_view kSpace{ " \t\n\r" };
  auto const first{ s.find_first_not_of(kSpace) };
  if (first == std::string_view::npos) { return {}; }
  return s.substr(first, s.find_last_not_of(kSpace) + 1 - first);
}

std::string util_to_lower(std::string_view s) {
  std::string lowered;
  lowered.reserve(s.size());
  for (unsigned char const c : s) { lowered.push_back(static_cast<char>(std::tolower(c))); }
  return lowered;
}

std::vector<std::string> util_split(std::string_view s, char delim) {
  std::vector<std::string> fields;
  for (std::size_t pos; (pos = s.find(delim)) != std::string_view::npos; s.remove_prefix(pos + 1)) {
    fields.emplace_back(s.substr(0, pos));
  }
  fields.emplace_back(s);
  return fields;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string joined;
  for (auto const &part : parts) {
    if (&part != &parts.front()) { joined.append(sep); }
    joined.append(part);
  }
  return joined;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);  // temp trees only; leftovers are harmless
  path_.clear();
}

}  // namespace blext
