#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("blext-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto const visitor{ blext::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_bytes_to_hex produces lowercase") {
  unsigned char const data[]{ 0xAB, 0xCD, 0x01 };
  CHECK(blext::util_bytes_to_hex(data, sizeof data) == "abcd01");
  CHECK(blext::util_bytes_to_hex(nullptr, 0).empty());
}

TEST_CASE("util_hex_to_bytes accepts mixed case") {
  auto const bytes{ blext::util_hex_to_bytes("aBcD01") };
  REQUIRE(bytes.size() == 3);
  CHECK(bytes[0] == 0xAB);
  CHECK(bytes[1] == 0xCD);
  CHECK(bytes[2] == 0x01);
}

TEST_CASE("util_hex_to_bytes rejects odd length and bad characters") {
  CHECK_THROWS_AS(blext::util_hex_to_bytes("abc"), std::runtime_error);
  CHECK_THROWS_WITH(blext::util_hex_to_bytes("zz"),
                    "util_hex_to_bytes: invalid character at position 0");
}

TEST_CASE("util_format_bytes") {
  CHECK(blext::util_format_bytes(0) == "0B");
  CHECK(blext::util_format_bytes(1023) == "1023B");
  CHECK(blext::util_format_bytes(1536) == "1.50KB");
  CHECK(blext::util_format_bytes(5ull * 1024 * 1024) == "5.00MB");
}

TEST_CASE("util_trim strips surrounding whitespace") {
  CHECK(blext::util_trim("  a b \t\n") == "a b");
  CHECK(blext::util_trim(" \t ").empty());
}

TEST_CASE("util_split keeps empty fields") {
  auto const parts{ blext::util_split("a..b", '.') };
  REQUIRE(parts.size() == 3);
  CHECK(parts[0] == "a");
  CHECK(parts[1].empty());
  CHECK(parts[2] == "b");
  CHECK(blext::util_split("", ',').size() == 1);
}

TEST_CASE("util_join and util_to_lower") {
  CHECK(blext::util_join({ "x", "y", "z" }, ", ") == "x, y, z");
  CHECK(blext::util_join({}, ",").empty());
  CHECK(blext::util_to_lower("NumPy-1") == "numpy-1");
}

TEST_CASE("util text file round trip creates parent directories") {
  auto const dir{ make_temp_path("text") };
  blext::scoped_path_cleanup cleanup{ dir };
  auto const file{ dir / "nested" / "f.txt" };

  blext::util_write_text_file(file, "hello\nworld");
  CHECK(blext::util_load_text_file(file) == "hello\nworld");
  CHECK(blext::util_load_file(file).size() == 11);
}

TEST_CASE("util_load_file throws for missing file") {
  CHECK_THROWS_AS(blext::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto const dir{ make_temp_path("cleanup") };
  {
    blext::scoped_path_cleanup cleanup{ dir };
    blext::util_write_text_file(dir / "a" / "b.txt", "x");
    CHECK(std::filesystem::exists(dir / "a" / "b.txt"));
  }
  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("scoped_path_cleanup reset with empty path keeps nothing") {
  auto const dir{ make_temp_path("reset") };
  blext::util_write_text_file(dir / "keep.txt", "x");
  {
    blext::scoped_path_cleanup cleanup{ dir };
    cleanup.reset();
    CHECK(cleanup.path().empty());
  }
  CHECK_FALSE(std::filesystem::exists(dir));
}
