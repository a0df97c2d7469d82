#pragma once

#include "pep440.h"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

enum class os_family { LINUX, MACOS, WINDOWS };

enum class cpu_arch { X64, ARM64, X86, ARMV7L, PPC64LE, S390X, RISCV64 };

enum class libc_family { NONE, GLIBC, MUSL };

std::string_view os_family_name(os_family os);  // "linux", "macos", "windows"
std::string_view cpu_arch_name(cpu_arch arch);  // "x64", "arm64", ...

// glibc or macOS version, e.g. 2.28 or 11.0
struct os_version {
  int major{ 0 };
  int minor{ 0 };

  // Accepts "2.28", "2_28", "11" (minor 0). Throws std::invalid_argument.
  static os_version parse(std::string_view text);

  std::string str() const;

  auto operator<=>(os_version const &) const = default;
};

// A concrete OS + CPU (+ libc) with an optional minimum OS/libc version. Equality and
// ordering consider only os, arch and libc.
struct platform_tag {
  os_family os;
  cpu_arch arch;
  libc_family libc{ libc_family::NONE };
  std::optional<os_version> min_os_version;

  bool operator==(platform_tag const &other) const {
    return os == other.os && arch == other.arch && libc == other.libc;
  }
  std::strong_ordering operator<=>(platform_tag const &other) const;

  std::string str() const;  // "linux-x64 glibc>=2.17"
};

// manylinux1 -> manylinux_2_5, manylinux2010 -> manylinux_2_12, manylinux2014 ->
// manylinux_2_17. The arch suffix is kept; any other tag is returned unchanged.
std::string legacy_manylinux_to_pep600(std::string_view tag);

// Parse one wheel platform component (e.g. "manylinux_2_17_x86_64", "macosx_12_0_arm64",
// "win_amd64"). Fat macOS tags expand to one entry per architecture. "any" is not a
// platform and is rejected like any other unknown form with unrecognized_tag_error.
std::vector<platform_tag> normalize_platform_tag(std::string_view raw);

// os, arch and libc match exactly; a wheel minimum requires a target minimum >= it.
bool is_compatible(platform_tag const &wheel_platform, platform_tag const &target);

// Most specific compatible tag: newest minimum version that is still <= the target's.
std::optional<platform_tag> best_platform_match(std::vector<platform_tag> const &wheel_tags,
                                                platform_tag const &target);

// Parsed "{name}-{version}(-{build})?-{py}-{abi}-{platform}.whl" plus index metadata.
struct wheel_descriptor {
  std::string filename;
  std::string package;  // canonical
  pep440::version version;
  std::string build_tag;
  std::vector<std::string> python_tags;
  std::vector<std::string> abi_tags;
  std::vector<std::string> platform_tags;  // PEP 600 normalized raw components
  std::vector<platform_tag> platforms;     // empty when platform_any
  bool platform_any{ false };
  std::uint64_t size{ 0 };
  std::string sha256;
  std::string url;

  // True when one of the wheel's (python, abi) pairs is in the valid lists and is a pair
  // the interpreter (e.g. "cp311") can load: cp311-cp311, cp3x-abi3 up to cp311,
  // cp311-none and pyX-none.
  bool admits_python(std::string_view interpreter,
                     std::vector<std::string> const &valid_python_tags,
                     std::vector<std::string> const &valid_abi_tags) const;
};

// Throws unrecognized_tag_error when the filename or every platform component is
// malformed. Unknown components of a compressed tag set are dropped.
wheel_descriptor parse_wheel_filename(std::string_view filename);

}  // namespace blext
