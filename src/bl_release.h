#pragma once

#include "marker.h"
#include "pep440.h"
#include "tags.h"

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

enum class bl_platform { LINUX_X64, LINUX_ARM64, MACOS_X64, MACOS_ARM64, WINDOWS_X64, WINDOWS_ARM64 };

std::vector<bl_platform> const &all_bl_platforms();

std::string_view bl_platform_name(bl_platform p);  // "linux-x64", as in blender_manifest.toml
std::optional<bl_platform> bl_platform_parse(std::string_view name);

os_family bl_platform_os(bl_platform p);
cpu_arch bl_platform_arch(bl_platform p);

// Values of the PEP 508 platform_machine marker a wheel for this platform may see.
std::vector<std::string> const &bl_platform_machines(bl_platform p);

// Blender release number M.m.p
struct bl_version {
  int major{ 0 };
  int minor{ 0 };
  int patch{ 0 };

  // Accepts "4.2" (patch 0) and "4.2.3". Throws std::invalid_argument.
  static bl_version parse(std::string_view text);

  std::string str() const;   // "4.2.3"
  std::string line() const;  // "4.2"

  auto operator<=>(bl_version const &) const = default;
};

// A package Blender ships in its own site-packages.
struct reference_pin {
  std::string package;  // canonical
  pep440::version version;
  std::vector<bl_platform> platforms;
};

struct bl_release {
  bl_version version;
  std::string python_version;  // full, e.g. "3.11.7"
  os_version min_glibc;
  os_version min_macos;
  std::vector<bl_platform> platforms;
  std::vector<std::string> python_tags;
  std::vector<std::string> abi_tags;
  std::vector<std::string> manifest_versions;
  std::vector<std::string> extension_tags;
  std::vector<reference_pin> reference;  // sorted by package

  reference_pin const *find_pin(std::string_view package) const;
  bool supports(bl_platform p) const;

  // Optional-dependency group name for this release line, e.g. "blender4-2".
  std::string marker_extra() const;

  // CPython interpreter tag, e.g. "cp311".
  std::string interpreter_tag() const;

  // The platform tag a wheel must be compatible with; min_os_version is the release's
  // floor unless overridden.
  platform_tag target_platform(bl_platform p, std::optional<os_version> min_override = {}) const;
};

// Every official release with extension support, ascending.
std::vector<bl_release> const &official_releases();

bl_release const *find_release(bl_version const &v);

// Releases with min <= version < max_exclusive (no upper bound when unset).
std::vector<bl_release const *> releases_in_range(bl_version const &min,
                                                  std::optional<bl_version> const &max_exclusive);

// One environment per platform_machine value.
std::vector<marker_environment> marker_environments(bl_release const &release, bl_platform p);

// Consecutive releases that build to the same extension.
struct release_group {
  std::vector<bl_release const *> members;  // ascending, never empty
  std::vector<bl_platform> platforms;       // extension platforms all members support

  bl_release const &first() const { return *members.front(); }
  bl_release const &last() const { return *members.back(); }

  // "bl4_2", "bl4_2-bl4_3", "bl4_4_0": a range over [first, next release after last).
  std::string name() const;
};

// Merge neighbors whose reference pins, python/abi tags, manifest versions and
// supported subset of ext_platforms are identical.
std::vector<release_group> smoosh_releases(std::vector<bl_release const *> const &releases,
                                           std::vector<bl_platform> const &ext_platforms);

}  // namespace blext
