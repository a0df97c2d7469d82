#pragma once

#include "bl_release.h"
#include "tags.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blext {

// Everything the resolver, selector and orchestrator need to know about the run. Built
// once from project settings and command-line flags; passed by const reference.
struct engine_config {
  bl_version blender_version_min{ 4, 2, 0 };
  std::optional<bl_version> blender_version_max;  // exclusive
  std::vector<bl_platform> platforms;

  // Override the release floors when set.
  std::optional<os_version> min_glibc_version;
  std::optional<os_version> min_macos_version;

  // Restrict the release's valid tags when non-empty.
  std::vector<std::string> python_tags;
  std::vector<std::string> abi_tags;

  bool allow_prereleases{ false };
  int resolve_max_attempts{ 20000 };  // candidate versions tried per target before giving up

  std::filesystem::path cache_root;
  std::string index_url{ "https://pypi.org" };
  unsigned worker_count{ 8 };
  int download_attempts{ 3 };
  std::chrono::milliseconds retry_backoff{ 500 };

  platform_tag target_platform(bl_release const &release, bl_platform p) const {
    switch (bl_platform_os(p)) {
      case os_family::LINUX: return release.target_platform(p, min_glibc_version);
      case os_family::MACOS: return release.target_platform(p, min_macos_version);
      case os_family::WINDOWS: return release.target_platform(p);
    }
    return release.target_platform(p);
  }

  std::vector<std::string> valid_python_tags(bl_release const &release) const {
    return restrict_tags(release.python_tags, python_tags);
  }
  std::vector<std::string> valid_abi_tags(bl_release const &release) const {
    return restrict_tags(release.abi_tags, abi_tags);
  }

 private:
  static std::vector<std::string> restrict_tags(std::vector<std::string> const &valid,
                                                std::vector<std::string> const &wanted) {
    if (wanted.empty()) { return valid; }
    std::vector<std::string> out;
    for (auto const &tag : valid) {
      if (std::ranges::find(wanted, tag) != wanted.end()) { out.push_back(tag); }
    }
    return out;
  }
};

}  // namespace blext
