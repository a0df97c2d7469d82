#pragma once

#include "bl_release.h"
#include "project.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

// blender_manifest.toml for one release group.
struct bl_manifest {
  std::string schema_version{ "1.0.0" };
  std::string id;
  std::string version;
  std::string name;
  std::string tagline;
  std::string maintainer;
  std::string type{ "add-on" };
  std::optional<std::string> website;
  std::vector<std::string> tags;
  std::string blender_version_min;
  std::optional<std::string> blender_version_max;  // exclusive
  std::vector<std::string> license;                // "SPDX:GPL-3.0-or-later"
  std::vector<std::string> copyright;
  std::vector<std::string> platforms;
  std::vector<std::string> wheels;  // "./wheels/<filename>", sorted
  std::map<std::string, std::string> permissions;

  // Throws config_error naming every field Blender would refuse to load.
  void validate() const;

  std::string to_toml() const;
};

// Manifest of the extension built for group. Wheel filenames may repeat across
// platforms; each is listed once.
bl_manifest make_manifest(project const &p,
                          release_group const &group,
                          std::vector<std::string> const &wheel_filenames);

// Log settings baked into the extension as init_settings.toml.
enum class release_profile { TEST, DEV, RELEASE, RELEASE_DEBUG };

std::string_view release_profile_name(release_profile profile);  // "release-debug"
std::optional<release_profile> release_profile_parse(std::string_view name);

std::string release_profile_init_settings(release_profile profile);

}  // namespace blext
