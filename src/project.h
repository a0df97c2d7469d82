#pragma once

#include "bl_release.h"
#include "engine_config.h"
#include "location.h"
#include "requirement.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

// An extension project as declared in pyproject.toml or inline script metadata.
struct project {
  std::string id;  // project.name, a Python identifier
  std::string version;
  std::string pretty_name;
  std::string tagline;  // project.description
  std::string maintainer;
  std::string license;  // SPDX identifier
  std::optional<std::string> website;
  std::vector<std::string> copyright;
  std::vector<std::string> bl_tags;
  std::map<std::string, std::string> permissions;  // permission -> reason
  std::string requires_python;

  std::vector<dependency_spec> dependencies;

  bl_version blender_version_min{ 4, 2, 0 };
  std::optional<bl_version> blender_version_max;  // exclusive
  std::vector<bl_platform> platforms;             // empty: every platform Blender supports
  std::optional<os_version> min_glibc_version;
  std::optional<os_version> min_macos_version;
  std::vector<std::string> python_tags;
  std::vector<std::string> abi_tags;

  project_files files;

  // The package directory of a pyproject project; empty for scripts.
  std::filesystem::path package_dir() const;

  // Copies the target matrix and tag restrictions into cfg.
  void apply_to(engine_config &cfg) const;
};

// Parses files.spec_path and checks it against the files on disk. Every
// missing or malformed field is reported in one config_error.
project project_load(project_files const &files);

// Text between "# /// script" and "# ///", comment prefixes removed. Empty when the source
// has no block; throws config_error when it has more than one.
std::string script_metadata_block(std::string_view source);

// "blender4_2" -> "4.2"; nullopt for any other optional-dependency group.
std::optional<std::string> blender_line_from_group(std::string_view group);

}  // namespace blext
