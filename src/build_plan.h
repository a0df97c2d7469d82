#pragma once

#include "bl_release.h"
#include "engine_config.h"
#include "errors.h"
#include "fetch.h"
#include "package_index.h"
#include "requirement.h"
#include "resolver.h"
#include "wheel_selector.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blext {

// One (release group, platform) combination and everything learned about it.
struct target_plan {
  resolve_target target;
  std::optional<resolution> resolved;
  std::vector<selected_wheel> wheels;              // one per resolved package that has one
  std::vector<std::filesystem::path> wheel_paths;  // filled by download_plan
  std::vector<error_record> errors;

  bool ok() const { return errors.empty(); }
};

struct group_plan {
  release_group group;
  std::string name;  // group.name()
  std::vector<target_plan> targets;

  bool ok() const;
  std::vector<std::string> wheel_filenames() const;
  // Filename under wheels/ -> cached file. Wheels with equal content share one cached file.
  std::map<std::string, std::filesystem::path> wheel_files() const;
};

struct build_plan {
  std::vector<group_plan> groups;

  bool ok() const;
  std::size_t target_count() const;
  std::size_t failed_target_count() const;
};

// Release groups for cfg's Blender range and platforms. Groups are split per Blender line
// when deps vary by line. Throws config_error when no official release is in range.
std::vector<release_group> plan_release_groups(engine_config const &cfg,
                                               std::vector<dependency_spec> const &deps);

// Resolves and selects wheels for every target on a bounded worker pool. Per-target
// failures are recorded in that target; index queries are memoized across targets.
build_plan make_build_plan(engine_config const &cfg,
                           package_index &index,
                           std::string const &project_name,
                           std::vector<dependency_spec> const &deps);

// Downloads the wheels of every healthy target. Failures land in the targets that needed
// the wheel.
void download_plan(build_plan &plan, wheel_downloader &downloader);

}  // namespace blext
