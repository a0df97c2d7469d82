#pragma once

#include "bl_release.h"
#include "engine_config.h"
#include "package_index.h"
#include "requirement.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

// One (Blender release, platform) combination to resolve for. Python/ABI come from the
// release.
struct resolve_target {
  bl_release const *release;
  bl_platform platform;
  std::string label;  // "bl4_2 linux-x64", used in errors and reports
};

struct resolved_package {
  std::string package;  // canonical
  pep440::version version;
  std::vector<std::string> extras;
  std::vector<std::string> required_by;  // requirer labels, in discovery order
  index_release metadata;
};

struct resolution {
  std::string target;
  std::vector<resolved_package> packages;    // sorted by name; never a reference package
  std::vector<reference_pin> reference_used;  // bundled packages something asked for
};

// Resolves a project's dependencies for one target at a time. Sequential per call;
// separate calls may run concurrently when they share a thread-safe index (index_memo).
class resolver {
 public:
  resolver(engine_config const &cfg, package_index &index);

  // Throws reference_conflict_error, resolution_conflict_error, index_error,
  // download_error or config_error.
  resolution resolve(std::string const &project_name,
                     std::vector<dependency_spec> const &deps,
                     resolve_target const &target) const;

  // First official release after `after` whose pin for package satisfies spec.
  static std::optional<bl_version> release_admitting(std::string_view package,
                                                     pep440::specifier_set const &spec,
                                                     bl_version const &after);

 private:
  engine_config const &cfg_;
  package_index &index_;
};

}  // namespace blext
