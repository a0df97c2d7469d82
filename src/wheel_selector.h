#pragma once

#include "engine_config.h"
#include "resolver.h"
#include "tags.h"

#include <optional>
#include <string>
#include <vector>

namespace blext {

struct selected_wheel {
  wheel_descriptor wheel;
  std::optional<platform_tag> matched;  // empty for platform-independent wheels
};

// Picks one wheel per (resolved package, target). Deterministic: the candidate order is
// size, then sha256, then filename, independent of index order.
class wheel_selector {
 public:
  explicit wheel_selector(engine_config const &cfg);

  // Throws no_compatible_wheel_error. Unrecognized filenames are skipped with a warning.
  selected_wheel select(resolved_package const &pkg, resolve_target const &target) const;

  // Same, over an explicit file list and platform.
  static selected_wheel select(std::string const &package,
                               std::string const &version,
                               std::vector<index_file> const &files,
                               platform_tag const &target_platform,
                               std::string const &interpreter,
                               std::vector<std::string> const &valid_python_tags,
                               std::vector<std::string> const &valid_abi_tags,
                               std::string const &target_label);

 private:
  engine_config const &cfg_;
};

}  // namespace blext
