#pragma once

#include "marker.h"
#include "pep440.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

// PEP 503 normalization: lowercase, runs of '-', '_' and '.' collapse to '-'.
std::string canonicalize_name(std::string_view name);

// PEP 508 dependency specifier: name[extras] specifiers ; marker
struct requirement {
  std::string name;  // canonical
  std::string display_name;
  std::vector<std::string> extras;  // canonical, sorted
  pep440::specifier_set specifiers;
  std::optional<marker> env_marker;
  std::string url;  // direct reference "name @ url"

  // Throws std::invalid_argument on malformed input.
  static requirement parse(std::string_view text);

  // True if the marker is absent or holds in any of the environments.
  bool applies_to(std::vector<marker_environment> const &envs) const;

  std::string str() const;
};

// A project dependency: the default requirement plus per-Blender-line replacements
// (keyed "4.2", "4.3", ...).
struct dependency_spec {
  requirement req;
  std::map<std::string, requirement, std::less<>> blender_overrides;

  requirement const &for_blender_line(std::string_view line) const;
};

}  // namespace blext
