#pragma once

#include "build_plan.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace blext {

struct report_row {
  std::string package;
  std::string version;
  std::vector<std::string> platforms;
  std::uint64_t size{ 0 };  // distinct wheels over all platforms
};

struct report_error {
  std::string target;
  error_record error;
};

struct group_report {
  std::string name;
  std::string blender_version_min;
  std::string blender_version_last;
  std::vector<std::string> platforms;
  std::vector<report_row> rows;     // by package, then version
  std::vector<std::string> bundled;  // "numpy 1.26.4", Blender's own copies in use
  std::uint64_t total_size{ 0 };
  std::vector<report_error> errors;
};

// Read-only projection of a plan.
std::vector<group_report> make_report(build_plan const &plan);

std::string report_text(build_plan const &plan);
nlohmann::json report_json(build_plan const &plan);

// Every collected error, one per line prefixed by its target. Empty when the plan is ok.
std::string report_errors_text(build_plan const &plan);

}  // namespace blext
