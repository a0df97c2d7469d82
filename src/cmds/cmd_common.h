#pragma once

#include "build_plan.h"
#include "cache.h"
#include "engine_config.h"
#include "project.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace blext {

// Options shared by the commands that plan a project.
struct project_options {
  std::string location{ "." };
  std::vector<std::string> platforms;      // replaces tool.blext.supported_platforms
  std::optional<std::string> bl_version;   // plan for this one Blender release only
  std::string index_url{ "https://pypi.org" };
  unsigned jobs{ 8 };
  bool allow_prereleases{ false };
};

void register_project_options(CLI::App &sub, project_options &opts);

struct loaded_project {
  project proj;
  engine_config cfg;
};

// Locates and loads the project, then layers the options over its settings.
// Throws config_error or download_error.
loaded_project load_project(project_options const &opts, cache &c);

// Resolve and select for every target of the project.
build_plan plan_project(loaded_project const &lp);

// Logs every collected error; returns how many targets failed.
std::size_t log_plan_errors(build_plan const &plan);

}  // namespace blext
