#pragma once

#include "cache.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace blext {

// A project directory, its pyproject.toml, or a single-file script.
struct path_location {
  std::filesystem::path path;
};

// A script (*.py) or a project archive served over http(s).
struct url_location {
  std::string url;
};

struct git_location {
  std::string url;
  std::string ref{ "main" };
};

// A zip or tarball holding a project, on the local disk.
struct packed_location {
  std::filesystem::path archive;
};

using project_location = std::variant<path_location, url_location, git_location, packed_location>;

// "git+https://host/repo.git@v1.2", "https://host/addon.py", "addon.zip", "." and so on.
// Throws config_error.
project_location parse_location(std::string_view text);

std::string location_str(project_location const &loc);

struct project_files {
  std::filesystem::path root;
  std::filesystem::path spec_path;  // pyproject.toml or the script

  bool is_script() const { return spec_path.extension() == ".py"; }
};

// Finds pyproject.toml or the script in a local directory or file. Throws config_error.
project_files find_project_files(std::filesystem::path const &path);

// Materializes remote and packed locations under the cache's projects/ area, then finds
// the project inside. Throws config_error or download_error.
project_files locate(project_location const &loc, cache &c);

}  // namespace blext
