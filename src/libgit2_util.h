#pragma once

#include "util.h"

#include <filesystem>
#include <string>

namespace blext {

// RAII wrapper for libgit2 global initialization/shutdown.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

// Clone url into destination and check out ref (branch, tag or commit) as a detached
// HEAD. Tries a shallow clone first. Throws std::runtime_error.
void libgit2_clone(std::string const &url,
                   std::string const &ref,
                   std::filesystem::path const &destination);

}  // namespace blext
