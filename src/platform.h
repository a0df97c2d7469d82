#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace blext::platform {

// Exclusive lock on a lock file, held until destruction. Blocks other blext processes
// through fcntl and other threads of this process through a per-path mutex. The lock
// file is deleted on release.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

// rename(2); both paths must be on one filesystem. Throws std::system_error.
void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Creates an empty file if none exists. Throws std::system_error.
void touch_file(std::filesystem::path const &path);

// fsync on the directory so a just-published rename survives a crash.
void flush_directory(std::filesystem::path const &dir);

// BLEXT_CACHE_ROOT, else the platform's per-user cache directory.
std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

}  // namespace blext::platform
