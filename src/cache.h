#pragma once

#include "platform.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace blext {

// On-disk store shared by concurrent runs. Entries are directories whose payload/ is
// published atomically; a "blext-complete" marker makes an entry valid.
class cache : unmovable {
 public:
  using path = std::filesystem::path;

  class scoped_entry_lock : unmovable {
   public:
    using ptr_t = std::unique_ptr<scoped_entry_lock>;

    static ptr_t make(path entry_dir,
                      platform::file_lock lock,
                      path lock_path,
                      std::string key,
                      std::chrono::steady_clock::time_point lock_acquired_at);
    ~scoped_entry_lock();

    // stage/ becomes payload/ and the entry is marked complete. Throws if the rename
    // fails, after removing the staged files. An unpublished entry is discarded on
    // destruction.
    void publish();
    bool is_published() const;

    path stage_dir() const;

   private:
    scoped_entry_lock(path entry_dir,
                      platform::file_lock lock,
                      path lock_path,
                      std::string key,
                      std::chrono::steady_clock::time_point lock_acquired_at);

    struct impl;
    std::unique_ptr<impl> m;
  };

  explicit cache(std::optional<path> root = std::nullopt);
  ~cache();

  path const &root() const;

  struct ensure_result {
    path entry_path;
    path payload_path;              // entry_path / "payload"
    scoped_entry_lock::ptr_t lock;  // present when the caller must populate the entry
  };

  // wheels/<sha256>; the payload holds the single wheel file.
  ensure_result ensure_wheel(std::string_view sha256);

  // projects/<key>; the payload holds a downloaded or cloned project tree.
  ensure_result ensure_project(std::string_view key);

  static bool is_entry_complete(path const &entry_dir);

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace blext
