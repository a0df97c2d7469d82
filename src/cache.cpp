#include "cache.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <sstream>
#include <system_error>

using path = std::filesystem::path;

namespace blext {

struct cache_impl {
  path root_;

  path wheels_dir() const { return root_ / "wheels"; }
  path projects_dir() const { return root_ / "projects"; }
  path locks_dir() const { return root_ / "locks"; }
};

struct cache::impl : cache_impl {};

struct cache::scoped_entry_lock::impl {
  path entry_dir_;
  platform::file_lock lock_;
  path lock_path_;
  std::string key_;
  std::chrono::steady_clock::time_point lock_acquired_time{};
  bool published_{ false };

  impl(path entry_dir,
       platform::file_lock lock,
       path lock_path,
       std::string key,
       std::chrono::steady_clock::time_point lock_acquired_at)
      : entry_dir_{ std::move(entry_dir) },
        lock_{ std::move(lock) },
        lock_path_{ std::move(lock_path) },
        key_{ std::move(key) },
        lock_acquired_time{ lock_acquired_at } {}

  path payload_dir() const { return entry_dir_ / "payload"; }
  path stage_dir() const { return entry_dir_ / "stage"; }

  void publish() {
    platform::atomic_rename(stage_dir(), payload_dir());
    platform::touch_file(entry_dir_ / "blext-complete");
    platform::flush_directory(entry_dir_);
    published_ = true;
    tui::debug("cache: published %s", entry_dir_.string().c_str());
  }
};

}  // namespace blext

namespace {

void remove_all_noexcept(path const &target) {
  std::error_code ec;
  std::filesystem::remove_all(target, ec);
  if (ec) {
    blext::tui::error("Failed to remove %s: %s", target.string().c_str(), ec.message().c_str());
  }
}

blext::cache::ensure_result ensure_entry(blext::cache_impl &impl,
                                         path const &entry_dir,
                                         path const &lock_path,
                                         std::string_view key) {
  blext::cache::ensure_result result{ entry_dir, entry_dir / "payload", nullptr };

  if (blext::cache::is_entry_complete(entry_dir)) {
    BLEXT_TRACE_CACHE_HIT(std::string(key), result.payload_path.string(), true);
    return result;
  }

  std::filesystem::create_directories(impl.locks_dir());
  std::filesystem::create_directories(entry_dir);

  auto const lock_wait_start{ std::chrono::steady_clock::now() };
  blext::platform::file_lock lock{ lock_path };
  auto const wait_duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - lock_wait_start)
                                   .count() };
  BLEXT_TRACE_LOCK_ACQUIRED(std::string(key), lock_path.string(), wait_duration_ms);

  // Another writer may have finished while we waited.
  if (blext::cache::is_entry_complete(entry_dir)) {
    BLEXT_TRACE_CACHE_HIT(std::string(key), result.payload_path.string(), false);
    return result;
  }

  BLEXT_TRACE_CACHE_MISS(std::string(key));
  result.lock = blext::cache::scoped_entry_lock::make(entry_dir,
                                                      std::move(lock),
                                                      lock_path,
                                                      std::string{ key },
                                                      std::chrono::steady_clock::now());
  return result;
}

}  // namespace

namespace blext {

cache::scoped_entry_lock::scoped_entry_lock(path entry_dir,
                                            platform::file_lock lock,
                                            path lock_path,
                                            std::string key,
                                            std::chrono::steady_clock::time_point lock_acquired_at)
    : m{ std::make_unique<impl>(std::move(entry_dir),
                                std::move(lock),
                                std::move(lock_path),
                                std::move(key),
                                lock_acquired_at) } {
  // Leftovers from an interrupted writer are never trusted.
  remove_all_noexcept(m->stage_dir());
  remove_all_noexcept(m->payload_dir());
  std::filesystem::create_directories(m->stage_dir());
}

cache::scoped_entry_lock::~scoped_entry_lock() {
  auto const hold_duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - m->lock_acquired_time)
                                   .count() };

  if (!m->published_) {
    tui::debug("cache: discarding incomplete %s", m->entry_dir_.string().c_str());
    remove_all_noexcept(m->stage_dir());
  }

  BLEXT_TRACE_LOCK_RELEASED(m->key_, m->lock_path_.string(), hold_duration_ms);
}

cache::scoped_entry_lock::ptr_t cache::scoped_entry_lock::make(
    path entry_dir,
    platform::file_lock lock_handle,
    path lock_path,
    std::string key,
    std::chrono::steady_clock::time_point lock_acquired_at) {
  return ptr_t{ new scoped_entry_lock{ std::move(entry_dir),
                                       std::move(lock_handle),
                                       std::move(lock_path),
                                       std::move(key),
                                       lock_acquired_at } };
}

void cache::scoped_entry_lock::publish() {
  if (m->published_) { return; }
  try {
    m->publish();
  } catch (std::exception const &) {
    remove_all_noexcept(m->stage_dir());
    remove_all_noexcept(m->payload_dir());
    std::error_code ec;
    std::filesystem::remove(m->entry_dir_ / "blext-complete", ec);
    throw;
  }
}

bool cache::scoped_entry_lock::is_published() const { return m->published_; }

cache::path cache::scoped_entry_lock::stage_dir() const { return m->stage_dir(); }

cache::cache(std::optional<std::filesystem::path> root) : m{ std::make_unique<impl>() } {
  if (std::optional<path> maybe_root{ root ? root : platform::get_default_cache_root() }) {
    m->root_ = *maybe_root;
    return;
  }

  std::ostringstream oss;
  oss << "Unable to determine default cache root: "
      << platform::get_default_cache_root_env_vars() << " not set";
  throw config_error(oss.str());
}

cache::~cache() = default;

path const &cache::root() const { return m->root_; }

bool cache::is_entry_complete(path const &entry_dir) {
  return std::filesystem::exists(entry_dir / "blext-complete");
}

cache::ensure_result cache::ensure_wheel(std::string_view sha256) {
  std::string const key{ sha256 };
  return ensure_entry(*m, m->wheels_dir() / key, m->locks_dir() / ("wheel." + key + ".lock"), key);
}

cache::ensure_result cache::ensure_project(std::string_view key) {
  std::string const k{ key };
  return ensure_entry(*m, m->projects_dir() / k, m->locks_dir() / ("project." + k + ".lock"), k);
}

}  // namespace blext
