#include "platform.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <mutex>
#include <string>
#include <system_error>

namespace blext::platform {

namespace {

[[noreturn]] void throw_errno(int err, std::string const &what) {
  throw std::system_error(err, std::system_category(), what);
}

// fcntl locks belong to the process, so threads contending for one cache entry are
// serialized here. Entries are never erased; the set of lock paths per run is small.
std::mutex &mutex_for(std::filesystem::path const &lock_path) {
  static std::mutex registry_mutex;
  static std::map<std::string, std::unique_ptr<std::mutex>> registry;

  auto const key{ std::filesystem::absolute(lock_path).lexically_normal().string() };
  std::lock_guard const guard{ registry_mutex };
  auto &slot{ registry[key] };
  if (!slot) { slot = std::make_unique<std::mutex>(); }
  return *slot;
}

}  // namespace

struct file_lock::impl {
  int fd{ -1 };
  std::unique_lock<std::mutex> in_process;
  std::filesystem::path lock_path;
};

file_lock::file_lock(std::filesystem::path const &path) {
  std::unique_lock in_process{ mutex_for(path) };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) { throw_errno(errno, "cannot open lock file " + path.string()); }

  struct flock whole_file{};
  whole_file.l_type = F_WRLCK;
  whole_file.l_whence = SEEK_SET;
  while (::fcntl(fd, F_SETLKW, &whole_file) == -1) {
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw_errno(err, "cannot lock " + path.string());
  }

  impl_ = std::make_unique<impl>(
      impl{ .fd = fd, .in_process = std::move(in_process), .lock_path = path });
}

file_lock::~file_lock() {
  if (!impl_) { return; }
  std::error_code ec;
  std::filesystem::remove(impl_->lock_path, ec);  // best effort; a stale file is harmless
  ::close(impl_->fd);
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (std::rename(from.c_str(), to.c_str()) != 0) {
    throw_errno(errno, "cannot rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644) };
  if (fd == -1) { throw_errno(errno, "cannot create " + path.string()); }
  ::close(fd);
}

void flush_directory(std::filesystem::path const &dir) {
  int const fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
  if (fd == -1) { throw_errno(errno, "cannot open directory " + dir.string()); }
  int const rc{ ::fsync(fd) };
  int const err{ errno };
  ::close(fd);
  if (rc != 0 && err != EINVAL) { throw_errno(err, "cannot sync " + dir.string()); }
}

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *root{ std::getenv("BLEXT_CACHE_ROOT") }) { return std::filesystem::path{ root }; }
#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "blext";
  }
#else
  if (char const *xdg{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg } / "blext";
  }
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "blext";
  }
#endif
  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "BLEXT_CACHE_ROOT or HOME";
#else
  return "BLEXT_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

}  // namespace blext::platform
