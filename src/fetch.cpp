#include "fetch.h"

#include "libcurl_util.h"
#include "sha256.h"
#include "trace.h"
#include "tui.h"

#include <tbb/parallel_for_each.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <thread>

namespace blext {

namespace {

std::string dedupe_key(wheel_descriptor const &w) { return w.sha256.empty() ? w.url : w.sha256; }

struct unit {
  wheel_descriptor const *wheel;
  std::filesystem::path path;
  std::optional<error_record> error;
};

// An existing entry may hold identical content under another filename.
std::filesystem::path published_file(std::filesystem::path const &payload_dir,
                                     std::string const &filename) {
  auto const preferred{ payload_dir / filename };
  if (std::filesystem::exists(preferred)) { return preferred; }
  for (auto const &entry : std::filesystem::directory_iterator{ payload_dir }) {
    if (entry.is_regular_file()) { return entry.path(); }
  }
  throw std::runtime_error("cache entry " + payload_dir.string() + " is empty");
}

}  // namespace

void libcurl_fetcher::fetch(std::string const &url,
                            std::filesystem::path const &destination,
                            std::atomic_bool const *cancel) {
  libcurl_download(url, destination, cancel);
}

wheel_downloader::wheel_downloader(engine_config const &cfg,
                                   cache &c,
                                   wheel_fetcher &fetcher,
                                   std::atomic_bool const *cancel)
    : cfg_{ cfg }, cache_{ c }, fetcher_{ fetcher }, cancel_{ cancel } {}

bool wheel_downloader::cancelled() const { return cancel_ && cancel_->load(); }

std::vector<download_result> wheel_downloader::run(std::vector<download_job> const &jobs) {
  std::map<std::string, unit> units;
  for (auto const &job : jobs) {
    for (auto const &w : job.wheels) { units.try_emplace(dedupe_key(w), unit{ .wheel = &w }); }
  }

  std::vector<unit *> work;
  for (auto &[key, u] : units) { work.push_back(&u); }
  tui::debug("downloader: %zu unique wheels for %zu targets", work.size(), jobs.size());

  tbb::task_arena arena{ static_cast<int>(std::max(1u, cfg_.worker_count)) };
  arena.execute([&] {
    tbb::parallel_for_each(work.begin(), work.end(), [this](unit *u) {
      try {
        u->path = materialize(*u->wheel);
      } catch (...) { u->error = describe_exception(std::current_exception()); }
    });
  });

  std::vector<download_result> results;
  for (auto const &job : jobs) {
    download_result r{ .target = job.target };
    for (auto const &w : job.wheels) {
      auto const &u{ units.at(dedupe_key(w)) };
      if (u.error) {
        r.errors.push_back(*u.error);
      } else {
        r.wheel_paths.push_back(u.path);
      }
    }
    if (!r.ok()) { r.wheel_paths.clear(); }
    results.push_back(std::move(r));
  }
  return results;
}

std::filesystem::path wheel_downloader::materialize(wheel_descriptor const &wheel) {
  if (wheel.sha256.empty()) {
    throw index_error("index publishes no sha256 for " + wheel.filename);
  }

  auto entry{ cache_.ensure_wheel(util_to_lower(wheel.sha256)) };
  if (!entry.lock) { return published_file(entry.payload_path, wheel.filename); }

  auto const staged{ entry.lock->stage_dir() / wheel.filename };
  fetch_with_retries(wheel, staged);

  auto const actual{ sha256(staged) };
  bool const matches{ [&] {
    try {
      return sha256_matches(wheel.sha256, actual);
    } catch (std::runtime_error const &) {
      return false;  // malformed published digest
    }
  }() };
  if (!matches) {
    std::error_code ec;
    std::filesystem::remove(staged, ec);
    throw integrity_error(wheel.filename, wheel.sha256, sha256_hex(actual));
  }

  try {
    entry.lock->publish();
  } catch (std::exception const &e) {
    throw download_error(wheel.url, std::string{ "cannot publish to cache: " } + e.what());
  }
  entry.lock.reset();
  return entry.payload_path / wheel.filename;
}

void wheel_downloader::fetch_with_retries(wheel_descriptor const &wheel,
                                          std::filesystem::path const &dest) {
  int const attempts{ std::max(1, cfg_.download_attempts) };
  auto backoff{ cfg_.retry_backoff };

  for (int attempt{ 1 };; ++attempt) {
    if (cancelled()) { throw download_error(wheel.url, "cancelled", attempt - 1); }

    auto const start{ std::chrono::steady_clock::now() };
    BLEXT_TRACE_DOWNLOAD_START(wheel.filename, wheel.url);
    try {
      fetcher_.fetch(wheel.url, dest, cancel_);
      auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start) };
      std::error_code ec;
      auto const bytes{ std::filesystem::file_size(dest, ec) };
      BLEXT_TRACE_DOWNLOAD_COMPLETE(wheel.filename, ec ? 0 : bytes, elapsed.count());
      tui::debug("downloaded %s", wheel.filename.c_str());
      return;
    } catch (download_error const &e) {
      if (cancelled() || attempt >= attempts) {
        throw download_error(wheel.url, e.reason(), attempt);
      }
      BLEXT_TRACE_DOWNLOAD_RETRY(wheel.filename, attempt, e.reason());
      tui::warn("%s: attempt %d of %d failed (%s); retrying in %lld ms",
                wheel.filename.c_str(),
                attempt,
                attempts,
                e.reason().c_str(),
                static_cast<long long>(backoff.count()));
    }

    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

}  // namespace blext
