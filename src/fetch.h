#pragma once

#include "cache.h"
#include "engine_config.h"
#include "errors.h"
#include "tags.h"
#include "util.h"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace blext {

// Transport for one wheel. Implementations throw download_error; the downloader owns
// retries and hash checks.
class wheel_fetcher : unmovable {
 public:
  virtual ~wheel_fetcher() = default;
  virtual void fetch(std::string const &url,
                     std::filesystem::path const &destination,
                     std::atomic_bool const *cancel) = 0;
};

class libcurl_fetcher final : public wheel_fetcher {
 public:
  void fetch(std::string const &url,
             std::filesystem::path const &destination,
             std::atomic_bool const *cancel) override;
};

// The wheels one target needs.
struct download_job {
  std::string target;
  std::vector<wheel_descriptor> wheels;
};

struct download_result {
  std::string target;
  std::vector<std::filesystem::path> wheel_paths;  // parallel to the job's wheels
  std::vector<error_record> errors;               // empty when every wheel arrived

  bool ok() const { return errors.empty(); }
};

// Materializes wheels into the cache with a bounded worker pool. Identical content
// (same sha256) is fetched once per run no matter how many targets need it.
class wheel_downloader : unmovable {
 public:
  wheel_downloader(engine_config const &cfg,
                   cache &c,
                   wheel_fetcher &fetcher,
                   std::atomic_bool const *cancel = nullptr);

  // Never throws for per-wheel failures; they land in the affected targets' errors.
  std::vector<download_result> run(std::vector<download_job> const &jobs);

  // One wheel with retries. Throws download_error, integrity_error or index_error.
  std::filesystem::path materialize(wheel_descriptor const &wheel);

 private:
  bool cancelled() const;
  void fetch_with_retries(wheel_descriptor const &wheel, std::filesystem::path const &dest);

  engine_config const &cfg_;
  cache &cache_;
  wheel_fetcher &fetcher_;
  std::atomic_bool const *cancel_;
};

}  // namespace blext
