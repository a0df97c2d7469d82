#pragma once

#include "pep440.h"
#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

// One wheel file published for a release.
struct index_file {
  std::string filename;
  std::string url;
  std::uint64_t size{ 0 };
  std::string sha256;
};

struct index_release {
  std::string package;  // canonical
  std::string version;
  std::vector<std::string> requires_dist;  // raw PEP 508 strings
  std::string requires_python;
  bool yanked{ false };
  std::vector<index_file> files;  // wheels only
};

// Queryable package index. Implementations throw index_error for unknown packages or
// releases and download_error for transport failures.
class package_index : uncopyable {
 public:
  virtual ~package_index() = default;

  // Every published version, in any order; unparseable versions are dropped.
  virtual std::vector<pep440::version> versions(std::string_view package) = 0;

  virtual index_release release(std::string_view package, pep440::version const &version) = 0;
};

// Memoizes one resolution run's queries. Safe for concurrent use: the first caller for a
// key queries the source while later callers for that key wait and reuse its answer.
class index_memo : public package_index {
 public:
  explicit index_memo(package_index &source);

  std::vector<pep440::version> versions(std::string_view package) override;
  index_release release(std::string_view package, pep440::version const &version) override;

 private:
  template <typename value_t, typename compute_t>
  static std::shared_ptr<value_t const> memoize(
      tbb::concurrent_hash_map<std::string, std::shared_ptr<value_t const>> &map,
      std::string const &key,
      bool &memo_hit,
      compute_t &&compute);

  package_index &source_;
  tbb::concurrent_hash_map<std::string, std::shared_ptr<std::vector<pep440::version> const>>
      versions_;
  tbb::concurrent_hash_map<std::string, std::shared_ptr<index_release const>> releases_;
};

}  // namespace blext
