#include "package_index.h"

#include "requirement.h"
#include "trace.h"

#include <type_traits>

namespace blext {

index_memo::index_memo(package_index &source) : source_{ source } {}

template <typename value_t, typename compute_t>
std::shared_ptr<value_t const> index_memo::memoize(
    tbb::concurrent_hash_map<std::string, std::shared_ptr<value_t const>> &map,
    std::string const &key,
    bool &memo_hit,
    compute_t &&compute) {
  {
    typename std::remove_reference_t<decltype(map)>::const_accessor acc;
    if (map.find(acc, key)) {
      memo_hit = true;
      return acc->second;
    }
  }

  // insert() holds the key's write lock until acc is released, so concurrent callers for
  // the same key block here and then see the stored value.
  typename std::remove_reference_t<decltype(map)>::accessor acc;
  if (!map.insert(acc, key)) {
    memo_hit = true;
    return acc->second;
  }

  try {
    acc->second = std::make_shared<value_t const>(compute());
  } catch (...) {
    map.erase(acc);
    throw;
  }
  memo_hit = false;
  return acc->second;
}

std::vector<pep440::version> index_memo::versions(std::string_view package) {
  auto const name{ canonicalize_name(package) };
  bool memo_hit{ false };
  auto const result{ memoize(versions_, name, memo_hit, [&] { return source_.versions(name); }) };
  BLEXT_TRACE_INDEX_QUERY(name, std::string{}, memo_hit);
  return *result;
}

index_release index_memo::release(std::string_view package, pep440::version const &version) {
  auto const name{ canonicalize_name(package) };
  auto const key{ name + "==" + version.str() };
  bool memo_hit{ false };
  auto const result{ memoize(releases_, key, memo_hit, [&] {
    return source_.release(name, version);
  }) };
  BLEXT_TRACE_INDEX_QUERY(name, version.str(), memo_hit);
  return *result;
}

}  // namespace blext
