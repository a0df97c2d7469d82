#pragma once

#include "libcurl_util.h"
#include "package_index.h"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace blext {

// Defined at namespace scope so its default member initializers are usable
// in pypi_index's default constructor argument (GCC rejects the nested form).
struct pypi_retry_policy {
  int attempts{ 3 };
  std::chrono::milliseconds backoff{ 500 };
};

// Package index backed by the PyPI JSON API (<base>/pypi/<name>/json and
// <base>/pypi/<name>/<version>/json).
// Transport failures, 429 and 5xx responses are retried with doubling backoff.
class pypi_index : public package_index {
 public:
  using http_get_fn = std::function<http_response(std::string_view url)>;

  using retry_policy = pypi_retry_policy;

  explicit pypi_index(std::string base_url,
                      http_get_fn get = libcurl_get,
                      retry_policy retry = {});

  std::vector<pep440::version> versions(std::string_view package) override;
  index_release release(std::string_view package, pep440::version const &version) override;

 private:
  std::string fetch(std::string const &url, std::string_view what);

  std::string base_url_;
  http_get_fn get_;
  retry_policy retry_;
};

// Response parsers. Throw index_error on malformed documents.
std::vector<pep440::version> pypi_parse_versions(std::string_view package,
                                                 std::string_view json_text);
index_release pypi_parse_release(std::string_view package, std::string_view json_text);

}  // namespace blext
