#include "errors.h"
#include "package_index.h"
#include "pypi_index.h"

#include <doctest/doctest.h>

#include <tbb/parallel_for.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

using namespace blext;

namespace {

class counting_index : public package_index {
 public:
  std::vector<pep440::version> versions(std::string_view package) override {
    ++version_calls;
    if (package == "missing") { throw index_error("missing not found"); }
    return { pep440::version{ "1.0" }, pep440::version{ "2.0" } };
  }

  index_release release(std::string_view package, pep440::version const &version) override {
    ++release_calls;
    return { .package = std::string{ package }, .version = version.str() };
  }

  std::atomic_int version_calls{ 0 };
  std::atomic_int release_calls{ 0 };
};

constexpr char kPackageDoc[]{ R"({
  "info": { "name": "SciPy", "version": "1.15.2" },
  "releases": {
    "1.14.0": [ { "filename": "scipy-1.14.0-cp311-cp311-win_amd64.whl" } ],
    "1.15.2": [ { "filename": "scipy-1.15.2.tar.gz" },
                { "filename": "scipy-1.15.2-cp311-cp311-win_amd64.whl" } ],
    "0.9": [ { "filename": "scipy-0.9.tar.gz" } ],
    "bogus version": [ { "filename": "scipy-bogus-py3-none-any.whl" } ],
    "2.0.0": []
  }
})" };

constexpr char kReleaseDoc[]{ R"({
  "info": {
    "name": "scipy",
    "version": "1.15.2",
    "requires_dist": [ "numpy<2.5,>=1.23.5", "pytest; extra == \"test\"" ],
    "requires_python": ">=3.10",
    "yanked": false
  },
  "urls": [
    { "filename": "scipy-1.15.2.tar.gz", "url": "https://files/scipy.tar.gz", "size": 5,
      "digests": { "sha256": "aa" } },
    { "filename": "scipy-1.15.2-cp311-cp311-win_amd64.whl", "url": "https://files/a.whl",
      "size": 41000000, "digests": { "sha256": "bb" } },
    { "filename": "scipy-1.15.2-cp311-cp311-macosx_14_0_arm64.whl", "url": "https://files/b.whl",
      "size": 22000000, "digests": { "sha256": "cc" }, "yanked": true }
  ]
})" };

}  // namespace

TEST_CASE("index_memo queries the source once per key") {
  counting_index source;
  index_memo memo{ source };

  CHECK(memo.versions("NumPy").size() == 2);
  CHECK(memo.versions("numpy").size() == 2);
  CHECK(source.version_calls == 1);

  pep440::version const v{ "1.0" };
  CHECK(memo.release("numpy", v).version == "1.0");
  CHECK(memo.release("NumPy", pep440::version{ "1.0" }).version == "1.0");
  CHECK(memo.release("numpy", pep440::version{ "2.0" }).version == "2.0");
  CHECK(source.release_calls == 2);
}

TEST_CASE("index_memo does not cache failures") {
  counting_index source;
  index_memo memo{ source };
  CHECK_THROWS_AS(memo.versions("missing"), index_error);
  CHECK_THROWS_AS(memo.versions("missing"), index_error);
  CHECK(source.version_calls == 2);
}

TEST_CASE("index_memo coalesces concurrent queries") {
  counting_index source;
  index_memo memo{ source };
  std::atomic_int total{ 0 };
  tbb::parallel_for(0, 64, [&](int) { total += static_cast<int>(memo.versions("scipy").size()); });
  CHECK(total == 128);
  CHECK(source.version_calls == 1);
}

TEST_CASE("pypi_parse_versions keeps versions with wheels") {
  auto const versions{ pypi_parse_versions("scipy", kPackageDoc) };
  REQUIRE(versions.size() == 2);
  std::vector<std::string> strs;
  for (auto const &v : versions) { strs.push_back(v.str()); }
  CHECK(std::ranges::find(strs, "1.14.0") != strs.end());
  CHECK(std::ranges::find(strs, "1.15.2") != strs.end());
}

TEST_CASE("pypi_parse_release extracts metadata and unyanked wheels") {
  auto const rel{ pypi_parse_release("SciPy", kReleaseDoc) };
  CHECK(rel.package == "scipy");
  CHECK(rel.version == "1.15.2");
  CHECK(rel.requires_python == ">=3.10");
  CHECK_FALSE(rel.yanked);
  CHECK(rel.requires_dist.size() == 2);
  REQUIRE(rel.files.size() == 1);
  CHECK(rel.files[0].filename == "scipy-1.15.2-cp311-cp311-win_amd64.whl");
  CHECK(rel.files[0].size == 41000000);
  CHECK(rel.files[0].sha256 == "bb");
}

TEST_CASE("pypi parsers reject malformed documents") {
  CHECK_THROWS_AS(pypi_parse_versions("x", "{ not json"), index_error);
  CHECK_THROWS_AS(pypi_parse_versions("x", R"({"info": {}})"), index_error);
  CHECK_THROWS_AS(pypi_parse_release("x", R"({"info": {}})"), index_error);
}

TEST_CASE("pypi_index builds URLs and maps HTTP status") {
  std::vector<std::string> requested;
  pypi_index index{ "https://pypi.example/", [&](std::string_view url) {
                     requested.emplace_back(url);
                     if (url.find("missing") != std::string_view::npos) {
                       return http_response{ .status = 404 };
                     }
                     if (url.find("flaky") != std::string_view::npos) {
                       return http_response{ .status = 503 };
                     }
                     if (url.ends_with("/1.15.2/json")) {
                       return http_response{ .status = 200, .body = kReleaseDoc };
                     }
                     return http_response{ .status = 200, .body = kPackageDoc };
                   },
                    { .attempts = 2, .backoff = std::chrono::milliseconds{ 1 } } };

  CHECK(index.versions("SciPy").size() == 2);
  CHECK(index.release("scipy", pep440::version{ "1.15.2" }).files.size() == 1);
  CHECK(requested ==
        std::vector<std::string>{ "https://pypi.example/pypi/scipy/json",
                                  "https://pypi.example/pypi/scipy/1.15.2/json" });

  CHECK_THROWS_AS(index.versions("missing"), index_error);
  CHECK(std::ranges::count(requested, "https://pypi.example/pypi/missing/json") == 1);
  CHECK_THROWS_AS(index.versions("flaky"), download_error);
  CHECK(std::ranges::count(requested, "https://pypi.example/pypi/flaky/json") == 2);
}

TEST_CASE("pypi_index retries transient failures before giving up") {
  int calls{ 0 };
  pypi_index::retry_policy const quick{ .attempts = 3, .backoff = std::chrono::milliseconds{ 1 } };

  SUBCASE("a transport failure then success") {
    pypi_index index{ "https://pypi.example",
                      [&](std::string_view url) {
                        if (++calls == 1) { throw download_error(std::string{ url }, "timeout"); }
                        return http_response{ .status = 200, .body = kPackageDoc };
                      },
                      quick };
    CHECK(index.versions("scipy").size() == 2);
    CHECK(calls == 2);
  }

  SUBCASE("a 503 then success") {
    pypi_index index{ "https://pypi.example",
                      [&](std::string_view) {
                        return ++calls == 1 ? http_response{ .status = 503 }
                                            : http_response{ .status = 200, .body = kReleaseDoc };
                      },
                      quick };
    CHECK(index.release("scipy", pep440::version{ "1.15.2" }).files.size() == 1);
    CHECK(calls == 2);
  }

  SUBCASE("persistent 5xx exhausts the attempts") {
    pypi_index index{ "https://pypi.example",
                      [&](std::string_view) {
                        ++calls;
                        return http_response{ .status = 502 };
                      },
                      quick };
    try {
      index.versions("scipy");
      FAIL("expected download_error");
    } catch (download_error const &e) {
      CHECK(e.attempts() == 3);
      CHECK(e.reason() == "HTTP 502");
    }
    CHECK(calls == 3);
  }

  SUBCASE("client errors are not retried") {
    pypi_index index{ "https://pypi.example",
                      [&](std::string_view) {
                        ++calls;
                        return http_response{ .status = 403 };
                      },
                      quick };
    CHECK_THROWS_AS(index.versions("scipy"), download_error);
    CHECK(calls == 1);
  }
}
