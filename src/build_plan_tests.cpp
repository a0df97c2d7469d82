#include "build_plan.h"

#include "errors.h"
#include "sha256.h"
#include "test_support.h"
#include "util.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>

using namespace blext;
using blext::test::fake_index;
using blext::test::wheel_file;

namespace {

std::vector<dependency_spec> deps_of(std::vector<std::string> const &lines) {
  std::vector<dependency_spec> out;
  for (auto const &l : lines) { out.push_back({ .req = requirement::parse(l) }); }
  return out;
}

// Serves every wheel_file() url with the bytes its sha256 was derived from.
class filename_fetcher : public wheel_fetcher {
 public:
  void fetch(std::string const &url,
             std::filesystem::path const &destination,
             std::atomic_bool const *) override {
    auto const filename{ url.substr(url.rfind('/') + 1) };
    {
      std::lock_guard const lock{ mutex_ };
      fetched.insert(filename);
      if (broken.contains(filename)) { throw download_error(url, "HTTP 404"); }
    }
    auto const body{ bodies.find(filename) };
    std::ofstream{ destination, std::ios::binary }
        << (body == bodies.end() ? filename : body->second);
  }

  std::map<std::string, std::string> bodies;  // defaults to the filename
  std::set<std::string> broken;
  std::set<std::string> fetched;

 private:
  std::mutex mutex_;
};

struct plan_fixture {
  plan_fixture() {
    cfg.blender_version_min = { 4, 2, 0 };
    cfg.blender_version_max = bl_version{ 4, 4, 0 };
    cfg.platforms = { bl_platform::LINUX_X64, bl_platform::WINDOWS_X64 };
    cfg.worker_count = 4;
    cfg.retry_backoff = std::chrono::milliseconds{ 1 };
    cfg.download_attempts = 1;

    index.add("attrs", "23.2.0");
    index.add("winonly",
              "1.0",
              { .files = { wheel_file("winonly-1.0-cp311-cp311-win_amd64.whl") } });
  }

  build_plan plan(std::vector<std::string> const &lines) {
    return make_build_plan(cfg, index, "my-addon", deps_of(lines));
  }

  engine_config cfg;
  fake_index index;
};

struct cache_dir {
  cache_dir() {
    static std::mt19937_64 rng{ std::random_device{}() };
    root = std::filesystem::temp_directory_path() / ("blext-plan-test-" + std::to_string(rng()));
    std::filesystem::create_directories(root);
    c = std::make_unique<cache>(root);
  }

  ~cache_dir() {
    c.reset();
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  std::filesystem::path root;
  std::unique_ptr<cache> c;
};

}  // namespace

TEST_CASE_FIXTURE(plan_fixture, "release groups follow the Blender lines in range") {
  auto const groups{ plan_release_groups(cfg, {}) };
  REQUIRE(groups.size() == 2);
  CHECK(groups[0].name() == "bl4_2");
  CHECK(groups[0].members.size() == 9);
  CHECK(groups[1].name() == "bl4_3");
  CHECK(groups[1].platforms == cfg.platforms);
}

TEST_CASE_FIXTURE(plan_fixture, "an empty Blender range is a config error") {
  cfg.blender_version_min = { 9, 0, 0 };
  cfg.blender_version_max.reset();
  CHECK_THROWS_AS(plan_release_groups(cfg, {}), config_error);
}

TEST_CASE_FIXTURE(plan_fixture, "groups supporting none of the platforms are dropped") {
  cfg.blender_version_max = bl_version{ 4, 2, 1 };
  cfg.platforms = { bl_platform::WINDOWS_ARM64 };
  CHECK_THROWS_AS(plan_release_groups(cfg, {}), config_error);

  cfg.blender_version_max = bl_version{ 4, 3, 0 };
  auto const groups{ plan_release_groups(cfg, {}) };
  REQUIRE(groups.size() == 1);
  CHECK(groups[0].first().version == bl_version{ 4, 2, 1 });
}

TEST_CASE_FIXTURE(plan_fixture, "every group and platform becomes a target") {
  auto const p{ plan({ "attrs>=23" }) };
  CHECK(p.ok());
  CHECK(p.target_count() == 4);
  REQUIRE(p.groups.size() == 2);

  auto const &t{ p.groups[0].targets[0] };
  CHECK(t.target.label == "bl4_2 linux-x64");
  CHECK(t.target.release == find_release({ 4, 2, 0 }));
  REQUIRE(t.resolved);
  REQUIRE(t.wheels.size() == 1);
  CHECK(t.wheels[0].wheel.package == "attrs");
  CHECK(p.groups[1].wheel_filenames() ==
        std::vector<std::string>{ "attrs-23.2.0-py3-none-any.whl" });
}

TEST_CASE_FIXTURE(plan_fixture, "a failing target does not hide the healthy ones") {
  auto const p{ plan({ "attrs>=23", "winonly" }) };
  CHECK_FALSE(p.ok());
  CHECK(p.failed_target_count() == 2);

  for (auto const &g : p.groups) {
    for (auto const &t : g.targets) {
      if (t.target.platform == bl_platform::WINDOWS_X64) {
        CHECK(t.ok());
        CHECK(t.wheels.size() == 2);
      } else {
        CHECK_FALSE(t.ok());
        CHECK_FALSE(t.errors.front().message.empty());
      }
    }
  }
}

TEST_CASE_FIXTURE(plan_fixture, "index queries are shared across targets") {
  auto const p{ plan({ "attrs>=23" }) };
  CHECK(p.ok());
  CHECK(index.version_calls.load() == 1);
}

TEST_CASE_FIXTURE(plan_fixture, "unknown packages fail each target with an index error") {
  auto const p{ plan({ "no-such-package" }) };
  CHECK(p.failed_target_count() == p.target_count());
  CHECK(p.groups[0].targets[0].errors.front().kind == "IndexError");
}

TEST_CASE_FIXTURE(plan_fixture, "download_plan fills paths and records failures per target") {
  cache_dir dir;
  filename_fetcher fetcher;
  wheel_downloader downloader{ cfg, *dir.c, fetcher };

  auto ok_plan{ plan({ "attrs>=23" }) };
  download_plan(ok_plan, downloader);
  CHECK(ok_plan.ok());
  CHECK(fetcher.fetched.size() == 1);
  auto const files{ ok_plan.groups[0].wheel_files() };
  REQUIRE(files.size() == 1);
  CHECK(files.begin()->first == "attrs-23.2.0-py3-none-any.whl");
  CHECK(std::filesystem::exists(files.begin()->second));

  fetcher.broken.insert("winonly-1.0-cp311-cp311-win_amd64.whl");
  auto broken_plan{ plan({ "winonly" }) };
  auto const failed_before{ broken_plan.failed_target_count() };
  download_plan(broken_plan, downloader);
  CHECK(broken_plan.failed_target_count() == failed_before + 2);
  CHECK(broken_plan.groups[0].targets.back().errors.front().kind == "DownloadError");
}

TEST_CASE_FIXTURE(plan_fixture, "wheels with equal content keep their own filenames") {
  std::string const body{ "shared wheel bytes" };
  auto const sha{ sha256_hex(sha256(body.data(), body.size())) };
  for (auto const *name : { "twin_a", "twin_b" }) {
    auto file{ wheel_file(std::string{ name } + "-1.0-py3-none-any.whl") };
    file.sha256 = sha;
    index.add(name, "1.0", { .files = { file } });
  }

  cache_dir dir;
  filename_fetcher fetcher;
  fetcher.bodies = { { "twin_a-1.0-py3-none-any.whl", body },
                     { "twin_b-1.0-py3-none-any.whl", body } };
  wheel_downloader downloader{ cfg, *dir.c, fetcher };

  auto p{ plan({ "twin-a", "twin-b" }) };
  download_plan(p, downloader);
  REQUIRE(p.ok());
  CHECK(fetcher.fetched.size() == 1);

  auto const files{ p.groups[0].wheel_files() };
  CHECK(p.groups[0].wheel_filenames() ==
        std::vector<std::string>{ "twin_a-1.0-py3-none-any.whl", "twin_b-1.0-py3-none-any.whl" });
  REQUIRE(files.size() == 2);
  CHECK(files.contains("twin_a-1.0-py3-none-any.whl"));
  CHECK(files.contains("twin_b-1.0-py3-none-any.whl"));
  for (auto const &[name, path] : files) {
    CAPTURE(name);
    CHECK(util_load_text_file(path) == body);
  }
}
