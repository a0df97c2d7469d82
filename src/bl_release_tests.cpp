#include "bl_release.h"

#include <doctest/doctest.h>

#include <algorithm>
#include <stdexcept>

using namespace blext;

TEST_CASE("bl_platform names round-trip") {
  for (auto const p : all_bl_platforms()) {
    auto const parsed{ bl_platform_parse(bl_platform_name(p)) };
    REQUIRE(parsed.has_value());
    CHECK(*parsed == p);
  }
  CHECK(bl_platform_parse("Linux-X64") == bl_platform::LINUX_X64);
  CHECK_FALSE(bl_platform_parse("linux-riscv64").has_value());
  CHECK(bl_platform_os(bl_platform::MACOS_ARM64) == os_family::MACOS);
  CHECK(bl_platform_arch(bl_platform::WINDOWS_ARM64) == cpu_arch::ARM64);
}

TEST_CASE("bl_version parse and format") {
  CHECK(bl_version::parse("4.2") == bl_version{ 4, 2, 0 });
  CHECK(bl_version::parse("4.2.3").str() == "4.2.3");
  CHECK(bl_version::parse("4.2.3").line() == "4.2");
  CHECK(bl_version{ 4, 2, 8 } < bl_version{ 4, 3, 0 });
  CHECK_THROWS_AS(bl_version::parse("4"), std::invalid_argument);
  CHECK_THROWS_AS(bl_version::parse("4.x"), std::invalid_argument);
  CHECK_THROWS_AS(bl_version::parse("4.2.3.1"), std::invalid_argument);
}

TEST_CASE("official releases are ascending and complete") {
  auto const &all{ official_releases() };
  REQUIRE(all.size() == 13);
  CHECK(all.front().version == bl_version{ 4, 2, 0 });
  CHECK(all.back().version == bl_version{ 4, 4, 0 });
  CHECK(std::ranges::is_sorted(all, {}, &bl_release::version));
  for (auto const &r : all) {
    CAPTURE(r.version.str());
    CHECK(std::ranges::is_sorted(r.reference, {}, &reference_pin::package));
    CHECK(r.min_glibc == os_version{ 2, 28 });
  }
}

TEST_CASE("reference pins per release line") {
  auto const *r42{ find_release({ 4, 2, 5 }) };
  auto const *r43{ find_release({ 4, 3, 0 }) };
  auto const *r44{ find_release({ 4, 4, 0 }) };
  REQUIRE(r42);
  REQUIRE(r43);
  REQUIRE(r44);

  REQUIRE(r42->find_pin("numpy"));
  CHECK(r42->find_pin("numpy")->version.str() == "1.24.3");
  CHECK(r44->find_pin("NumPy")->version.str() == "1.26.4");
  CHECK(r42->find_pin("toml"));
  CHECK_FALSE(r43->find_pin("toml"));
  CHECK(r44->find_pin("cython")->version.str() == "3.0.11");
  CHECK(r42->find_pin("charset-normalizer"));
  CHECK_FALSE(r42->find_pin("scipy"));
  CHECK(r44->min_macos == os_version{ 12, 0 });
}

TEST_CASE("release platforms") {
  CHECK_FALSE(find_release({ 4, 2, 0 })->supports(bl_platform::WINDOWS_ARM64));
  CHECK(find_release({ 4, 2, 1 })->supports(bl_platform::WINDOWS_ARM64));
  CHECK_FALSE(find_release({ 4, 4, 0 })->supports(bl_platform::LINUX_ARM64));
  CHECK_FALSE(find_release({ 4, 1, 0 }));
}

TEST_CASE("releases_in_range") {
  auto const line_4_2{ releases_in_range({ 4, 2, 0 }, bl_version{ 4, 3, 0 }) };
  CHECK(line_4_2.size() == 9);
  auto const open{ releases_in_range({ 4, 3, 1 }, std::nullopt) };
  REQUIRE(open.size() == 3);
  CHECK(open.front()->version == bl_version{ 4, 3, 1 });
  CHECK(releases_in_range({ 5, 0, 0 }, std::nullopt).empty());
}

TEST_CASE("target_platform applies release floors and overrides") {
  auto const &r{ *find_release({ 4, 4, 0 }) };
  auto const linux_target{ r.target_platform(bl_platform::LINUX_X64) };
  CHECK(linux_target.libc == libc_family::GLIBC);
  CHECK(linux_target.min_os_version == os_version{ 2, 28 });

  auto const mac{ r.target_platform(bl_platform::MACOS_ARM64, os_version{ 13, 0 }) };
  CHECK(mac.min_os_version == os_version{ 13, 0 });

  CHECK_FALSE(r.target_platform(bl_platform::WINDOWS_X64).min_os_version.has_value());
}

TEST_CASE("marker environments per platform machine") {
  auto const &r{ *find_release({ 4, 2, 0 }) };
  auto const mac{ marker_environments(r, bl_platform::MACOS_X64) };
  REQUIRE(mac.size() == 2);
  CHECK(mac[0].at("platform_machine") == "x86_64");
  CHECK(mac[1].at("platform_machine") == "i386");
  CHECK(mac[0].at("sys_platform") == "darwin");
  CHECK(mac[0].at("python_version") == "3.11");
  CHECK(mac[0].at("python_full_version") == "3.11.7");
  CHECK(mac[0].at("extra") == "blender4-2");

  auto const win{ marker_environments(r, bl_platform::WINDOWS_X64) };
  REQUIRE(win.size() == 1);
  CHECK(win[0].at("os_name") == "nt");
  CHECK(win[0].at("platform_system") == "Windows");

  auto const m{ marker::parse("sys_platform == 'darwin' and platform_machine == 'i386'") };
  CHECK(m.evaluate_any(mac));
  CHECK_FALSE(m.evaluate_any(win));
}

TEST_CASE("smoosh merges identical neighbors") {
  auto const all{ releases_in_range({ 4, 2, 0 }, std::nullopt) };

  SUBCASE("platform differences split 4.2.0 when windows-arm64 is wanted") {
    auto const groups{ smoosh_releases(all, all_bl_platforms()) };
    REQUIRE(groups.size() == 4);
    CHECK(groups[0].members.size() == 1);
    CHECK(groups[0].name() == "bl4_2_0");
    CHECK(groups[1].members.size() == 8);
    CHECK(groups[2].members.size() == 3);
    CHECK(groups[2].name() == "bl4_3");
    CHECK(groups[3].name() == "bl4_4_0");
    CHECK(std::ranges::find(groups[1].platforms, bl_platform::WINDOWS_ARM64) !=
          groups[1].platforms.end());
    CHECK(std::ranges::find(groups[1].platforms, bl_platform::LINUX_ARM64) ==
          groups[1].platforms.end());
  }

  SUBCASE("the whole 4.2 line merges without windows-arm64") {
    auto const groups{ smoosh_releases(all, { bl_platform::LINUX_X64, bl_platform::WINDOWS_X64 }) };
    REQUIRE(groups.size() == 3);
    CHECK(groups[0].members.size() == 9);
    CHECK(groups[0].name() == "bl4_2");
    CHECK(groups[0].platforms ==
          std::vector<bl_platform>{ bl_platform::LINUX_X64, bl_platform::WINDOWS_X64 });
  }
}

TEST_CASE("interpreter tag follows the bundled Python") {
  for (auto const &r : official_releases()) {
    CAPTURE(r.version.str());
    CHECK(r.interpreter_tag() == "cp311");
  }
}
