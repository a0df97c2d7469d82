#include "errors.h"
#include "tags.h"

#include <doctest/doctest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace blext;

namespace {

platform_tag linux_x64(int glibc_major, int glibc_minor) {
  return { .os = os_family::LINUX,
           .arch = cpu_arch::X64,
           .libc = libc_family::GLIBC,
           .min_os_version = os_version{ glibc_major, glibc_minor } };
}

platform_tag macos(cpu_arch arch, int major, int minor) {
  return { .os = os_family::MACOS, .arch = arch, .min_os_version = os_version{ major, minor } };
}

}  // namespace

TEST_CASE("legacy manylinux aliases map to PEP 600") {
  CHECK(legacy_manylinux_to_pep600("manylinux1_x86_64") == "manylinux_2_5_x86_64");
  CHECK(legacy_manylinux_to_pep600("manylinux2010_i686") == "manylinux_2_12_i686");
  CHECK(legacy_manylinux_to_pep600("manylinux2014_aarch64") == "manylinux_2_17_aarch64");
  CHECK(legacy_manylinux_to_pep600("manylinux2014") == "manylinux_2_17");
  CHECK(legacy_manylinux_to_pep600("win_amd64") == "win_amd64");
  CHECK(legacy_manylinux_to_pep600("manylinux20140_x86_64") == "manylinux20140_x86_64");
}

TEST_CASE("legacy manylinux mapping is idempotent") {
  for (std::string const tag : { "manylinux1_x86_64",
                                 "manylinux2010_x86_64",
                                 "manylinux2014_aarch64",
                                 "manylinux_2_28_x86_64",
                                 "macosx_11_0_arm64",
                                 "any" }) {
    CAPTURE(tag);
    auto const once{ legacy_manylinux_to_pep600(tag) };
    CHECK(legacy_manylinux_to_pep600(once) == once);
  }
}

TEST_CASE("legacy and PEP 600 spellings normalize identically") {
  auto const legacy{ normalize_platform_tag("manylinux2014_x86_64") };
  auto const modern{ normalize_platform_tag("manylinux_2_17_x86_64") };
  REQUIRE(legacy.size() == 1);
  REQUIRE(modern.size() == 1);
  CHECK(legacy[0] == modern[0]);
  CHECK(legacy[0].min_os_version == modern[0].min_os_version);
}

TEST_CASE("normalize_platform_tag parses each family") {
  auto const linux_tags{ normalize_platform_tag("manylinux_2_28_aarch64") };
  REQUIRE(linux_tags.size() == 1);
  CHECK(linux_tags[0].os == os_family::LINUX);
  CHECK(linux_tags[0].arch == cpu_arch::ARM64);
  CHECK(linux_tags[0].libc == libc_family::GLIBC);
  CHECK(linux_tags[0].min_os_version == os_version{ 2, 28 });

  auto const musl{ normalize_platform_tag("musllinux_1_1_x86_64") };
  REQUIRE(musl.size() == 1);
  CHECK(musl[0].libc == libc_family::MUSL);

  auto const mac{ normalize_platform_tag("macosx_10_9_x86_64") };
  REQUIRE(mac.size() == 1);
  CHECK(mac[0].os == os_family::MACOS);
  CHECK(mac[0].arch == cpu_arch::X64);
  CHECK(mac[0].min_os_version == os_version{ 10, 9 });

  auto const win{ normalize_platform_tag("win_amd64") };
  REQUIRE(win.size() == 1);
  CHECK(win[0].os == os_family::WINDOWS);
  CHECK_FALSE(win[0].min_os_version.has_value());

  auto const win32{ normalize_platform_tag("win32") };
  REQUIRE(win32.size() == 1);
  CHECK(win32[0].arch == cpu_arch::X86);
}

TEST_CASE("universal2 expands to both macOS architectures") {
  auto const tags{ normalize_platform_tag("macosx_11_0_universal2") };
  REQUIRE(tags.size() == 2);
  CHECK(tags[0].arch == cpu_arch::X64);
  CHECK(tags[1].arch == cpu_arch::ARM64);
  CHECK(tags[1].min_os_version == os_version{ 11, 0 });
}

TEST_CASE("normalize_platform_tag rejects unknown forms") {
  CHECK_THROWS_AS(normalize_platform_tag("any"), unrecognized_tag_error);
  CHECK_THROWS_AS(normalize_platform_tag("linux_x86_64"), unrecognized_tag_error);
  CHECK_THROWS_AS(normalize_platform_tag("manylinux_2_x86_64"), unrecognized_tag_error);
  CHECK_THROWS_AS(normalize_platform_tag("manylinux_2_17_sparc"), unrecognized_tag_error);
  CHECK_THROWS_AS(normalize_platform_tag("win_ia64"), unrecognized_tag_error);

  try {
    normalize_platform_tag("solaris_2_10_sparc");
    FAIL("expected unrecognized_tag_error");
  } catch (unrecognized_tag_error const &e) {
    CHECK(e.tag() == "solaris_2_10_sparc");
    CHECK(e.kind() == error_kind::unrecognized_tag);
  }
}

TEST_CASE("os_version parse") {
  CHECK(os_version::parse("2.28") == os_version{ 2, 28 });
  CHECK(os_version::parse("2_17") == os_version{ 2, 17 });
  CHECK(os_version::parse("11") == os_version{ 11, 0 });
  CHECK(os_version::parse("10.13").str() == "10.13");
  CHECK(os_version{ 2, 17 } < os_version{ 2, 28 });
  CHECK(os_version{ 10, 15 } < os_version{ 11, 0 });
  CHECK_THROWS_AS(os_version::parse("2.x"), std::invalid_argument);
  CHECK_THROWS_AS(os_version::parse(""), std::invalid_argument);
}

TEST_CASE("is_compatible requires exact os and arch") {
  auto const wheel{ linux_x64(2, 17) };
  CHECK(is_compatible(wheel, linux_x64(2, 28)));

  platform_tag arm{ linux_x64(2, 28) };
  arm.arch = cpu_arch::ARM64;
  CHECK_FALSE(is_compatible(wheel, arm));

  CHECK_FALSE(is_compatible(macos(cpu_arch::X64, 10, 9), macos(cpu_arch::ARM64, 11, 0)));

  platform_tag musl{ wheel };
  musl.libc = libc_family::MUSL;
  CHECK_FALSE(is_compatible(musl, linux_x64(2, 28)));
}

TEST_CASE("is_compatible honors the target minimum") {
  CHECK(is_compatible(linux_x64(2, 17), linux_x64(2, 17)));
  CHECK_FALSE(is_compatible(linux_x64(2, 28), linux_x64(2, 17)));

  platform_tag unbounded{ linux_x64(2, 28) };
  unbounded.min_os_version.reset();
  CHECK_FALSE(is_compatible(linux_x64(2, 17), unbounded));

  platform_tag wheel_without_min{ linux_x64(2, 17) };
  wheel_without_min.min_os_version.reset();
  CHECK(is_compatible(wheel_without_min, linux_x64(2, 17)));
}

TEST_CASE("compatibility is monotone in the target minimum") {
  std::vector<platform_tag> const wheels{ linux_x64(2, 5),
                                          linux_x64(2, 12),
                                          linux_x64(2, 17),
                                          linux_x64(2, 28),
                                          linux_x64(2, 34) };
  std::vector<platform_tag> const targets{ linux_x64(2, 17),
                                           linux_x64(2, 27),
                                           linux_x64(2, 28),
                                           linux_x64(2, 39) };
  for (std::size_t lo{ 0 }; lo < targets.size(); ++lo) {
    for (std::size_t hi{ lo }; hi < targets.size(); ++hi) {
      for (auto const &w : wheels) {
        if (is_compatible(w, targets[lo])) {
          CAPTURE(w.str());
          CAPTURE(targets[hi].str());
          CHECK(is_compatible(w, targets[hi]));
        }
      }
    }
  }
}

TEST_CASE("best_platform_match prefers the newest admissible minimum") {
  std::vector<platform_tag> const tags{ linux_x64(2, 5), linux_x64(2, 17), linux_x64(2, 28) };
  auto const at_2_17{ best_platform_match(tags, linux_x64(2, 17)) };
  REQUIRE(at_2_17.has_value());
  CHECK(at_2_17->min_os_version == os_version{ 2, 17 });

  auto const at_2_34{ best_platform_match(tags, linux_x64(2, 34)) };
  REQUIRE(at_2_34.has_value());
  CHECK(at_2_34->min_os_version == os_version{ 2, 28 });

  CHECK_FALSE(best_platform_match(tags, linux_x64(2, 4)).has_value());
}

TEST_CASE("platform_tag str") {
  CHECK(linux_x64(2, 17).str() == "linux-x64 glibc>=2.17");
  CHECK(macos(cpu_arch::ARM64, 11, 0).str() == "macos-arm64 macos>=11.0");
  CHECK(platform_tag{ .os = os_family::WINDOWS, .arch = cpu_arch::X64 }.str() == "windows-x64");
}

TEST_CASE("parse_wheel_filename splits components") {
  auto const wd{ parse_wheel_filename(
      "numpy-1.24.3-cp311-cp311-manylinux_2_17_x86_64.manylinux2014_x86_64.whl") };
  CHECK(wd.package == "numpy");
  CHECK(wd.version.str() == "1.24.3");
  CHECK(wd.build_tag.empty());
  CHECK(wd.python_tags == std::vector<std::string>{ "cp311" });
  CHECK(wd.abi_tags == std::vector<std::string>{ "cp311" });
  CHECK(wd.platform_tags ==
        std::vector<std::string>{ "manylinux_2_17_x86_64", "manylinux_2_17_x86_64" });
  REQUIRE(wd.platforms.size() == 2);
  CHECK_FALSE(wd.platform_any);
}

TEST_CASE("parse_wheel_filename handles build tags and pure wheels") {
  auto const pure{ parse_wheel_filename("Typing_Extensions-4.12.2-1-py2.py3-none-any.whl") };
  CHECK(pure.package == "typing-extensions");
  CHECK(pure.build_tag == "1");
  CHECK(pure.python_tags == std::vector<std::string>{ "py2", "py3" });
  CHECK(pure.platform_any);
  CHECK(pure.platforms.empty());
}

TEST_CASE("parse_wheel_filename drops unknown compressed components") {
  auto const wd{ parse_wheel_filename("pkg-1.0-cp311-cp311-macosx_11_0_arm64.weirdos_1_0_x.whl") };
  CHECK(wd.platform_tags == std::vector<std::string>{ "macosx_11_0_arm64" });
  CHECK(wd.platforms.size() == 1);
}

TEST_CASE("parse_wheel_filename rejects malformed names") {
  CHECK_THROWS_AS(parse_wheel_filename("pkg-1.0.tar.gz"), unrecognized_tag_error);
  CHECK_THROWS_AS(parse_wheel_filename("pkg-1.0-py3-none.whl"), unrecognized_tag_error);
  CHECK_THROWS_AS(parse_wheel_filename("pkg-notaversion-py3-none-any.whl"),
                  unrecognized_tag_error);
  CHECK_THROWS_AS(parse_wheel_filename("pkg-1.0-x1-py3-none-any.whl"), unrecognized_tag_error);
  CHECK_THROWS_AS(parse_wheel_filename("pkg-1.0-cp311-cp311-solaris_sparc.whl"),
                  unrecognized_tag_error);
}

TEST_CASE("admits_python checks python and abi tags as pairs") {
  std::vector<std::string> const py{ "py3", "cp36", "cp37", "cp38", "cp39", "cp310", "cp311" };
  std::vector<std::string> const abi{ "none", "abi3", "cp311" };
  auto const admits{ [&](std::string_view filename) {
    return parse_wheel_filename(filename).admits_python("cp311", py, abi);
  } };

  CHECK(admits("a-1.0-py3-none-any.whl"));
  CHECK(admits("a-1.0-cp36-abi3-win_amd64.whl"));
  CHECK(admits("a-1.0-cp311-abi3-win_amd64.whl"));
  CHECK(admits("a-1.0-cp311-cp311-win_amd64.whl"));
  CHECK(admits("a-1.0-cp311-none-win_amd64.whl"));
  CHECK(admits("a-1.0-cp37.cp311-cp311-win_amd64.whl"));
  CHECK_FALSE(admits("a-1.0-cp312-cp312-win_amd64.whl"));
  CHECK_FALSE(admits("a-1.0-cp310-cp310-win_amd64.whl"));
  CHECK_FALSE(admits("a-1.0-py2-none-any.whl"));

  // Each tag is valid on its own, but the combination is not loadable by cp311.
  CHECK_FALSE(admits("a-1.0-cp37-none-win_amd64.whl"));
  CHECK_FALSE(admits("a-1.0-cp310-cp311-win_amd64.whl"));
  CHECK_FALSE(admits("a-1.0-py3-abi3-win_amd64.whl"));
  CHECK_FALSE(admits("a-1.0-cp37-cp311-win_amd64.whl"));

  CHECK(parse_wheel_filename("a-1.0-cp312-abi3-win_amd64.whl")
            .admits_python("cp313", { "cp312", "cp313" }, { "abi3" }));
  CHECK_FALSE(parse_wheel_filename("a-1.0-cp312-abi3-win_amd64.whl")
                  .admits_python("cp311", { "cp312" }, { "abi3" }));
}
