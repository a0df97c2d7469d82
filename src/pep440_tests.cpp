#include "pep440.h"

#include <doctest/doctest.h>

#include <stdexcept>

using blext::pep440::specifier;
using blext::pep440::specifier_set;
using blext::pep440::version;

TEST_CASE("version parse normalizes spellings") {
  CHECK(version{ "v1.0" }.str() == "1.0");
  CHECK(version{ "1.0-alpha.2" }.str() == "1.0a2");
  CHECK(version{ "1.0preview1" }.str() == "1.0rc1");
  CHECK(version{ "1.0c" }.str() == "1.0rc0");
  CHECK(version{ "1.0-1" }.str() == "1.0.post1");
  CHECK(version{ "1.0.rev2" }.str() == "1.0.post2");
  CHECK(version{ "1.0_DEV3" }.str() == "1.0.dev3");
  CHECK(version{ "2!1.0+Ubuntu-1" }.str() == "2!1.0+ubuntu.1");
  CHECK(version{ " 1.24.3 " }.str() == "1.24.3");
}

TEST_CASE("version parse rejects garbage") {
  CHECK_FALSE(version::parse("").has_value());
  CHECK_FALSE(version::parse("one").has_value());
  CHECK_FALSE(version::parse("1.0+").has_value());
  CHECK_FALSE(version::parse("1.0 beta").has_value());
  CHECK_THROWS_AS(version{ "1..0" }, std::invalid_argument);
}

TEST_CASE("version ordering follows PEP 440") {
  char const *ordered[]{ "1.0.dev0", "1.0a1",   "1.0a2.dev1", "1.0a2",      "1.0b1",
                         "1.0rc1",   "1.0",     "1.0+local",  "1.0.post1",  "1.1.dev1",
                         "1.1",      "1.10",    "2!0.1" };
  for (std::size_t i{ 0 }; i + 1 < std::size(ordered); ++i) {
    CAPTURE(ordered[i]);
    CHECK(version{ ordered[i] } < version{ ordered[i + 1] });
  }
}

TEST_CASE("version equality ignores trailing zeros") {
  CHECK(version{ "1.0" } == version{ "1.0.0" });
  CHECK(version{ "1" } == version{ "1.0" });
  CHECK(version{ "1.0+a" } != version{ "1.0" });
}

TEST_CASE("version prerelease and base accessors") {
  CHECK(version{ "1.0rc1" }.is_prerelease());
  CHECK(version{ "1.0.dev1" }.is_prerelease());
  CHECK_FALSE(version{ "1.0.post1" }.is_prerelease());
  CHECK(version{ "1.0.post1" }.is_postrelease());
  CHECK(version{ "1.2rc1.post2+x" }.base_version().str() == "1.2");
  CHECK(version{ "1.2+x" }.public_version().str() == "1.2");
}

TEST_CASE("specifier comparison operators") {
  CHECK(specifier{ ">=1.24" }.contains(version{ "1.24.3" }));
  CHECK_FALSE(specifier{ ">=1.25" }.contains(version{ "1.24.3" }));
  CHECK(specifier{ "<=1.24.3" }.contains(version{ "1.24.3+local" }));
  CHECK(specifier{ "==1.24.3" }.contains(version{ "1.24.3" }));
  CHECK(specifier{ "==1.24.3" }.contains(version{ "1.24.3+local" }));
  CHECK_FALSE(specifier{ "==1.24.3+other" }.contains(version{ "1.24.3+local" }));
  CHECK(specifier{ "!=1.24.3" }.contains(version{ "1.24.4" }));
  CHECK_FALSE(specifier{ "!=1.24.3" }.contains(version{ "1.24.3" }));
  CHECK(specifier{ "===1.0" }.contains(version{ "1.0" }));
  CHECK_FALSE(specifier{ "===1.0" }.contains(version{ "1.0.0" }));
}

TEST_CASE("specifier wildcards") {
  CHECK(specifier{ "==1.24.*" }.contains(version{ "1.24.3" }));
  CHECK(specifier{ "==1.24.*" }.contains(version{ "1.24" }));
  CHECK_FALSE(specifier{ "==1.24.*" }.contains(version{ "1.25.0" }));
  CHECK(specifier{ "!=1.24.*" }.contains(version{ "1.25.0" }));
  CHECK_THROWS_AS(specifier{ ">=1.*" }, std::invalid_argument);
}

TEST_CASE("specifier compatible release") {
  specifier const s{ "~=1.4.5" };
  CHECK(s.contains(version{ "1.4.5" }));
  CHECK(s.contains(version{ "1.4.9" }));
  CHECK_FALSE(s.contains(version{ "1.5.0" }));
  CHECK_FALSE(s.contains(version{ "1.4.4" }));

  specifier const major{ "~=2.2" };
  CHECK(major.contains(version{ "2.9" }));
  CHECK_FALSE(major.contains(version{ "3.0" }));
  CHECK_THROWS_AS(specifier{ "~=1" }, std::invalid_argument);
}

TEST_CASE("exclusive comparisons exclude pre and post releases of the bound") {
  CHECK_FALSE(specifier{ "<2.0" }.contains(version{ "2.0rc1" }));
  CHECK(specifier{ "<2.0rc2" }.contains(version{ "2.0rc1" }));
  CHECK_FALSE(specifier{ ">1.7" }.contains(version{ "1.7.post2" }));
  CHECK(specifier{ ">1.7.post1" }.contains(version{ "1.7.post2" }));
  CHECK_FALSE(specifier{ ">1.7" }.contains(version{ "1.7+local" }));
}

TEST_CASE("specifier rejects malformed input") {
  CHECK_THROWS_AS(specifier{ "1.0" }, std::invalid_argument);
  CHECK_THROWS_AS(specifier{ ">=" }, std::invalid_argument);
  CHECK_THROWS_AS(specifier{ ">=abc" }, std::invalid_argument);
  CHECK_THROWS_AS(specifier_set{ ">=1.0,,<2" }, std::invalid_argument);
}

TEST_CASE("specifier_set intersection semantics") {
  specifier_set const set{ ">=1.22, <2, !=1.23.0" };
  CHECK(set.specifiers().size() == 3);
  CHECK(set.contains(version{ "1.24.3" }));
  CHECK_FALSE(set.contains(version{ "1.23.0" }));
  CHECK_FALSE(set.contains(version{ "2.0" }));
  CHECK(set.str() == ">=1.22,<2,!=1.23.0");

  specifier_set const any{ "" };
  CHECK(any.empty());
  CHECK(any.contains(version{ "0.0.1" }));
}

TEST_CASE("specifier_set excludes prereleases unless asked") {
  CHECK_FALSE(specifier_set{ ">=1.0" }.contains(version{ "2.0b1" }));
  CHECK(specifier_set{ ">=1.0" }.contains(version{ "2.0b1" }, true));
  CHECK(specifier_set{ ">=2.0b1" }.contains(version{ "2.0b2" }));
  CHECK_FALSE(specifier_set{ "!=2.0b1" }.contains(version{ "2.0b2" }));
}

TEST_CASE("specifier_set add merges constraints") {
  specifier_set set{ ">=1.0" };
  set.add(specifier_set{ "<1.5" });
  CHECK(set.contains(version{ "1.4" }));
  CHECK_FALSE(set.contains(version{ "1.5" }));
}
