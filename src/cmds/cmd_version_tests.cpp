#include "cmds/cmd_build.h"
#include "cmds/cmd_check.h"
#include "cmds/cmd_show_deps.h"
#include "cmds/cmd_version.h"

#include <doctest/doctest.h>

#include <type_traits>

TEST_CASE("command configs expose their cmd_t alias") {
  CHECK(std::is_same_v<blext::cmd_version::cfg::cmd_t, blext::cmd_version>);
  CHECK(std::is_same_v<blext::cmd_build::cfg::cmd_t, blext::cmd_build>);
  CHECK(std::is_same_v<blext::cmd_check::cfg::cmd_t, blext::cmd_check>);
  CHECK(std::is_same_v<blext::cmd_show_deps::cfg::cmd_t, blext::cmd_show_deps>);
}

TEST_CASE("cmd::create builds the command its config names") {
  blext::cmd_version::cfg cfg;
  cfg.show_components = true;
  auto const c{ blext::cmd::create(cfg, std::nullopt) };
  REQUIRE(c);
  auto const *version{ dynamic_cast<blext::cmd_version const *>(c.get()) };
  REQUIRE(version);
  CHECK(version->get_cfg().show_components);
}
