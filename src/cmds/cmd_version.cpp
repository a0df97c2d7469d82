#include "cmd_version.h"

#include "bl_release.h"
#include "tui.h"

#include <CLI/CLI.hpp>
#include <archive.h>
#include <blake3.h>
#include <curl/curl.h>
#include <git2.h>
#include <mbedtls/version.h>
#include <nlohmann/json.hpp>
#include <oneapi/tbb/version.h>
#include <toml++/toml.hpp>

#include <array>
#include <memory>
#include <string>

#ifndef BLEXT_VERSION_STR
#error "BLEXT_VERSION_STR must be defined by the build system"
#endif

namespace blext {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_flag("--components",
                cfg_ptr->show_components,
                "Also print third-party component versions");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  auto const &releases{ official_releases() };
  tui::print_stdout("blext %s (Blender %s to %s)\n",
                    BLEXT_VERSION_STR,
                    releases.front().version.str().c_str(),
                    releases.back().version.str().c_str());
  if (!cfg_.show_components) { return true; }

  tui::print_stdout("\nThird-party component versions:\n");

  int git_major{ 0 };
  int git_minor{ 0 };
  int git_revision{ 0 };
  git_libgit2_version(&git_major, &git_minor, &git_revision);
  tui::print_stdout("  libgit2: %d.%d.%d\n", git_major, git_minor, git_revision);

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  tui::print_stdout("  libcurl: %s\n", curl_info->version);

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::print_stdout("  mbedTLS: %s\n", mbedtls_version.data());

  tui::print_stdout("  libarchive: %s\n", archive_version_details());
  tui::print_stdout("  BLAKE3: %s\n", BLAKE3_VERSION_STRING);
  tui::print_stdout("  oneTBB: %s\n", TBB_runtime_version());
  tui::print_stdout("  nlohmann/json: %d.%d.%d\n",
                    NLOHMANN_JSON_VERSION_MAJOR,
                    NLOHMANN_JSON_VERSION_MINOR,
                    NLOHMANN_JSON_VERSION_PATCH);
  tui::print_stdout("  toml++: %d.%d.%d\n",
                    TOML_LIB_MAJOR,
                    TOML_LIB_MINOR,
                    TOML_LIB_PATCH);
  tui::print_stdout("  CLI11: %s\n", CLI11_VERSION);
  return true;
}

}  // namespace blext
