#include "cmd_build.h"

#include "errors.h"
#include "fetch.h"
#include "manifest.h"
#include "pack.h"
#include "termination.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace blext {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build", "Resolve, download and pack the extension") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_project_options(*sub, cfg_ptr->project);
  sub->add_option("--profile",
                  cfg_ptr->profile,
                  "Release profile: test, dev, release or release-debug")
      ->capture_default_str();
  sub->add_option("-o,--output", cfg_ptr->output_dir, "Directory for the packed zips");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_build::cmd_build(cmd_build::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

bool cmd_build::execute() {
  auto const profile{ release_profile_parse(cfg_.profile) };
  if (!profile) { throw config_error("unknown release profile '" + cfg_.profile + "'"); }

  cache c{ cli_cache_root_ };
  auto const lp{ load_project(cfg_.project, c) };

  auto plan{ plan_project(lp) };
  if (log_plan_errors(plan)) { return false; }

  libcurl_fetcher fetcher;
  wheel_downloader downloader{ lp.cfg, c, fetcher, &termination_requested() };
  download_plan(plan, downloader);
  if (log_plan_errors(plan)) { return false; }

  auto const out_dir{ cfg_.output_dir.value_or(lp.proj.files.root / "build") };
  for (auto const &g : plan.groups) {
    pack_extension(lp.proj,
                   { .group_name = g.name,
                     .manifest = make_manifest(lp.proj, g.group, g.wheel_filenames()),
                     .profile = *profile,
                     .wheels = g.wheel_files(),
                     .out_dir = out_dir });
  }

  tui::info("Built %zu extension(s) in %s", plan.groups.size(), out_dir.string().c_str());
  return true;
}

}  // namespace blext
