#include "cmd_check.h"

#include "manifest.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace blext {

void cmd_check::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("check", "Check that every target resolves") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_project_options(*sub, cfg_ptr->project);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_check::cmd_check(cmd_check::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

bool cmd_check::execute() {
  cache c{ cli_cache_root_ };
  auto const lp{ load_project(cfg_.project, c) };
  auto const plan{ plan_project(lp) };
  if (log_plan_errors(plan)) { return false; }

  for (auto const &g : plan.groups) {
    make_manifest(lp.proj, g.group, g.wheel_filenames()).validate();
  }

  tui::info("%s: all %zu targets resolve", lp.proj.id.c_str(), plan.target_count());
  return true;
}

}  // namespace blext
