#include "cmd_show_deps.h"

#include "report.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace blext {

void cmd_show_deps::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("show-deps", "Show the resolved wheels of every target") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_project_options(*sub, cfg_ptr->project);
  sub->add_option("--format", cfg_ptr->format, "Output format")
      ->check(CLI::IsMember({ "text", "json" }))
      ->capture_default_str();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_show_deps::cmd_show_deps(cmd_show_deps::cfg cfg,
                             std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

bool cmd_show_deps::execute() {
  cache c{ cli_cache_root_ };
  auto const plan{ plan_project(load_project(cfg_.project, c)) };

  if (cfg_.format == "json") {
    tui::print_stdout("%s\n", report_json(plan).dump(2).c_str());
  } else {
    tui::print_stdout("%s", report_text(plan).c_str());
  }
  return plan.ok();
}

}  // namespace blext
