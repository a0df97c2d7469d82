#include "cli.h"
#include "libcurl_util.h"
#include "libgit2_util.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  blext::tui::init();
  blext::termination_handler_install();

  auto args{ blext::cli_parse(argc, argv) };
  blext::tui::configure_trace_outputs(args.trace_outputs);
  blext::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  blext::libcurl_ensure_initialized();
  blext::libgit2_scope git_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      blext::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    blext::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return blext::cmd::create(cfg, args.cache_root); },
      *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    blext::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
