#include "cli.h"
#include "tui.h"
#include "util.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

namespace {

// "stderr,file:/tmp/t.jsonl" -> outputs. An empty spec means stderr. Returns the first
// token it cannot read.
std::optional<std::string> read_trace_spec(std::string const &spec,
                                           std::vector<tui::trace_output_spec> &outputs) {
  if (spec.empty()) {
    outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    return std::nullopt;
  }

  constexpr std::string_view kFilePrefix{ "file:" };
  for (auto const &raw : util_split(spec, ',')) {
    std::string_view const token{ util_trim(raw) };
    if (token.empty()) { continue; }
    if (token == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (token.starts_with(kFilePrefix) && token.size() > kFilePrefix.size()) {
      outputs.push_back({ tui::trace_output_type::file,
                          std::filesystem::path{ token.substr(kFilePrefix.size()) } });
    } else {
      return std::string{ token };
    }
  }
  return std::nullopt;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "blext - package Python projects as Blender extensions" };
  app.require_subcommand(0, 1);

  bool verbose{ false };
  app.add_flag("--verbose", verbose, "Debug logging with time and level prefixes");

  std::string trace_spec;
  auto *trace_option{ app.add_option(
      "--trace",
      trace_spec,
      "Trace resolver and download events to 'stderr' and/or 'file:<path>' (JSON lines); "
      "comma separated, stderr when empty") };
  trace_option->expected(0, 1);

  cli_args args{};
  app.add_option("--cache-root",
                 args.cache_root,
                 "Cache root directory (defaults to $BLEXT_CACHE_ROOT, then the user cache)");

  bool show_version{ false };
  app.add_flag("-v,--version", show_version, "Same as the version subcommand");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const select{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };
  cmd_build::register_cli(app, select);
  cmd_show_deps::register_cli(app, select);
  cmd_check::register_cli(app, select);
  cmd_version::register_cli(app, select);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = e.what(); }

  args.verbosity = verbose ? tui::level::TUI_DEBUG : tui::level::TUI_INFO;
  args.decorated_logging = verbose;

  if (trace_option->count() > 0) {
    if (auto const bad{ read_trace_spec(trace_spec, args.trace_outputs) }) {
      args.cli_output = "Invalid trace output spec: " + *bad;
      args.trace_outputs.clear();
      return args;
    }
    if (!args.trace_outputs.empty()) {
      args.verbosity = tui::level::TUI_TRACE;
      args.decorated_logging = true;
    }
  }

  if (show_version) {
    args.cmd_cfg = cmd_version::cfg{};
  } else if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }
  return args;
}

}  // namespace blext
