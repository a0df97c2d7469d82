#pragma once

#include "cmd.h"
#include "cmds/cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace blext {

// Plans every target without downloading and reports only what fails.
class cmd_check : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_check> {
    project_options project;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_check(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
};

}  // namespace blext
