#pragma once

#include "cmd.h"
#include "cmds/cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace blext {

class cmd_show_deps : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_show_deps> {
    project_options project;
    std::string format{ "text" };  // text or json
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_show_deps(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
};

}  // namespace blext
