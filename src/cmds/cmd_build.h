#pragma once

#include "cmd.h"
#include "cmds/cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace blext {

class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {
    project_options project;
    std::string profile{ "release" };
    std::optional<std::filesystem::path> output_dir;  // defaults to <project root>/build
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_build(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
};

}  // namespace blext
