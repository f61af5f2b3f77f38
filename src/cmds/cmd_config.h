#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace stackctl {

// Compiles the manifests and prints the resulting project without touching the engine.
class cmd_config : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_config> {
    stack_cli_cfg stack;
    bool show_labels{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_config(cfg cfg);

  void execute() override;

 private:
  cfg cfg_;
};

}  // namespace stackctl
