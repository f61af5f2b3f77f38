#pragma once

#include "cmd.h"
#include "cmd_common.h"
#include "runtime_gateway.h"

#include <functional>

namespace CLI { class App; }

namespace stackctl {

// Tears down a stack started by an earlier invocation; only the project name is needed.
class cmd_down : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_down> {
    stack_cli_cfg stack;
    bool remove_orphans{ false };
    image_removal images{ image_removal::none };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_down(cfg cfg);

  void execute() override;

 private:
  cfg cfg_;
};

}  // namespace stackctl
