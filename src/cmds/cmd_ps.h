#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace stackctl {

// Resolves the container backing one service and prints its state.
class cmd_ps : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_ps> {
    stack_cli_cfg stack;
    std::string service;
    std::string port;  // optional container port to resolve
    bool logs{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_ps(cfg cfg);

  void execute() override;

 private:
  cfg cfg_;
};

}  // namespace stackctl
