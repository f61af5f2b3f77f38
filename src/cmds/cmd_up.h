#pragma once

#include "cmd.h"
#include "cmd_common.h"
#include "readiness.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace stackctl {

class cmd_up : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_up> {
    stack_cli_cfg stack;
    std::vector<std::string> services;
    std::vector<std::string> wait_logs;  // SERVICE=TEXT
    bool remove_orphans{ false };
    bool ignore_orphans{ false };
    bool wait{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_up(cfg cfg);

  void execute() override;

 private:
  cfg cfg_;
};

// Ready once the container's log output contains `text`. Polls every `interval`.
readiness_ptr make_log_readiness(std::string text, std::chrono::milliseconds interval);

}  // namespace stackctl
