#pragma once

#include "cmds/cmd_config.h"
#include "cmds/cmd_down.h"
#include "cmds/cmd_ps.h"
#include "cmds/cmd_up.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stackctl {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_config::cfg,
                                 cmd_down::cfg,
                                 cmd_ps::cfg,
                                 cmd_up::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace stackctl
