#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  stackctl::tui::init();

  auto args{ stackctl::cli_parse(argc, argv) };
  try {
    stackctl::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    stackctl::tui::scope tui_scope{ args.verbosity, args.decorated_logging };
    stackctl::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  }
  stackctl::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      stackctl::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    stackctl::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return stackctl::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    stackctl::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
