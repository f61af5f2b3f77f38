#include "cli.h"

#include "util.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stackctl {

namespace {

// Fills trace outputs from a --trace value; false on an unrecognized entry.
bool parse_trace_outputs(std::string const &value,
                         std::vector<tui::trace_output_spec> &outputs,
                         std::string &bad_entry) {
  for (auto const &raw : util_split(value, ',')) {
    std::string const entry{ util_trim(raw) };
    if (entry.empty()) { continue; }
    if (entry == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (entry.starts_with("file:") && entry.size() > 5) {
      outputs.push_back(
          { tui::trace_output_type::file, std::filesystem::path{ entry.substr(5) } });
    } else {
      bad_entry = entry;
      return false;
    }
  }
  return true;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "stackctl - compose stack lifecycle controller" };
  app.require_subcommand(0, 1);

  bool verbose{ false };
  app.add_flag("--verbose", verbose, "Enable decorated debug logging");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace events. Comma-separated list of "
                                     "'stderr' and/or 'file:<path>' (JSONL). Defaults "
                                     "to stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_config::register_cli(app, on_selected);
  cmd_up::register_cli(app, on_selected);
  cmd_down::register_cli(app, on_selected);
  cmd_ps::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (trace_option->count() > 0) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;

    std::string bad_entry;
    if (!parse_trace_outputs(trace_spec, args.trace_outputs, bad_entry)) {
      args.cli_output = "Invalid trace output spec: " + bad_entry;
      args.trace_outputs.clear();
      return args;
    }
    if (args.trace_outputs.empty()) {
      args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg && args.cli_output.empty()) {
    args.cmd_cfg = std::move(cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace stackctl
