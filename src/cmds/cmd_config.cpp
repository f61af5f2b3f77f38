#include "cmd_config.h"

#include "project.h"
#include "tui.h"
#include "util.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <utility>

namespace stackctl {

void cmd_config::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("config", "Compile manifests and print the project") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_stack_options(*sub, cfg_ptr->stack);
  sub->add_flag("--labels", cfg_ptr->show_labels, "Print discovery labels per service");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_config::cmd_config(cmd_config::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_config::execute() {
  auto const p{ cli_compile_project(cfg_.stack) };

  tui::print_stdout("name: %s\n", p.name.c_str());
  tui::print_stdout("working_dir: %s\n", p.working_dir.string().c_str());
  tui::print_stdout("services:\n");
  for (auto const &s : p.services) {
    tui::print_stdout("  %s: %s\n", s.name.c_str(), project_service_image(p, s).c_str());

    if (!s.depends_on.empty()) {
      std::vector<std::string> deps;
      for (auto const &d : s.depends_on) {
        deps.push_back(d.service + " (" + std::string{ depends_condition_name(d.condition) } +
                       ")");
      }
      tui::print_stdout("    depends_on: %s\n", util_join(deps, ", ").c_str());
    }

    if (cfg_.show_labels) {
      for (auto const &[key, value] : s.custom_labels) {
        tui::print_stdout("    %s=%s\n", key.c_str(), value.c_str());
      }
    }
  }
}

}  // namespace stackctl
