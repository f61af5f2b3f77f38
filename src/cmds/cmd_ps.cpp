#include "cmd_ps.h"

#include "container.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <utility>

namespace stackctl {

void cmd_ps::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("ps", "Show the container of a running service") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_stack_options(*sub, cfg_ptr->stack);
  sub->add_option("service", cfg_ptr->service, "Service name")->required();
  sub->add_option("--port", cfg_ptr->port, "Print the host port published for this port");
  sub->add_flag("--logs", cfg_ptr->logs, "Print the container logs");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_ps::cmd_ps(cmd_ps::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_ps::execute() {
  auto stack{ make_cli_stack(cli_gateway(), cfg_.stack) };
  auto const ctx{ cli_context(cfg_.stack) };

  auto const target{ stack->service_container(ctx, cfg_.service) };
  auto const state{ target->inspect(ctx) };

  std::string status{ state.status };
  if (state.health) { status += " (" + *state.health + ")"; }
  tui::print_stdout(
      "%s %s %s\n", cfg_.service.c_str(), target->id().c_str(), status.c_str());

  if (!cfg_.port.empty()) {
    auto const host_port{ target->mapped_port(ctx, cfg_.port) };
    tui::print_stdout("%s -> %s\n",
                      cfg_.port.c_str(),
                      host_port ? host_port->c_str() : "(not published)");
  }

  if (cfg_.logs) { tui::print_stdout("%s", target->logs(ctx).c_str()); }
}

}  // namespace stackctl
