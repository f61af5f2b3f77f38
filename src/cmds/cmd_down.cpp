#include "cmd_down.h"

#include "trace.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace stackctl {

void cmd_down::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("down", "Stop and remove the stack") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_stack_options(*sub, cfg_ptr->stack);
  sub->add_flag("--remove-orphans", cfg_ptr->remove_orphans, "Remove orphan containers");

  std::map<std::string, image_removal> const policies{
    { "none", image_removal::none },
    { "all", image_removal::all },
    { "local", image_removal::local },
  };
  sub->add_option("--rmi", cfg_ptr->images, "Remove images: none, all or local")
      ->transform(CLI::CheckedTransformer(policies, CLI::ignore_case));
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_down::cmd_down(cmd_down::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_down::execute() {
  auto const name{ cli_stack_name(cfg_.stack) };

  STACKCTL_TRACE_GATEWAY_DOWN(name,
                              cfg_.remove_orphans,
                              std::string{ image_removal_name(cfg_.images) });
  cli_gateway()->down(cli_context(cfg_.stack),
                      name,
                      down_request{ .remove_orphans = cfg_.remove_orphans,
                                    .images = cfg_.images });
  tui::info("Stack %s is down", name.c_str());
}

}  // namespace stackctl
