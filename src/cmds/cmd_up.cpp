#include "cmd_up.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <utility>

namespace stackctl {

namespace {

constexpr std::chrono::milliseconds kLogPollInterval{ 250 };

}  // namespace

void cmd_up::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("up", "Create and start the stack") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_stack_options(*sub, cfg_ptr->stack);
  sub->add_option("-s,--service", cfg_ptr->services, "Start only these services");
  sub->add_option("--wait-log",
                  cfg_ptr->wait_logs,
                  "Block until SERVICE logs TEXT (SERVICE=TEXT, repeatable)");
  auto *remove{
    sub->add_flag("--remove-orphans", cfg_ptr->remove_orphans, "Remove orphan containers")
  };
  sub->add_flag("--ignore-orphans", cfg_ptr->ignore_orphans, "Do not look for orphans")
      ->excludes(remove);
  sub->add_flag("--wait", cfg_ptr->wait, "Wait for containers to be running/healthy");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_up::cmd_up(cmd_up::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_up::execute() {
  auto stack{ make_cli_stack(cli_gateway(), cfg_.stack) };

  for (auto const &[service, text] : parse_env_assignments(cfg_.wait_logs)) {
    stack->wait_for_service(service, make_log_readiness(text, kLogPollInterval));
  }

  std::vector<up_option_t> options;
  if (!cfg_.services.empty()) { options.push_back(up_options::run_services{ cfg_.services }); }
  options.push_back(up_options::remove_orphans{ cfg_.remove_orphans });
  options.push_back(up_options::ignore_orphans{ cfg_.ignore_orphans });
  options.push_back(up_options::wait{ cfg_.wait });

  stack->up(cli_context(cfg_.stack), options);
  tui::info("Stack %s is up (%s)",
            stack->name().c_str(),
            util_join(stack->services(), ", ").c_str());
}

readiness_ptr make_log_readiness(std::string text, std::chrono::milliseconds interval) {
  return make_readiness([text = std::move(text), interval](context const &ctx,
                                                           container const &target) {
    for (;;) {
      if (target.logs(ctx).find(text) != std::string::npos) { return; }

      auto const state{ target.inspect(ctx) };
      if (!state.running && state.status != "created") {
        throw readiness_error{ "service " + target.service() + " stopped (" + state.status +
                               ") before logging \"" + text + "\"" };
      }
      if (!ctx.wait_for(interval)) { ctx.throw_if_done(); }
    }
  });
}

}  // namespace stackctl
