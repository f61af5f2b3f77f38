#include "cmd_common.h"

#include "docker_gateway.h"
#include "errors.h"
#include "util.h"

#include <CLI/CLI.hpp>

#include <chrono>
#include <mutex>
#include <utility>

namespace stackctl {

namespace {

std::mutex s_factory_mutex;
gateway_factory_t s_gateway_factory;

}  // namespace

void register_stack_options(CLI::App &sub, stack_cli_cfg &cfg) {
  sub.add_option("-f,--file", cfg.files, "Compose manifest (repeatable; default: compose.yaml)")
      ->check(CLI::ExistingFile);
  sub.add_option("-p,--project-name", cfg.project_name, "Stack name");
  sub.add_option("-e,--env", cfg.env, "Inject KEY=VALUE into interpolation (repeatable)");
  sub.add_flag("--os-env", cfg.os_env, "Interpolate from the process environment too");
  sub.add_option("--timeout", cfg.timeout_seconds, "Give up after this many seconds")
      ->check(CLI::PositiveNumber);
}

env_map_t parse_env_assignments(std::vector<std::string> const &assignments) {
  env_map_t env;
  for (auto const &assignment : assignments) {
    auto const eq{ assignment.find('=') };
    if (eq == std::string::npos || eq == 0) {
      throw usage_error{ "expected KEY=VALUE, got \"" + assignment + "\"" };
    }
    env.insert_or_assign(assignment.substr(0, eq), assignment.substr(eq + 1));
  }
  return env;
}

std::vector<compile_option_t> cli_compile_options(stack_cli_cfg const &cfg) {
  std::vector<compile_option_t> options;
  if (!cfg.env.empty()) {
    options.push_back(compile_options::env_overrides{ parse_env_assignments(cfg.env) });
  }
  if (cfg.os_env) { options.push_back(compile_options::inherit_os_env{}); }
  if (!cfg.project_name.empty()) {
    options.push_back(compile_options::name_override{ cfg.project_name });
  }
  options.push_back(compile_options::default_config_path{});
  return options;
}

project cli_compile_project(stack_cli_cfg const &cfg) {
  return compile_project(cfg.files, cli_compile_options(cfg));
}

std::string cli_stack_name(stack_cli_cfg const &cfg) {
  return cfg.project_name.empty() ? cli_compile_project(cfg).name
                                  : normalize_project_name(cfg.project_name);
}

std::unique_ptr<stack> make_cli_stack(std::shared_ptr<runtime_gateway> gateway,
                                      stack_cli_cfg const &cfg) {
  auto const name{ cli_stack_name(cfg) };

  auto s{ make_compose_stack(std::move(gateway),
                             { stack_options::stack_files{ cfg.files },
                               stack_options::stack_identifier{ name } }) };
  if (!cfg.env.empty()) { s->with_env(parse_env_assignments(cfg.env)); }
  if (cfg.os_env) { s->with_os_env(); }
  return s;
}

context cli_context(stack_cli_cfg const &cfg) {
  auto const ctx{ context::background() };
  if (!cfg.timeout_seconds) { return ctx; }
  return ctx.with_timeout(std::chrono::duration_cast<context::clock::duration>(
      std::chrono::duration<double>{ *cfg.timeout_seconds }));
}

std::shared_ptr<runtime_gateway> cli_gateway() {
  std::lock_guard const lock{ s_factory_mutex };
  return s_gateway_factory ? s_gateway_factory() : make_docker_gateway();
}

void set_cli_gateway_factory(gateway_factory_t factory) {
  std::lock_guard const lock{ s_factory_mutex };
  s_gateway_factory = std::move(factory);
}

}  // namespace stackctl
