#pragma once

#include "compose_stack.h"
#include "context.h"
#include "project.h"
#include "project_compiler.h"
#include "runtime_gateway.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace stackctl {

// Options every stack-facing subcommand accepts.
struct stack_cli_cfg {
  std::vector<std::filesystem::path> files;
  std::string project_name;
  std::vector<std::string> env;  // KEY=VALUE
  bool os_env{ false };
  std::optional<double> timeout_seconds;
};

void register_stack_options(CLI::App &sub, stack_cli_cfg &cfg);

// Throws usage_error for entries without '=' or with an empty key.
env_map_t parse_env_assignments(std::vector<std::string> const &assignments);

// Compile options matching the flags: injected env, OS env, name override, default paths.
std::vector<compile_option_t> cli_compile_options(stack_cli_cfg const &cfg);

// The project the flags describe, compiled the way a stack would compile it.
project cli_compile_project(stack_cli_cfg const &cfg);

// The stack name the flags select: the normalized -p value, else the compiled default.
std::string cli_stack_name(stack_cli_cfg const &cfg);

// A stack named after the compiled project (unless -p is given), with env injected.
std::unique_ptr<stack> make_cli_stack(std::shared_ptr<runtime_gateway> gateway,
                                      stack_cli_cfg const &cfg);

// Background context, bounded by --timeout when given.
context cli_context(stack_cli_cfg const &cfg);

// Gateway used by commands; replaceable for tests.
using gateway_factory_t = std::function<std::shared_ptr<runtime_gateway>()>;
std::shared_ptr<runtime_gateway> cli_gateway();
void set_cli_gateway_factory(gateway_factory_t factory);

}  // namespace stackctl
