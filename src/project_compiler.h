#pragma once

#include "project.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stackctl {

// Inputs accumulated before compilation. Compile options are pure transforms of this.
struct project_options {
  std::vector<std::filesystem::path> config_paths;
  std::string name;
  env_map_t environment;
  std::set<std::string> injected_keys;  // keys set by env_overrides
  std::optional<std::filesystem::path> working_dir;
  std::optional<std::filesystem::path> env_file;
  bool default_config_path{ false };
};

namespace compile_options {

// Fails with duplicate_key_error when an earlier env_overrides set the same key.
struct env_overrides {
  env_map_t values;
};

// Adds the process environment. Never replaces injected keys.
struct inherit_os_env {};

struct name_override {
  std::string name;
};

// With no config paths, look for compose.yaml, compose.yml, docker-compose.yml,
// docker-compose.yaml in the working directory.
struct default_config_path {};

struct env_file {
  std::filesystem::path path;
};

struct working_dir {
  std::filesystem::path path;
};

}  // namespace compile_options

using compile_option_t = std::variant<compile_options::env_overrides,
                                      compile_options::inherit_os_env,
                                      compile_options::name_override,
                                      compile_options::default_config_path,
                                      compile_options::env_file,
                                      compile_options::working_dir>;

project_options project_options_apply(project_options opts, compile_option_t const &option);

// Compiles manifests into a project with discovery labels stamped on every service.
// Throws compile_error (or duplicate_key_error from env_overrides).
project compile_project(std::vector<std::filesystem::path> const &config_paths,
                        std::vector<compile_option_t> const &options);

// $VAR, ${VAR}, ${VAR:-default}, ${VAR-default}, ${VAR:?err}, ${VAR?err}, $$ escape.
std::string interpolate(std::string_view text, env_map_t const &env);

// Go-style durations: "1m30s", "500ms", "1.5s", "2h".
std::chrono::nanoseconds parse_duration(std::string_view text);

// Shell-like word splitting with single/double quotes and backslash escapes.
std::vector<std::string> split_command(std::string_view text);

std::string normalize_project_name(std::string_view raw);

// KEY=VALUE lines; blank lines and '#' comments skipped, optional "export " prefix and
// matching surrounding quotes stripped.
env_map_t parse_env_file(std::string_view text);

}  // namespace stackctl
