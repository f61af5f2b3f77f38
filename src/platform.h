#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace stackctl::platform {

using env_map_t = std::map<std::string, std::string>;

// Snapshot of the process environment. Entries without '=' are skipped.
env_map_t env_snapshot();

std::optional<std::string> env_var_get(char const *name);
void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);

// Root for stackctl-owned temporary files ($TMPDIR or the system default).
std::filesystem::path temp_root();

bool is_tty();

}  // namespace stackctl::platform
