#include "platform.h"

#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

extern "C" char **environ;

namespace stackctl::platform {

env_map_t env_snapshot() {
  env_map_t env;
  for (char **entry{ environ }; entry && *entry; ++entry) {
    char const *const eq{ std::strchr(*entry, '=') };
    if (!eq) { continue; }
    env.emplace(std::string(*entry, static_cast<size_t>(eq - *entry)), std::string(eq + 1));
  }
  return env;
}

std::optional<std::string> env_var_get(char const *name) {
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

std::filesystem::path temp_root() { return std::filesystem::temp_directory_path(); }

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace stackctl::platform
