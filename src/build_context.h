#pragma once

#include <filesystem>
#include <string>

namespace stackctl {

// Uncompressed tar of a docker build context, entry paths relative to `context_dir` and
// sorted so identical trees produce identical archives.
std::string build_context_tar(std::filesystem::path const &context_dir);

}  // namespace stackctl
