#pragma once

#include <filesystem>
#include <functional>
#include <istream>
#include <vector>

namespace stackctl {

using manifest_stream_list = std::vector<std::reference_wrapper<std::istream>>;

// <temp_root>/stackctl/<basename(cwd)>-<first 32 hex chars of BLAKE3(cwd)>. Stable per
// working directory, so repeated runs reuse (and overwrite) the same files.
std::filesystem::path manifest_staging_dir(std::filesystem::path const &cwd);

// Writes each stream to docker-compose-<idx>.yaml under manifest_staging_dir(cwd) and
// returns the paths in stream order. Throws stack_error on any I/O failure.
std::vector<std::filesystem::path> stage_manifests(manifest_stream_list const &streams,
                                                   std::filesystem::path const &cwd);

// As above, staged for std::filesystem::current_path(). A failure to read the current
// directory propagates as std::filesystem::filesystem_error.
std::vector<std::filesystem::path> stage_manifests(manifest_stream_list const &streams);

}  // namespace stackctl
