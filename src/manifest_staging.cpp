#include "manifest_staging.h"

#include "blake3_util.h"
#include "errors.h"
#include "platform.h"
#include "tui.h"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace stackctl {

std::filesystem::path manifest_staging_dir(std::filesystem::path const &cwd) {
  auto const cwd_str{ cwd.string() };
  auto const base{ cwd.filename().empty() ? cwd.parent_path().filename() : cwd.filename() };
  return platform::temp_root() / "stackctl" /
         (base.string() + "-" + blake3_hex(cwd_str, 32));
}

std::vector<std::filesystem::path> stage_manifests(manifest_stream_list const &streams,
                                                   std::filesystem::path const &cwd) {
  auto const dir{ manifest_staging_dir(cwd) };

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw stack_error("Failed to create staging directory " + dir.string() + ": " +
                      ec.message());
  }

  std::vector<std::filesystem::path> paths;
  paths.reserve(streams.size());
  for (size_t idx{ 0 }; idx < streams.size(); ++idx) {
    std::istream &in{ streams[idx].get() };
    std::string const content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
      throw stack_error("Failed to read manifest stream " + std::to_string(idx));
    }

    auto const path{ dir / ("docker-compose-" + std::to_string(idx) + ".yaml") };
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out) { throw stack_error("Failed to open staged manifest: " + path.string()); }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) { throw stack_error("Failed to write staged manifest: " + path.string()); }

    tui::debug("staged manifest %zu -> %s", idx, path.string().c_str());
    paths.push_back(path);
  }
  return paths;
}

std::vector<std::filesystem::path> stage_manifests(manifest_stream_list const &streams) {
  return stage_manifests(streams, std::filesystem::current_path());
}

}  // namespace stackctl
