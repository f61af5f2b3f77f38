#include "cmd_version.h"

#include "tui.h"

#include <CLI/CLI.hpp>
#include <archive.h>
#include <blake3.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

#ifndef STACKCTL_VERSION_STR
#error "STACKCTL_VERSION_STR must be defined by the build system"
#endif

namespace stackctl {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("stackctl version %s", STACKCTL_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  if (curl_info->features & CURL_VERSION_UNIX_SOCKETS) {
    tui::info("  libcurl: %s (unix-sockets)", curl_info->version);
  } else {
    tui::info("  libcurl: %s", curl_info->version);
  }

  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  BLAKE3: %s", BLAKE3_VERSION_STRING);
  tui::info("  nlohmann/json: %d.%d.%d",
            NLOHMANN_JSON_VERSION_MAJOR,
            NLOHMANN_JSON_VERSION_MINOR,
            NLOHMANN_JSON_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace stackctl
