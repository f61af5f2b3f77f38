#pragma once

#include "project.h"
#include "runtime_gateway.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stackctl::docker_api {

inline constexpr char kContainerNumberLabel[]{ "com.docker.compose.container-number" };

std::string url_encode(std::string_view text);

// `filters` query value for label filters: {"label":["k=v",...]}, url-encoded.
std::string label_filters_query(std::vector<std::string> const &label_filters);

std::string default_network_name(std::string const &project_name);
std::string container_name(std::string const &project_name, std::string const &service_name);

// BLAKE3 of the canonical JSON form of everything that shapes the container. Stamped as
// com.docker.compose.config-hash and compared to decide whether a container diverged.
std::string service_config_hash(service const &s);

nlohmann::json container_create_body(project const &p,
                                     service const &s,
                                     std::string const &network,
                                     std::string const &config_hash);

nlohmann::json network_create_body(std::string const &project_name, std::string const &network);

struct image_reference {
  std::string from_image;
  std::string tag;  // empty when the reference pins a digest
};

image_reference parse_image_reference(std::string const &image);

std::vector<container_summary> parse_container_list(std::string const &body);
container_state parse_container_inspect(std::string const &body);
std::string parse_created_id(std::string const &body);

// Engine error payloads carry {"message": ...}; falls back to the raw body.
std::string error_message(std::string const &body);

// Pull/build responses stream JSON lines; returns the first reported error.
std::optional<std::string> stream_error(std::string const &body);

// Splits the 8-byte-header multiplexed log stream; TTY streams are returned as-is.
std::string demux_logs(std::string const &raw);

}  // namespace stackctl::docker_api
