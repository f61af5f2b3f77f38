#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stackctl {

using label_map_t = std::map<std::string, std::string>;
using env_map_t = std::map<std::string, std::string>;

// Label keys shared with docker compose so stacks stay discoverable by either tool.
inline constexpr char kProjectLabel[]{ "com.docker.compose.project" };
inline constexpr char kServiceLabel[]{ "com.docker.compose.service" };
inline constexpr char kVersionLabel[]{ "com.docker.compose.version" };
inline constexpr char kWorkingDirLabel[]{ "com.docker.compose.project.working_dir" };
inline constexpr char kConfigFilesLabel[]{ "com.docker.compose.project.config_files" };
inline constexpr char kEnvironmentFileLabel[]{
  "com.docker.compose.project.environment_file"
};
inline constexpr char kOneoffLabel[]{ "com.docker.compose.oneoff" };
inline constexpr char kConfigHashLabel[]{ "com.docker.compose.config-hash" };
inline constexpr char kNetworkLabel[]{ "com.docker.compose.network" };

inline constexpr char kComposeVersion[]{ "2.20.2" };

enum class depends_condition {
  service_started,
  service_healthy,
  service_completed_successfully,
};

std::string_view depends_condition_name(depends_condition condition);

struct dependency {
  std::string service;
  depends_condition condition{ depends_condition::service_started };
  bool required{ true };
};

struct build_config {
  std::filesystem::path context;
  std::string dockerfile;
  std::map<std::string, std::string> args;
  std::string target;
};

struct healthcheck_config {
  std::vector<std::string> test;  // e.g. {"CMD-SHELL", "pg_isready"}
  std::optional<std::chrono::nanoseconds> interval;
  std::optional<std::chrono::nanoseconds> timeout;
  std::optional<std::chrono::nanoseconds> start_period;
  std::optional<int> retries;
  bool disable{ false };
};

struct port_mapping {
  std::string host_ip;
  std::string published;  // empty: engine picks a host port
  std::string target;
  std::string protocol{ "tcp" };
};

struct service {
  std::string name;
  std::string image;
  std::optional<build_config> build;
  std::vector<std::string> command;
  std::vector<std::string> entrypoint;
  env_map_t environment;
  std::vector<port_mapping> ports;
  std::vector<std::string> volumes;
  std::vector<dependency> depends_on;
  std::optional<healthcheck_config> healthcheck;
  std::string restart;
  std::string working_dir;
  std::string user;
  std::string hostname;
  label_map_t labels;  // declared in the manifest
  std::vector<std::string> networks;
  std::vector<std::string> profiles;
  label_map_t custom_labels;  // stamped by compose_labels() during compilation
};

struct project {
  std::string name;
  std::vector<service> services;  // compiled (declaration) order
  std::filesystem::path working_dir;
  std::vector<std::filesystem::path> config_files;
  std::optional<std::filesystem::path> env_file;
  env_map_t environment;  // resolved interpolation environment

  std::vector<std::string> service_names() const;
  service const *find_service(std::string_view name) const;
};

// Discovery labels for one service. Pure: depends only on the project name, working
// directory, config files, env file and the service name.
label_map_t compose_labels(project const &p, service const &s);

// Stores compose_labels() on every service.
void project_stamp_labels(project &p);

// Narrows to the requested names, keeping compiled order. Unknown names are ignored.
// When the request has as many names as the project has services it is treated as
// "all services" and the project is returned unchanged.
project project_filter_services(project p, std::vector<std::string> requested);

// `targets` plus their transitive dependencies, dependencies first. Declaration order
// breaks ties. Names not in the project are skipped. Throws compile_error on a cycle.
std::vector<std::string> project_dependency_order(project const &p,
                                                  std::vector<std::string> const &targets);

// The service image name, or "<project>-<service>" for build-only services.
std::string project_service_image(project const &p, service const &s);

}  // namespace stackctl
