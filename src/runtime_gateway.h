#pragma once

#include "context.h"
#include "project.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stackctl {

enum class recreate_policy { never, diverged, force };

enum class image_removal { none, all, local };

std::string_view image_removal_name(image_removal policy);

struct create_options {
  std::vector<std::string> services;
  recreate_policy recreate{ recreate_policy::diverged };
  recreate_policy recreate_dependencies{ recreate_policy::diverged };
  bool remove_orphans{ false };
  bool ignore_orphans{ false };
};

struct start_options {
  bool wait{ false };  // block until containers are running (healthy when checked)
};

struct up_request {
  create_options create;
  start_options start;
};

struct down_request {
  bool remove_orphans{ false };
  image_removal images{ image_removal::none };
};

struct container_list_request {
  bool all{ true };
  std::vector<std::string> label_filters;  // "key=value"
};

struct container_summary {
  std::string id;
  std::vector<std::string> names;
  std::string image;
  std::string state;  // created, running, exited, ...
  std::string status;
  label_map_t labels;
};

struct published_port {
  std::string container_port;  // "80/tcp"
  std::string host_ip;
  std::string host_port;
};

struct container_state {
  std::string id;
  std::string name;
  std::string status;  // created, running, exited, dead, ...
  bool running{ false };
  std::optional<std::string> health;  // starting, healthy, unhealthy
  int exit_code{ 0 };
  std::vector<published_port> ports;
  label_map_t labels;
};

// Boundary to the container engine. Implementations are expected to be usable from
// several threads at once; readiness checks run concurrently against the same gateway.
class runtime_gateway {
 public:
  virtual ~runtime_gateway() = default;

  virtual void up(context const &ctx, project const &p, up_request const &request) = 0;
  virtual void down(context const &ctx,
                    std::string const &stack_name,
                    down_request const &request) = 0;
  virtual std::vector<container_summary> list_containers(
      context const &ctx,
      container_list_request const &request) = 0;

  virtual container_state inspect_container(context const &ctx, std::string const &id) = 0;
  virtual std::string container_logs(context const &ctx, std::string const &id) = 0;
};

}  // namespace stackctl
