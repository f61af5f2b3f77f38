#pragma once

#include "docker_http.h"
#include "runtime_gateway.h"

#include <chrono>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace stackctl {

// runtime_gateway speaking the Docker Engine HTTP API. Creates one container per service
// ("<project>-<service>-1") on a "<project>_default" bridge network.
class docker_gateway : public runtime_gateway {
 public:
  static constexpr std::chrono::milliseconds kDefaultPollInterval{ 500 };

  explicit docker_gateway(std::shared_ptr<http_transport> transport,
                          std::chrono::milliseconds poll_interval = kDefaultPollInterval);

  void up(context const &ctx, project const &p, up_request const &request) override;
  void down(context const &ctx,
            std::string const &stack_name,
            down_request const &request) override;
  std::vector<container_summary> list_containers(
      context const &ctx,
      container_list_request const &request) override;
  container_state inspect_container(context const &ctx, std::string const &id) override;
  std::string container_logs(context const &ctx, std::string const &id) override;

 private:
  http_response call(context const &ctx,
                     std::string_view method,
                     std::string const &path,
                     std::initializer_list<long> expected,
                     std::string const &body = {},
                     std::string_view content_type = "application/json");

  void up_services(context const &ctx, project const &p, up_request const &request);
  void ensure_network(context const &ctx, std::string const &project_name);
  void ensure_image(context const &ctx, project const &p, service const &s);
  void pull_image(context const &ctx, std::string const &image);
  void build_image(context const &ctx, project const &p, service const &s);
  void remove_container(context const &ctx, std::string const &id);
  void handle_orphans(context const &ctx,
                      project const &p,
                      create_options const &options,
                      std::vector<container_summary> const &existing);
  void wait_for_dependency(context const &ctx,
                           std::string const &service_name,
                           dependency const &dep,
                           std::string const &dep_id);
  void wait_started(context const &ctx, service const &s, std::string const &id);

  std::shared_ptr<http_transport> transport_;
  std::chrono::milliseconds poll_interval_;
};

std::shared_ptr<runtime_gateway> make_docker_gateway();

}  // namespace stackctl
