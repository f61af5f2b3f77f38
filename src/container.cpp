#include "container.h"

namespace stackctl {

container::container(std::string id,
                     std::string service,
                     std::shared_ptr<runtime_gateway> gateway)
    : id_{ std::move(id) }, service_{ std::move(service) }, gateway_{ std::move(gateway) } {}

container_state container::inspect(context const &ctx) const {
  return gateway_->inspect_container(ctx, id_);
}

std::string container::logs(context const &ctx) const {
  return gateway_->container_logs(ctx, id_);
}

std::optional<std::string> container::mapped_port(context const &ctx,
                                                   std::string const &container_port) const {
  std::string const key{ container_port.find('/') == std::string::npos
                             ? container_port + "/tcp"
                             : container_port };
  for (auto const &port : inspect(ctx).ports) {
    if (port.container_port == key && !port.host_port.empty()) { return port.host_port; }
  }
  return std::nullopt;
}

}  // namespace stackctl
