#pragma once

#include "runtime_gateway.h"

#include <memory>
#include <string>

namespace stackctl {

// A running (or stopped) container of one service, as resolved through the gateway.
class container {
 public:
  container(std::string id, std::string service, std::shared_ptr<runtime_gateway> gateway);

  std::string const &id() const { return id_; }
  std::string const &service() const { return service_; }

  container_state inspect(context const &ctx) const;
  std::string logs(context const &ctx) const;

  // Host port published for `container_port` ("5432" or "5432/udp"); nullopt if unmapped.
  std::optional<std::string> mapped_port(context const &ctx,
                                         std::string const &container_port) const;

 private:
  std::string id_;
  std::string service_;
  std::shared_ptr<runtime_gateway> gateway_;
};

}  // namespace stackctl
