#pragma once

#include "context.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stackctl {

inline constexpr char kDockerApiVersion[]{ "v1.41" };

struct http_response {
  long status{ 0 };
  std::string body;
};

// One HTTP round trip to the engine API. `path` starts with '/' and excludes the API
// version prefix. Transport failures throw gateway_error; a done context throws
// canceled_error / deadline_exceeded_error.
class http_transport {
 public:
  virtual ~http_transport() = default;

  virtual http_response request(context const &ctx,
                                std::string_view method,
                                std::string const &path,
                                std::string const &body = {},
                                std::string_view content_type = "application/json") = 0;
};

struct docker_endpoint {
  std::string unix_socket;  // empty for TCP
  std::string base_url;     // scheme://authority/<api version>
};

// Resolves DOCKER_HOST (unix:// or tcp://); unset means /var/run/docker.sock.
docker_endpoint docker_endpoint_from_host(std::optional<std::string> const &docker_host);

class curl_transport : public http_transport {
 public:
  explicit curl_transport(docker_endpoint endpoint);

  http_response request(context const &ctx,
                        std::string_view method,
                        std::string const &path,
                        std::string const &body,
                        std::string_view content_type) override;

 private:
  docker_endpoint endpoint_;
};

std::shared_ptr<http_transport> make_docker_transport();

}  // namespace stackctl
