#include "test_support.h"

#include "errors.h"

#include <algorithm>
#include <stdexcept>

namespace stackctl::test {

void scripted_transport::on(std::string method, std::string path_prefix, http_response response) {
  on(std::move(method),
     std::move(path_prefix),
     handler_t{ [response = std::move(response)](recorded_request const &) {
       return response;
     } });
}

void scripted_transport::on(std::string method, std::string path_prefix, handler_t handler) {
  std::lock_guard<std::mutex> lock{ mutex_ };
  rules_.push_back(rule{ .method = std::move(method),
                         .path_prefix = std::move(path_prefix),
                         .handler = std::move(handler) });
}

http_response scripted_transport::request(context const &ctx,
                                          std::string_view method,
                                          std::string const &path,
                                          std::string const &body,
                                          std::string_view content_type) {
  ctx.throw_if_done();

  recorded_request req{ .method = std::string{ method },
                        .path = path,
                        .body = body,
                        .content_type = std::string{ content_type } };
  handler_t handler;
  {
    std::lock_guard<std::mutex> lock{ mutex_ };
    requests_.push_back(req);
    auto const it{ std::find_if(rules_.rbegin(), rules_.rend(), [&](rule const &r) {
      return r.method == method && path.starts_with(r.path_prefix);
    }) };
    if (it == rules_.rend()) {
      throw std::logic_error("unscripted request: " + req.method + " " + path);
    }
    handler = it->handler;
  }
  return handler(req);
}

std::vector<recorded_request> scripted_transport::requests() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return requests_;
}

size_t scripted_transport::count(std::string_view method, std::string_view path_prefix) const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return static_cast<size_t>(
      std::count_if(requests_.begin(), requests_.end(), [&](recorded_request const &r) {
        return r.method == method && r.path.starts_with(path_prefix);
      }));
}

void fake_gateway::up(context const &ctx, project const &p, up_request const &request) {
  ctx.throw_if_done();
  std::lock_guard<std::mutex> lock{ mutex_ };
  up_calls_.push_back(up_call{ .compiled = p, .request = request });
  if (up_error) { throw gateway_error{ *up_error }; }
}

void fake_gateway::down(context const &ctx,
                        std::string const &stack_name,
                        down_request const &request) {
  ctx.throw_if_done();
  std::lock_guard<std::mutex> lock{ mutex_ };
  down_calls_.push_back(down_call{ .stack_name = stack_name, .request = request });
  if (down_error) { throw gateway_error{ *down_error }; }
}

std::vector<container_summary> fake_gateway::list_containers(
    context const &ctx,
    container_list_request const &request) {
  ctx.throw_if_done();
  std::lock_guard<std::mutex> lock{ mutex_ };
  list_calls_.push_back(request);

  std::vector<container_summary> out;
  for (auto const &c : containers_) {
    bool const matches{ std::all_of(
        request.label_filters.begin(),
        request.label_filters.end(),
        [&](std::string const &filter) {
          auto const eq{ filter.find('=') };
          auto const it{ c.labels.find(filter.substr(0, eq)) };
          return it != c.labels.end() &&
                 (eq == std::string::npos || it->second == filter.substr(eq + 1));
        }) };
    if (matches) { out.push_back(c); }
  }
  return out;
}

container_state fake_gateway::inspect_container(context const &ctx, std::string const &id) {
  ctx.throw_if_done();
  std::lock_guard<std::mutex> lock{ mutex_ };
  ++inspect_count_;
  auto const it{ states_.find(id) };
  if (it == states_.end()) { throw gateway_error("no such container: " + id, 404); }
  return it->second;
}

std::string fake_gateway::container_logs(context const &ctx, std::string const &id) {
  ctx.throw_if_done();
  return "logs of " + id + "\n";
}

void fake_gateway::add_container(std::string const &stack,
                                 std::string const &service,
                                 std::string const &id,
                                 std::optional<std::string> health) {
  std::lock_guard<std::mutex> lock{ mutex_ };
  label_map_t const labels{ { kProjectLabel, stack }, { kServiceLabel, service } };
  containers_.push_back(container_summary{ .id = id,
                                           .names = { "/" + stack + "-" + service + "-1" },
                                           .image = service + ":latest",
                                           .state = "running",
                                           .status = "Up",
                                           .labels = labels });
  states_[id] = container_state{ .id = id,
                                 .name = stack + "-" + service + "-1",
                                 .status = "running",
                                 .running = true,
                                 .health = std::move(health),
                                 .exit_code = 0,
                                 .ports = { published_port{ .container_port = "80/tcp",
                                                            .host_ip = "0.0.0.0",
                                                            .host_port = "49153" } },
                                 .labels = labels };
}

std::vector<fake_gateway::up_call> fake_gateway::up_calls() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return up_calls_;
}

std::vector<fake_gateway::down_call> fake_gateway::down_calls() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return down_calls_;
}

std::vector<container_list_request> fake_gateway::list_calls() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return list_calls_;
}

size_t fake_gateway::inspect_count() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return inspect_count_;
}

}  // namespace stackctl::test
