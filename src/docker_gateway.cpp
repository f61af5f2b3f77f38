#include "docker_gateway.h"

#include "build_context.h"
#include "docker_api.h"
#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace stackctl {

namespace {

std::string project_filter(std::string const &project_name) {
  return std::string{ kProjectLabel } + "=" + project_name;
}

std::string label_or_empty(label_map_t const &labels, char const *key) {
  auto const it{ labels.find(key) };
  return it == labels.end() ? std::string{} : it->second;
}

std::string status_list(std::initializer_list<long> expected) {
  std::vector<std::string> parts;
  for (long const s : expected) { parts.push_back(std::to_string(s)); }
  return util_join(parts, "/");
}

}  // namespace

docker_gateway::docker_gateway(std::shared_ptr<http_transport> transport,
                               std::chrono::milliseconds poll_interval)
    : transport_{ std::move(transport) }, poll_interval_{ poll_interval } {
  if (!transport_) { throw std::invalid_argument("docker_gateway: transport is null"); }
}

http_response docker_gateway::call(context const &ctx,
                                   std::string_view method,
                                   std::string const &path,
                                   std::initializer_list<long> expected,
                                   std::string const &body,
                                   std::string_view content_type) {
  auto response{ transport_->request(ctx, method, path, body, content_type) };
  if (std::find(expected.begin(), expected.end(), response.status) == expected.end()) {
    throw gateway_error(std::string{ method } + " " + path + ": HTTP " +
                            std::to_string(response.status) + " (expected " +
                            status_list(expected) + "): " +
                            docker_api::error_message(response.body),
                        response.status);
  }
  return response;
}

void docker_gateway::up(context const &ctx, project const &p, up_request const &request) {
  STACKCTL_TRACE_GATEWAY_UP_START(p.name, util_join(request.create.services, ","));
  auto const start{ std::chrono::steady_clock::now() };
  auto const elapsed_ms = [&] {
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - start)
                                         .count());
  };

  try {
    up_services(ctx, p, request);
  } catch (std::exception const &) {
    STACKCTL_TRACE_GATEWAY_UP_COMPLETE(p.name, elapsed_ms(), false);
    throw;
  }
  STACKCTL_TRACE_GATEWAY_UP_COMPLETE(p.name, elapsed_ms(), true);
}

void docker_gateway::up_services(context const &ctx,
                                 project const &p,
                                 up_request const &request) {
  auto const &targets{ request.create.services.empty() ? p.service_names()
                                                       : request.create.services };
  auto const order{ project_dependency_order(p, targets) };
  std::set<std::string> const requested(targets.begin(), targets.end());

  ensure_network(ctx, p.name);

  auto const existing{ list_containers(
      ctx,
      container_list_request{ .all = true, .label_filters = { project_filter(p.name) } }) };
  handle_orphans(ctx, p, request.create, existing);

  std::map<std::string, container_summary const *> by_service;
  for (auto const &c : existing) {
    by_service.try_emplace(label_or_empty(c.labels, kServiceLabel), &c);
  }

  auto const network{ docker_api::default_network_name(p.name) };
  std::map<std::string, std::string> started;  // service -> container id

  for (auto const &name : order) {
    auto const *svc{ p.find_service(name) };
    if (!svc) { continue; }

    for (auto const &dep : svc->depends_on) {
      if (auto const it{ started.find(dep.service) }; it != started.end()) {
        wait_for_dependency(ctx, name, dep, it->second);
      }
    }

    ensure_image(ctx, p, *svc);

    auto const hash{ docker_api::service_config_hash(*svc) };
    auto const policy{ requested.contains(name) ? request.create.recreate
                                                : request.create.recreate_dependencies };

    std::string id;
    if (auto const it{ by_service.find(name) }; it != by_service.end()) {
      auto const &current{ *it->second };
      bool const diverged{ label_or_empty(current.labels, kConfigHashLabel) != hash };
      if (policy == recreate_policy::force ||
          (policy == recreate_policy::diverged && diverged)) {
        tui::info("Recreating %s", docker_api::container_name(p.name, name).c_str());
        remove_container(ctx, current.id);
      } else {
        id = current.id;
      }
    }

    if (id.empty()) {
      auto const container_name{ docker_api::container_name(p.name, name) };
      tui::info("Creating %s", container_name.c_str());
      auto const response{ call(
          ctx,
          "POST",
          "/containers/create?name=" + docker_api::url_encode(container_name),
          { 201 },
          docker_api::container_create_body(p, *svc, network, hash).dump()) };
      id = docker_api::parse_created_id(response.body);
    }

    call(ctx, "POST", "/containers/" + id + "/start", { 204, 304 });
    tui::debug("Started %s (%s)", name.c_str(), id.c_str());
    started[name] = id;
  }

  if (request.start.wait) {
    for (auto const &name : order) {
      if (auto const it{ started.find(name) }; it != started.end()) {
        wait_started(ctx, *p.find_service(name), it->second);
      }
    }
  }
}

void docker_gateway::ensure_network(context const &ctx, std::string const &project_name) {
  auto const network{ docker_api::default_network_name(project_name) };
  auto const probe{
    call(ctx, "GET", "/networks/" + docker_api::url_encode(network), { 200, 404 })
  };
  if (probe.status == 200) { return; }

  tui::info("Creating network %s", network.c_str());
  call(ctx,
       "POST",
       "/networks/create",
       { 201, 409 },
       docker_api::network_create_body(project_name, network).dump());
}

void docker_gateway::ensure_image(context const &ctx, project const &p, service const &s) {
  auto const image{ project_service_image(p, s) };
  auto const probe{
    call(ctx, "GET", "/images/" + docker_api::url_encode(image) + "/json", { 200, 404 })
  };
  if (probe.status == 200) { return; }

  if (s.build) {
    build_image(ctx, p, s);
  } else {
    pull_image(ctx, image);
  }
}

void docker_gateway::pull_image(context const &ctx, std::string const &image) {
  tui::info("Pulling %s", image.c_str());
  auto const ref{ docker_api::parse_image_reference(image) };
  std::string path{ "/images/create?fromImage=" + docker_api::url_encode(ref.from_image) };
  if (!ref.tag.empty()) { path += "&tag=" + docker_api::url_encode(ref.tag); }

  auto const response{ call(ctx, "POST", path, { 200 }) };
  if (auto const err{ docker_api::stream_error(response.body) }) {
    throw gateway_error{ "pull " + image + ": " + *err };
  }
}

void docker_gateway::build_image(context const &ctx, project const &p, service const &s) {
  auto const image{ project_service_image(p, s) };
  auto const &build{ *s.build };
  auto const context_dir{ build.context.is_absolute() ? build.context
                                                      : p.working_dir / build.context };
  tui::info("Building %s from %s", image.c_str(), context_dir.string().c_str());

  std::string path{ "/build?t=" + docker_api::url_encode(image) };
  if (!build.dockerfile.empty()) {
    path += "&dockerfile=" + docker_api::url_encode(build.dockerfile);
  }
  if (!build.args.empty()) {
    nlohmann::json const args = build.args;
    path += "&buildargs=" + docker_api::url_encode(args.dump());
  }
  if (!build.target.empty()) { path += "&target=" + docker_api::url_encode(build.target); }

  auto const response{
    call(ctx, "POST", path, { 200 }, build_context_tar(context_dir), "application/x-tar")
  };
  if (auto const err{ docker_api::stream_error(response.body) }) {
    throw gateway_error{ "build " + image + ": " + *err };
  }
}

void docker_gateway::remove_container(context const &ctx, std::string const &id) {
  call(ctx, "DELETE", "/containers/" + id + "?force=true&v=true", { 204, 404 });
}

void docker_gateway::handle_orphans(context const &ctx,
                                    project const &p,
                                    create_options const &options,
                                    std::vector<container_summary> const &existing) {
  if (options.ignore_orphans) { return; }

  for (auto const &c : existing) {
    auto const service_name{ label_or_empty(c.labels, kServiceLabel) };
    if (p.find_service(service_name)) { continue; }

    if (options.remove_orphans) {
      tui::info("Removing orphan container %s (%s)", c.id.c_str(), service_name.c_str());
      remove_container(ctx, c.id);
    } else {
      tui::warn("Found orphan container %s for service %s in stack %s; "
                "remove it with the remove-orphans option",
                c.id.c_str(),
                service_name.c_str(),
                p.name.c_str());
    }
  }
}

void docker_gateway::wait_for_dependency(context const &ctx,
                                         std::string const &service_name,
                                         dependency const &dep,
                                         std::string const &dep_id) {
  if (dep.condition == depends_condition::service_started) { return; }

  tui::debug("%s waiting for %s to be %s",
             service_name.c_str(),
             dep.service.c_str(),
             std::string{ depends_condition_name(dep.condition) }.c_str());

  for (;;) {
    auto const state{ inspect_container(ctx, dep_id) };
    if (dep.condition == depends_condition::service_healthy) {
      if (!state.health) {
        throw gateway_error{ "dependency " + dep.service + " has no healthcheck" };
      }
      if (*state.health == "healthy") { return; }
      if (*state.health == "unhealthy") {
        throw gateway_error{ "dependency " + dep.service + " is unhealthy" };
      }
      if (!state.running) {
        throw gateway_error{ "dependency " + dep.service + " exited before becoming healthy" };
      }
    } else if (!state.running && state.status == "exited") {
      if (state.exit_code == 0) { return; }
      throw gateway_error{ "dependency " + dep.service + " exited with code " +
                           std::to_string(state.exit_code) };
    }

    if (!ctx.wait_for(poll_interval_)) { ctx.throw_if_done(); }
  }
}

void docker_gateway::wait_started(context const &ctx, service const &s, std::string const &id) {
  bool const checked{ s.healthcheck && !s.healthcheck->disable };
  for (;;) {
    auto const state{ inspect_container(ctx, id) };
    if (!state.running && (state.status == "exited" || state.status == "dead")) {
      throw gateway_error{ "service " + s.name + " exited with code " +
                           std::to_string(state.exit_code) };
    }
    if (state.running) {
      if (!checked || !state.health || *state.health == "healthy") { return; }
      if (*state.health == "unhealthy") {
        throw gateway_error{ "service " + s.name + " is unhealthy" };
      }
    }

    if (!ctx.wait_for(poll_interval_)) { ctx.throw_if_done(); }
  }
}

void docker_gateway::down(context const &ctx,
                          std::string const &stack_name,
                          down_request const &request) {
  auto const containers{ list_containers(
      ctx,
      container_list_request{ .all = true, .label_filters = { project_filter(stack_name) } }) };

  std::vector<std::string> images;
  for (auto const &c : containers) {
    auto const service_name{ label_or_empty(c.labels, kServiceLabel) };
    tui::info("Removing %s", c.names.empty() ? c.id.c_str() : c.names.front().c_str());
    call(ctx, "POST", "/containers/" + c.id + "/stop", { 204, 304, 404 });
    remove_container(ctx, c.id);

    bool const local{ c.image == stack_name + "-" + service_name };
    if (request.images == image_removal::all ||
        (request.images == image_removal::local && local)) {
      if (std::find(images.begin(), images.end(), c.image) == images.end()) {
        images.push_back(c.image);
      }
    }
  }

  auto const network{ docker_api::default_network_name(stack_name) };
  call(ctx, "DELETE", "/networks/" + docker_api::url_encode(network), { 204, 404 });

  for (auto const &image : images) {
    auto const response{
      call(ctx, "DELETE", "/images/" + docker_api::url_encode(image), { 200, 404, 409 })
    };
    if (response.status == 409) {
      tui::warn("Image %s is still in use: %s",
                image.c_str(),
                docker_api::error_message(response.body).c_str());
    }
  }
}

std::vector<container_summary> docker_gateway::list_containers(
    context const &ctx,
    container_list_request const &request) {
  std::string path{ "/containers/json?all=" + std::string{ request.all ? "1" : "0" } };
  if (!request.label_filters.empty()) {
    path += "&filters=" + docker_api::label_filters_query(request.label_filters);
  }
  return docker_api::parse_container_list(call(ctx, "GET", path, { 200 }).body);
}

container_state docker_gateway::inspect_container(context const &ctx, std::string const &id) {
  return docker_api::parse_container_inspect(
      call(ctx, "GET", "/containers/" + id + "/json", { 200 }).body);
}

std::string docker_gateway::container_logs(context const &ctx, std::string const &id) {
  return docker_api::demux_logs(
      call(ctx, "GET", "/containers/" + id + "/logs?stdout=1&stderr=1", { 200 }).body);
}

std::shared_ptr<runtime_gateway> make_docker_gateway() {
  return std::make_shared<docker_gateway>(make_docker_transport());
}

}  // namespace stackctl
