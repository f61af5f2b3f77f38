#include "docker_api.h"

#include "blake3_util.h"
#include "errors.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>

namespace stackctl::docker_api {

using nlohmann::json;

namespace {

std::string port_key(port_mapping const &port) { return port.target + "/" + port.protocol; }

json service_to_json(service const &s) {
  json j{
    { "name", s.name },
    { "image", s.image },
    { "command", s.command },
    { "entrypoint", s.entrypoint },
    { "environment", s.environment },
    { "volumes", s.volumes },
    { "restart", s.restart },
    { "working_dir", s.working_dir },
    { "user", s.user },
    { "hostname", s.hostname },
    { "labels", s.labels },
    { "networks", s.networks },
  };

  json ports = json::array();
  for (auto const &p : s.ports) {
    ports.push_back({ { "host_ip", p.host_ip },
                      { "published", p.published },
                      { "target", p.target },
                      { "protocol", p.protocol } });
  }
  j["ports"] = std::move(ports);

  if (s.build) {
    j["build"] = { { "context", s.build->context.string() },
                   { "dockerfile", s.build->dockerfile },
                   { "args", s.build->args },
                   { "target", s.build->target } };
  }

  if (s.healthcheck) {
    auto const ns = [](auto const &d) -> json {
      return d ? json(d->count()) : json(nullptr);
    };
    j["healthcheck"] = { { "test", s.healthcheck->test },
                         { "interval", ns(s.healthcheck->interval) },
                         { "timeout", ns(s.healthcheck->timeout) },
                         { "start_period", ns(s.healthcheck->start_period) },
                         { "retries", s.healthcheck->retries.value_or(0) },
                         { "disable", s.healthcheck->disable } };
  }
  return j;
}

json restart_policy(std::string const &restart) {
  if (restart.empty()) { return { { "Name", "no" } }; }
  auto const parts{ util_split(restart, ':') };
  json policy{ { "Name", parts[0] } };
  if (parts.size() > 1) {
    try {
      policy["MaximumRetryCount"] = std::stoi(parts[1]);
    } catch (std::exception const &) {
      throw gateway_error{ "invalid restart policy: " + restart };
    }
  }
  return policy;
}

json parse_body(std::string const &body, char const *what) {
  try {
    return json::parse(body);
  } catch (json::parse_error const &e) {
    throw gateway_error{ std::string{ "malformed " } + what + " response: " + e.what() };
  }
}

}  // namespace

std::string url_encode(std::string_view text) {
  std::string out;
  out.reserve(text.size() * 3);
  for (char const c : text) {
    auto const uc{ static_cast<unsigned char>(c) };
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(c);
    } else {
      char buf[4]{};
      std::snprintf(buf, sizeof buf, "%%%02X", static_cast<unsigned int>(uc));
      out.append(buf);
    }
  }
  return out;
}

std::string label_filters_query(std::vector<std::string> const &label_filters) {
  json const filters{ { "label", label_filters } };
  return url_encode(filters.dump());
}

std::string default_network_name(std::string const &project_name) {
  return project_name + "_default";
}

std::string container_name(std::string const &project_name, std::string const &service_name) {
  return project_name + "-" + service_name + "-1";
}

std::string service_config_hash(service const &s) {
  return blake3_hex(service_to_json(s).dump());
}

json container_create_body(project const &p,
                           service const &s,
                           std::string const &network,
                           std::string const &config_hash) {
  json labels(s.labels);
  for (auto const &[k, v] : s.custom_labels) { labels[k] = v; }
  labels[kConfigHashLabel] = config_hash;
  labels[kContainerNumberLabel] = "1";

  json env = json::array();
  for (auto const &[k, v] : s.environment) { env.push_back(k + "=" + v); }

  json body{
    { "Image", project_service_image(p, s) },
    { "Env", std::move(env) },
    { "Labels", std::move(labels) },
  };
  if (!s.command.empty()) { body["Cmd"] = s.command; }
  if (!s.entrypoint.empty()) { body["Entrypoint"] = s.entrypoint; }
  if (!s.working_dir.empty()) { body["WorkingDir"] = s.working_dir; }
  if (!s.user.empty()) { body["User"] = s.user; }
  if (!s.hostname.empty()) { body["Hostname"] = s.hostname; }

  json exposed = json::object();
  json bindings = json::object();
  for (auto const &port : s.ports) {
    auto const key{ port_key(port) };
    exposed[key] = json::object();
    if (!bindings.contains(key)) { bindings[key] = json::array(); }
    bindings[key].push_back({ { "HostIp", port.host_ip }, { "HostPort", port.published } });
  }
  if (!exposed.empty()) { body["ExposedPorts"] = std::move(exposed); }

  if (s.healthcheck) {
    auto const &hc{ *s.healthcheck };
    json check{ { "Test", hc.disable ? std::vector<std::string>{ "NONE" } : hc.test } };
    if (hc.interval) { check["Interval"] = hc.interval->count(); }
    if (hc.timeout) { check["Timeout"] = hc.timeout->count(); }
    if (hc.start_period) { check["StartPeriod"] = hc.start_period->count(); }
    if (hc.retries) { check["Retries"] = *hc.retries; }
    body["Healthcheck"] = std::move(check);
  }

  json binds = json::array();
  json anonymous = json::object();
  for (auto const &volume : s.volumes) {
    if (volume.find(':') == std::string::npos) {
      anonymous[volume] = json::object();
    } else {
      binds.push_back(volume);
    }
  }
  if (!anonymous.empty()) { body["Volumes"] = std::move(anonymous); }

  body["HostConfig"] = {
    { "PortBindings", std::move(bindings) },
    { "Binds", std::move(binds) },
    { "RestartPolicy", restart_policy(s.restart) },
    { "NetworkMode", network },
  };
  body["NetworkingConfig"] = {
    { "EndpointsConfig", { { network, { { "Aliases", json::array({ s.name }) } } } } },
  };
  return body;
}

json network_create_body(std::string const &project_name, std::string const &network) {
  return {
    { "Name", network },
    { "CheckDuplicate", true },
    { "Labels", { { kProjectLabel, project_name }, { kNetworkLabel, "default" } } },
  };
}

image_reference parse_image_reference(std::string const &image) {
  if (image.find('@') != std::string::npos) { return { .from_image = image, .tag = {} }; }

  auto const slash{ image.rfind('/') };
  auto const colon{ image.rfind(':') };
  if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
    return { .from_image = image.substr(0, colon), .tag = image.substr(colon + 1) };
  }
  return { .from_image = image, .tag = "latest" };
}

std::vector<container_summary> parse_container_list(std::string const &body) {
  auto const j = parse_body(body, "container list");
  if (!j.is_array()) { throw gateway_error{ "container list response is not an array" }; }

  std::vector<container_summary> out;
  out.reserve(j.size());
  for (auto const &item : j) {
    container_summary summary{
      .id = item.value("Id", ""),
      .names = item.value("Names", std::vector<std::string>{}),
      .image = item.value("Image", ""),
      .state = item.value("State", ""),
      .status = item.value("Status", ""),
      .labels = {},
    };
    if (auto const it{ item.find("Labels") }; it != item.end() && it->is_object()) {
      summary.labels = it->get<label_map_t>();
    }
    out.push_back(std::move(summary));
  }
  return out;
}

container_state parse_container_inspect(std::string const &body) {
  auto const j = parse_body(body, "container inspect");

  container_state state{};
  state.id = j.value("Id", "");
  state.name = j.value("Name", "");
  if (state.name.starts_with('/')) { state.name.erase(0, 1); }

  if (auto const it{ j.find("State") }; it != j.end() && it->is_object()) {
    state.status = it->value("Status", "");
    state.running = it->value("Running", false);
    state.exit_code = it->value("ExitCode", 0);
    if (auto const health{ it->find("Health") };
        health != it->end() && health->is_object()) {
      state.health = health->value("Status", "");
    }
  }

  if (auto const config{ j.find("Config") }; config != j.end() && config->is_object()) {
    if (auto const labels{ config->find("Labels") };
        labels != config->end() && labels->is_object()) {
      state.labels = labels->get<label_map_t>();
    }
  }

  if (auto const net{ j.find("NetworkSettings") }; net != j.end() && net->is_object()) {
    if (auto const ports{ net->find("Ports") }; ports != net->end() && ports->is_object()) {
      for (auto const &[container_port, bindings] : ports->items()) {
        if (!bindings.is_array()) { continue; }
        for (auto const &binding : bindings) {
          state.ports.push_back(published_port{
              .container_port = container_port,
              .host_ip = binding.value("HostIp", ""),
              .host_port = binding.value("HostPort", ""),
          });
        }
      }
    }
  }

  return state;
}

std::string parse_created_id(std::string const &body) {
  auto const j = parse_body(body, "container create");
  auto id{ j.value("Id", "") };
  if (id.empty()) { throw gateway_error{ "container create response has no Id" }; }
  return id;
}

std::string error_message(std::string const &body) {
  auto const j = json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("message") &&
      j["message"].is_string()) {
    return j["message"].get<std::string>();
  }
  return std::string{ util_trim(body) };
}

std::optional<std::string> stream_error(std::string const &body) {
  for (auto const &line : util_split(body, '\n')) {
    auto const trimmed{ util_trim(line) };
    if (trimmed.empty()) { continue; }

    auto const j = json::parse(std::string{ trimmed }, nullptr, false);
    if (j.is_discarded() || !j.is_object()) { continue; }

    if (auto const it{ j.find("error") }; it != j.end() && it->is_string()) {
      return it->get<std::string>();
    }
    if (auto const it{ j.find("errorDetail") }; it != j.end() && it->is_object()) {
      return it->value("message", std::string{ "unknown error" });
    }
  }
  return std::nullopt;
}

std::string demux_logs(std::string const &raw) {
  auto const is_frame_header = [&](size_t pos) {
    return pos + 8 <= raw.size() && static_cast<unsigned char>(raw[pos]) <= 2 &&
           raw[pos + 1] == '\0' && raw[pos + 2] == '\0' && raw[pos + 3] == '\0';
  };

  if (!is_frame_header(0)) { return raw; }

  std::string out;
  size_t pos{ 0 };
  while (pos < raw.size()) {
    if (!is_frame_header(pos)) { break; }
    std::uint32_t const len{ (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[pos + 4]))
                              << 24) |
                             (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[pos + 5]))
                              << 16) |
                             (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[pos + 6]))
                              << 8) |
                             static_cast<std::uint32_t>(static_cast<unsigned char>(raw[pos + 7])) };
    pos += 8;
    auto const take{ std::min<size_t>(len, raw.size() - pos) };
    out.append(raw, pos, take);
    pos += take;
  }
  return out;
}

}  // namespace stackctl::docker_api
