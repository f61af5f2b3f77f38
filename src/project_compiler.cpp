#include "project_compiler.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

namespace stackctl {

namespace {

constexpr std::array kDefaultConfigNames{
  "compose.yaml", "compose.yml", "docker-compose.yml", "docker-compose.yaml"
};

// Lists whose later definition replaces the earlier one instead of appending.
constexpr std::array kReplacedSequences{ "command", "entrypoint", "test", "profiles" };

bool is_var_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }

bool is_var_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

std::optional<std::string> lookup(env_map_t const &env, std::string const &name) {
  auto const it{ env.find(name) };
  if (it == env.end()) { return std::nullopt; }
  return it->second;
}

// Body of ${...}, already stripped of the braces.
std::string expand_braced(std::string_view body, env_map_t const &env) {
  size_t name_end{ 0 };
  while (name_end < body.size() && is_var_char(body[name_end])) { ++name_end; }
  if (name_end == 0 || !is_var_start(body[0])) {
    throw compile_error{ "invalid interpolation format for \"${" + std::string{ body } +
                         "}\"" };
  }

  std::string const name{ body.substr(0, name_end) };
  auto const value{ lookup(env, name) };
  std::string_view rest{ body.substr(name_end) };

  if (rest.empty()) { return value.value_or(""); }

  bool const colon{ rest.front() == ':' };
  if (colon) { rest.remove_prefix(1); }
  if (rest.empty()) {
    throw compile_error{ "invalid interpolation format for \"${" + std::string{ body } +
                         "}\"" };
  }

  char const op{ rest.front() };
  std::string_view const arg{ rest.substr(1) };
  bool const unset{ !value || (colon && value->empty()) };

  switch (op) {
    case '-': return unset ? interpolate(arg, env) : *value;
    case '+': return unset ? std::string{} : interpolate(arg, env);
    case '?':
      if (unset) {
        auto const msg{ interpolate(arg, env) };
        throw compile_error{ "required variable " + name + " is missing a value" +
                             (msg.empty() ? std::string{} : ": " + msg) };
      }
      return *value;
    default:
      throw compile_error{ "invalid interpolation format for \"${" + std::string{ body } +
                           "}\"" };
  }
}

YAML::Node interpolate_node(YAML::Node const &node, env_map_t const &env) {
  switch (node.Type()) {
    case YAML::NodeType::Scalar: return YAML::Node{ interpolate(node.Scalar(), env) };
    case YAML::NodeType::Sequence: {
      YAML::Node out{ YAML::NodeType::Sequence };
      for (auto const &item : node) { out.push_back(interpolate_node(item, env)); }
      return out;
    }
    case YAML::NodeType::Map: {
      YAML::Node out{ YAML::NodeType::Map };
      for (auto const &kv : node) {
        out[kv.first.Scalar()] = interpolate_node(kv.second, env);
      }
      return out;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined: return node;
  }
  return node;
}

YAML::Node merge_nodes(YAML::Node const &base, YAML::Node const &overlay, std::string_view key) {
  if (base.IsMap() && overlay.IsMap()) {
    YAML::Node out{ YAML::NodeType::Map };
    for (auto const &kv : base) { out[kv.first.Scalar()] = kv.second; }
    for (auto const &kv : overlay) {
      std::string const k{ kv.first.Scalar() };
      YAML::Node const prior{ base[k] };
      out[k] = prior.IsDefined() ? merge_nodes(prior, kv.second, k) : kv.second;
    }
    return out;
  }

  bool const replaced{ std::find(kReplacedSequences.begin(), kReplacedSequences.end(), key) !=
                       kReplacedSequences.end() };
  if (base.IsSequence() && overlay.IsSequence() && !replaced) {
    YAML::Node out{ YAML::NodeType::Sequence };
    for (auto const &item : base) { out.push_back(item); }
    for (auto const &item : overlay) { out.push_back(item); }
    return out;
  }

  return overlay;
}

std::string scalar_of(YAML::Node const &node, std::string_view what) {
  if (!node.IsScalar()) { throw compile_error{ std::string{ what } + " must be a string" }; }
  return node.Scalar();
}

std::vector<std::string> string_list(YAML::Node const &node, std::string_view what) {
  std::vector<std::string> out;
  if (node.IsScalar()) {
    out.push_back(node.Scalar());
  } else if (node.IsSequence()) {
    for (auto const &item : node) { out.push_back(scalar_of(item, what)); }
  } else if (!node.IsNull()) {
    throw compile_error{ std::string{ what } + " must be a string or a list" };
  }
  return out;
}

// Maps as {k: v} or lists as ["k=v"]. Null map values and bare list keys yield nullopt.
std::map<std::string, std::optional<std::string>> key_values(YAML::Node const &node,
                                                            std::string_view what) {
  std::map<std::string, std::optional<std::string>> out;
  if (node.IsMap()) {
    for (auto const &kv : node) {
      if (kv.second.IsNull()) {
        out[kv.first.Scalar()] = std::nullopt;
      } else {
        out[kv.first.Scalar()] = scalar_of(kv.second, what);
      }
    }
  } else if (node.IsSequence()) {
    for (auto const &item : node) {
      auto const entry{ scalar_of(item, what) };
      auto const eq{ entry.find('=') };
      if (eq == std::string::npos) {
        out[entry] = std::nullopt;
      } else {
        out[entry.substr(0, eq)] = entry.substr(eq + 1);
      }
    }
  } else if (!node.IsNull()) {
    throw compile_error{ std::string{ what } + " must be a mapping or a list" };
  }
  return out;
}

std::filesystem::path resolve_path(std::filesystem::path const &wd, std::string const &raw) {
  std::filesystem::path p{ raw };
  if (p.is_relative()) { p = wd / p; }
  return p.lexically_normal();
}

port_mapping parse_port(YAML::Node const &node) {
  port_mapping port{};

  if (node.IsMap()) {
    port.target = scalar_of(node["target"], "ports.target");
    if (node["published"]) { port.published = scalar_of(node["published"], "published"); }
    if (node["host_ip"]) { port.host_ip = scalar_of(node["host_ip"], "host_ip"); }
    if (node["protocol"]) { port.protocol = scalar_of(node["protocol"], "protocol"); }
    return port;
  }

  std::string spec{ scalar_of(node, "ports entry") };
  if (auto const slash{ spec.rfind('/') }; slash != std::string::npos) {
    port.protocol = spec.substr(slash + 1);
    spec.resize(slash);
  }

  auto const parts{ util_split(spec, ':') };
  switch (parts.size()) {
    case 1: port.target = parts[0]; break;
    case 2:
      port.published = parts[0];
      port.target = parts[1];
      break;
    case 3:
      port.host_ip = parts[0];
      port.published = parts[1];
      port.target = parts[2];
      break;
    default: throw compile_error{ "invalid port specification: " + node.Scalar() };
  }

  if (port.target.empty()) {
    throw compile_error{ "invalid port specification: " + node.Scalar() };
  }
  return port;
}

std::vector<dependency> parse_depends_on(YAML::Node const &node) {
  std::vector<dependency> deps;
  if (node.IsSequence()) {
    for (auto const &item : node) {
      deps.push_back(dependency{ .service = scalar_of(item, "depends_on entry") });
    }
    return deps;
  }

  if (!node.IsMap()) { throw compile_error{ "depends_on must be a list or a mapping" }; }

  for (auto const &kv : node) {
    dependency dep{ .service = kv.first.Scalar() };
    if (auto const cond{ kv.second["condition"] }) {
      auto const value{ scalar_of(cond, "depends_on.condition") };
      if (value == "service_started") {
        dep.condition = depends_condition::service_started;
      } else if (value == "service_healthy") {
        dep.condition = depends_condition::service_healthy;
      } else if (value == "service_completed_successfully") {
        dep.condition = depends_condition::service_completed_successfully;
      } else {
        throw compile_error{ "invalid depends_on condition: " + value };
      }
    }
    if (auto const req{ kv.second["required"] }) { dep.required = req.as<bool>(); }
    deps.push_back(std::move(dep));
  }
  return deps;
}

healthcheck_config parse_healthcheck(YAML::Node const &node) {
  if (!node.IsMap()) { throw compile_error{ "healthcheck must be a mapping" }; }

  healthcheck_config hc{};
  if (auto const test{ node["test"] }) {
    if (test.IsScalar()) {
      hc.test = { "CMD-SHELL", test.Scalar() };
    } else {
      hc.test = string_list(test, "healthcheck.test");
    }
  }
  if (auto const v{ node["interval"] }) {
    hc.interval = parse_duration(scalar_of(v, "interval"));
  }
  if (auto const v{ node["timeout"] }) { hc.timeout = parse_duration(scalar_of(v, "timeout")); }
  if (auto const v{ node["start_period"] }) {
    hc.start_period = parse_duration(scalar_of(v, "start_period"));
  }
  if (auto const v{ node["retries"] }) { hc.retries = v.as<int>(); }
  if (auto const v{ node["disable"] }) { hc.disable = v.as<bool>(); }
  return hc;
}

service parse_service(std::string const &name,
                      YAML::Node const &node,
                      std::filesystem::path const &wd,
                      env_map_t const &env) {
  if (!node.IsMap()) { throw compile_error{ "service must be a mapping" }; }

  service s{ .name = name };

  for (auto const &kv : node) {
    std::string const key{ kv.first.Scalar() };
    YAML::Node const &value{ kv.second };

    if (key == "image") {
      s.image = scalar_of(value, key);
    } else if (key == "build") {
      build_config b{};
      if (value.IsScalar()) {
        b.context = resolve_path(wd, value.Scalar());
      } else {
        if (!value.IsMap()) { throw compile_error{ "build must be a string or mapping" }; }
        b.context = resolve_path(wd, value["context"] ? scalar_of(value["context"], "context")
                                                       : std::string{ "." });
        if (value["dockerfile"]) { b.dockerfile = scalar_of(value["dockerfile"], key); }
        if (value["target"]) { b.target = scalar_of(value["target"], key); }
        for (auto const &[k, v] : key_values(value["args"], "build.args")) {
          if (v) {
            b.args[k] = *v;
          } else if (auto const from_env{ lookup(env, k) }) {
            b.args[k] = *from_env;
          }
        }
      }
      s.build = std::move(b);
    } else if (key == "command") {
      s.command = value.IsScalar() ? split_command(value.Scalar()) : string_list(value, key);
    } else if (key == "entrypoint") {
      s.entrypoint = value.IsScalar() ? split_command(value.Scalar()) : string_list(value, key);
    } else if (key == "environment") {
      for (auto const &[k, v] : key_values(value, key)) {
        if (v) {
          s.environment[k] = *v;
        } else if (auto const from_env{ lookup(env, k) }) {
          s.environment[k] = *from_env;
        }
      }
    } else if (key == "env_file") {
      // Declared environment wins; env files only fill gaps.
      for (auto const &file : string_list(value, key)) {
        auto const path{ resolve_path(wd, file) };
        std::string text;
        try {
          text = util_load_text_file(path);
        } catch (std::runtime_error const &e) {
          throw compile_error{ "env_file " + path.string() + ": " + e.what() };
        }
        for (auto const &[k, v] : parse_env_file(text)) { s.environment.try_emplace(k, v); }
      }
    } else if (key == "ports") {
      if (!value.IsSequence()) { throw compile_error{ "ports must be a list" }; }
      for (auto const &item : value) { s.ports.push_back(parse_port(item)); }
    } else if (key == "volumes") {
      for (auto const &volume : string_list(value, key)) {
        if (volume.starts_with("./") || volume.starts_with("../")) {
          auto const colon{ volume.find(':') };
          auto const host{ volume.substr(0, colon) };
          auto const rest{ colon == std::string::npos ? std::string{} : volume.substr(colon) };
          s.volumes.push_back(resolve_path(wd, host).string() + rest);
        } else {
          s.volumes.push_back(volume);
        }
      }
    } else if (key == "depends_on") {
      s.depends_on = parse_depends_on(value);
    } else if (key == "healthcheck") {
      s.healthcheck = parse_healthcheck(value);
    } else if (key == "restart") {
      s.restart = scalar_of(value, key);
    } else if (key == "working_dir") {
      s.working_dir = scalar_of(value, key);
    } else if (key == "user") {
      s.user = scalar_of(value, key);
    } else if (key == "hostname") {
      s.hostname = scalar_of(value, key);
    } else if (key == "labels") {
      for (auto const &[k, v] : key_values(value, key)) { s.labels[k] = v.value_or(""); }
    } else if (key == "networks") {
      if (value.IsMap()) {
        for (auto const &n : value) { s.networks.push_back(n.first.Scalar()); }
      } else {
        s.networks = string_list(value, key);
      }
    } else if (key == "profiles") {
      s.profiles = string_list(value, key);
    } else {
      tui::debug("service %s: ignoring unsupported key '%s'", name.c_str(), key.c_str());
    }
  }

  return s;
}

YAML::Node load_manifest(std::filesystem::path const &path, env_map_t const &env) {
  std::string text;
  try {
    text = util_load_text_file(path);
  } catch (std::runtime_error const &e) { throw compile_error{ e.what() }; }

  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (YAML::Exception const &e) {
    throw compile_error{ path.string() + ": " + e.what() };
  }

  if (root.IsNull()) { return YAML::Node{ YAML::NodeType::Map }; }
  if (!root.IsMap()) { throw compile_error{ path.string() + ": top level must be a mapping" }; }
  return interpolate_node(root, env);
}

std::set<std::string> enabled_profiles(env_map_t const &env) {
  std::set<std::string> profiles;
  if (auto const value{ lookup(env, "COMPOSE_PROFILES") }) {
    for (auto const &p : util_split(*value, ',')) {
      auto const trimmed{ util_trim(p) };
      if (!trimmed.empty()) { profiles.emplace(trimmed); }
    }
  }
  return profiles;
}

bool service_enabled(service const &s, std::set<std::string> const &profiles) {
  if (s.profiles.empty() || profiles.contains("*")) { return true; }
  return std::any_of(s.profiles.begin(), s.profiles.end(), [&](auto const &p) {
    return profiles.contains(p);
  });
}

void validate(project const &p) {
  for (auto const &s : p.services) {
    if (s.image.empty() && !s.build) {
      throw compile_error{ "service " + s.name + " has neither an image nor a build context" };
    }
    for (auto const &dep : s.depends_on) {
      if (!p.find_service(dep.service) && dep.required) {
        throw compile_error{ "service " + s.name + " depends on undefined service " +
                             dep.service };
      }
    }
  }
  project_dependency_order(p, p.service_names());  // throws on cycles
}

}  // namespace

project_options project_options_apply(project_options opts, compile_option_t const &option) {
  std::visit(match{
                 [&](compile_options::env_overrides const &o) {
                   for (auto const &[k, v] : o.values) {
                     if (!opts.injected_keys.insert(k).second) { throw duplicate_key_error{ k }; }
                     opts.environment[k] = v;
                   }
                 },
                 [&](compile_options::inherit_os_env const &) {
                   for (auto const &[k, v] : platform::env_snapshot()) {
                     if (!opts.injected_keys.contains(k)) { opts.environment[k] = v; }
                   }
                 },
                 [&](compile_options::name_override const &o) { opts.name = o.name; },
                 [&](compile_options::default_config_path const &) {
                   opts.default_config_path = true;
                 },
                 [&](compile_options::env_file const &o) { opts.env_file = o.path; },
                 [&](compile_options::working_dir const &o) { opts.working_dir = o.path; },
             },
             option);
  return opts;
}

project compile_project(std::vector<std::filesystem::path> const &config_paths,
                        std::vector<compile_option_t> const &options) {
  project_options opts{ .config_paths = config_paths };
  for (auto const &option : options) { opts = project_options_apply(std::move(opts), option); }

  std::filesystem::path wd;
  if (opts.working_dir) {
    wd = std::filesystem::absolute(*opts.working_dir);
  } else if (!opts.config_paths.empty()) {
    wd = std::filesystem::absolute(opts.config_paths.front()).parent_path();
  } else {
    wd = std::filesystem::current_path();
  }
  wd = wd.lexically_normal();

  if (opts.config_paths.empty() && opts.default_config_path) {
    for (auto const *candidate : kDefaultConfigNames) {
      if (std::filesystem::is_regular_file(wd / candidate)) {
        opts.config_paths.push_back(wd / candidate);
        break;
      }
    }
  }
  if (opts.config_paths.empty()) { throw compile_error{ "no configuration file provided" }; }

  project p{};
  p.working_dir = wd;
  for (auto const &path : opts.config_paths) {
    p.config_files.push_back(std::filesystem::absolute(path).lexically_normal());
  }

  std::optional<std::filesystem::path> env_file{ opts.env_file };
  if (env_file) {
    env_file = resolve_path(wd, env_file->string());
    if (!std::filesystem::is_regular_file(*env_file)) {
      throw compile_error{ "env file not found: " + env_file->string() };
    }
  } else if (std::filesystem::is_regular_file(wd / ".env")) {
    env_file = wd / ".env";
  }

  if (env_file) {
    std::string text;
    try {
      text = util_load_text_file(*env_file);
    } catch (std::runtime_error const &e) { throw compile_error{ e.what() }; }
    for (auto const &[k, v] : parse_env_file(text)) { opts.environment.try_emplace(k, v); }
    p.env_file = env_file;
  }

  YAML::Node merged{ YAML::NodeType::Map };
  for (auto const &path : p.config_files) {
    merged = merge_nodes(merged, load_manifest(path, opts.environment), {});
  }

  YAML::Node const root{ merged };

  std::string raw_name{ opts.name };
  if (raw_name.empty()) {
    raw_name = lookup(opts.environment, "COMPOSE_PROJECT_NAME").value_or("");
  }
  if (raw_name.empty() && root["name"]) { raw_name = scalar_of(root["name"], "name"); }
  if (raw_name.empty()) { raw_name = wd.filename().string(); }
  p.name = normalize_project_name(raw_name);

  YAML::Node const services{ root["services"] };
  if (!services || !services.IsMap()) {
    throw compile_error{ "no services defined in " +
                         p.config_files.front().string() };
  }

  auto const profiles{ enabled_profiles(opts.environment) };
  for (auto const &kv : services) {
    std::string const name{ kv.first.Scalar() };
    service s;
    try {
      s = parse_service(name, kv.second, wd, opts.environment);
    } catch (compile_error const &e) {
      throw compile_error{ "service " + name + ": " + e.what() };
    } catch (YAML::Exception const &e) {
      throw compile_error{ "service " + name + ": " + e.what() };
    }

    if (service_enabled(s, profiles)) {
      p.services.push_back(std::move(s));
    } else {
      tui::debug("service %s disabled by profiles", name.c_str());
    }
  }

  validate(p);

  p.environment = std::move(opts.environment);
  project_stamp_labels(p);

  std::vector<std::string> files;
  for (auto const &f : p.config_files) { files.push_back(f.string()); }
  STACKCTL_TRACE_STACK_COMPILED(p.name,
                                static_cast<std::int64_t>(p.services.size()),
                                util_join(files, ","));
  return p;
}

std::string interpolate(std::string_view text, env_map_t const &env) {
  std::string out;
  out.reserve(text.size());

  for (size_t i{ 0 }; i < text.size();) {
    char const c{ text[i] };
    if (c != '$' || i + 1 >= text.size()) {
      out.push_back(c);
      ++i;
      continue;
    }

    char const next{ text[i + 1] };
    if (next == '$') {
      out.push_back('$');
      i += 2;
    } else if (next == '{') {
      // Find the matching brace; defaults may nest further ${...}.
      int depth{ 1 };
      size_t j{ i + 2 };
      for (; j < text.size() && depth > 0; ++j) {
        if (text[j] == '{') {
          ++depth;
        } else if (text[j] == '}') {
          --depth;
        }
      }
      if (depth != 0) {
        throw compile_error{ "invalid interpolation format for \"" + std::string{ text } + "\"" };
      }
      out.append(expand_braced(text.substr(i + 2, j - i - 3), env));
      i = j;
    } else if (is_var_start(next)) {
      size_t j{ i + 1 };
      while (j < text.size() && is_var_char(text[j])) { ++j; }
      out.append(lookup(env, std::string{ text.substr(i + 1, j - i - 1) }).value_or(""));
      i = j;
    } else {
      out.push_back(c);
      ++i;
    }
  }

  return out;
}

std::chrono::nanoseconds parse_duration(std::string_view text) {
  auto const invalid = [&] {
    return compile_error{ "invalid duration: \"" + std::string{ text } + "\"" };
  };

  std::string_view rest{ util_trim(text) };
  if (rest.empty()) { throw invalid(); }
  if (rest == "0") { return std::chrono::nanoseconds::zero(); }

  double total_ns{ 0 };
  while (!rest.empty()) {
    size_t n{ 0 };
    while (n < rest.size() &&
           (std::isdigit(static_cast<unsigned char>(rest[n])) || rest[n] == '.')) {
      ++n;
    }
    if (n == 0) { throw invalid(); }

    double amount{ 0 };
    try {
      size_t used{ 0 };
      amount = std::stod(std::string{ rest.substr(0, n) }, &used);
      if (used != n) { throw invalid(); }
    } catch (std::invalid_argument const &) {
      throw invalid();
    } catch (std::out_of_range const &) { throw invalid(); }
    rest.remove_prefix(n);

    size_t u{ 0 };
    while (u < rest.size() && std::isalpha(static_cast<unsigned char>(rest[u]))) { ++u; }
    std::string_view const unit{ rest.substr(0, u) };
    rest.remove_prefix(u);

    double scale{ 0 };
    if (unit == "h") {
      scale = 3600e9;
    } else if (unit == "m") {
      scale = 60e9;
    } else if (unit == "s") {
      scale = 1e9;
    } else if (unit == "ms") {
      scale = 1e6;
    } else if (unit == "us") {
      scale = 1e3;
    } else if (unit == "ns") {
      scale = 1;
    } else {
      throw invalid();
    }
    total_ns += amount * scale;
  }

  return std::chrono::nanoseconds{ static_cast<std::int64_t>(std::llround(total_ns)) };
}

std::vector<std::string> split_command(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  bool in_word{ false };

  for (size_t i{ 0 }; i < text.size(); ++i) {
    char const c{ text[i] };
    if (c == '\'') {
      auto const end{ text.find('\'', i + 1) };
      if (end == std::string_view::npos) {
        throw compile_error{ "unterminated quote in command: " + std::string{ text } };
      }
      current.append(text.substr(i + 1, end - i - 1));
      in_word = true;
      i = end;
    } else if (c == '"') {
      size_t j{ i + 1 };
      for (; j < text.size() && text[j] != '"'; ++j) {
        if (text[j] == '\\' && j + 1 < text.size()) { ++j; }
        current.push_back(text[j]);
      }
      if (j >= text.size()) {
        throw compile_error{ "unterminated quote in command: " + std::string{ text } };
      }
      in_word = true;
      i = j;
    } else if (c == '\\' && i + 1 < text.size()) {
      current.push_back(text[++i]);
      in_word = true;
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_word) {
        words.push_back(std::move(current));
        current.clear();
        in_word = false;
      }
    } else {
      current.push_back(c);
      in_word = true;
    }
  }
  if (in_word) { words.push_back(std::move(current)); }
  return words;
}

std::string normalize_project_name(std::string_view raw) {
  std::string name;
  for (char const c : raw) {
    char const lower{ static_cast<char>(std::tolower(static_cast<unsigned char>(c))) };
    if (std::isalnum(static_cast<unsigned char>(lower)) || lower == '_' || lower == '-') {
      name.push_back(lower);
    }
  }

  if (name.empty() || !std::isalnum(static_cast<unsigned char>(name.front()))) {
    throw compile_error{ "invalid project name \"" + std::string{ raw } +
                         "\": must contain only lowercase letters, digits, dashes and "
                         "underscores, and start with a letter or digit" };
  }
  return name;
}

env_map_t parse_env_file(std::string_view text) {
  env_map_t env;
  for (auto const &raw_line : util_split(text, '\n')) {
    std::string_view line{ util_trim(raw_line) };
    if (line.empty() || line.front() == '#') { continue; }
    if (line.starts_with("export ")) { line = util_trim(line.substr(7)); }

    auto const eq{ line.find('=') };
    if (eq == std::string_view::npos) { continue; }

    std::string const key{ util_trim(line.substr(0, eq)) };
    std::string_view value{ util_trim(line.substr(eq + 1)) };
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    if (!key.empty()) { env[key] = std::string{ value }; }
  }
  return env;
}

}  // namespace stackctl
