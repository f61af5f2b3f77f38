#include "project.h"

#include "errors.h"
#include "util.h"

#include <algorithm>
#include <unordered_map>

namespace stackctl {

std::string_view depends_condition_name(depends_condition condition) {
  switch (condition) {
    case depends_condition::service_started: return "service_started";
    case depends_condition::service_healthy: return "service_healthy";
    case depends_condition::service_completed_successfully:
      return "service_completed_successfully";
  }
  return "unknown";
}

std::vector<std::string> project::service_names() const {
  std::vector<std::string> names;
  names.reserve(services.size());
  for (auto const &s : services) { names.push_back(s.name); }
  return names;
}

service const *project::find_service(std::string_view name) const {
  auto const it{
    std::find_if(services.begin(), services.end(), [&](auto const &s) { return s.name == name; })
  };
  return it == services.end() ? nullptr : &*it;
}

label_map_t compose_labels(project const &p, service const &s) {
  std::vector<std::string> files;
  files.reserve(p.config_files.size());
  for (auto const &f : p.config_files) { files.push_back(f.string()); }

  label_map_t labels{
    { kProjectLabel, p.name },
    { kServiceLabel, s.name },
    { kVersionLabel, kComposeVersion },
    { kWorkingDirLabel, p.working_dir.string() },
    { kConfigFilesLabel, util_join(files, ",") },
    { kOneoffLabel, "False" },
  };
  if (p.env_file) { labels.emplace(kEnvironmentFileLabel, p.env_file->string()); }
  return labels;
}

void project_stamp_labels(project &p) {
  for (auto &s : p.services) { s.custom_labels = compose_labels(p, s); }
}

project project_filter_services(project p, std::vector<std::string> requested) {
  if (requested.size() == p.services.size()) { return p; }

  std::sort(requested.begin(), requested.end());

  std::vector<service> retained;
  retained.reserve(std::min(requested.size(), p.services.size()));
  for (auto &s : p.services) {
    if (std::binary_search(requested.begin(), requested.end(), s.name)) {
      retained.push_back(std::move(s));
    }
  }
  p.services = std::move(retained);
  return p;
}

std::vector<std::string> project_dependency_order(project const &p,
                                                  std::vector<std::string> const &targets) {
  enum class mark { none, visiting, done };

  std::unordered_map<std::string, mark> marks;
  std::vector<std::string> order;
  std::vector<std::string> chain;

  auto visit = [&](auto &self, std::string const &name) -> void {
    auto const *s{ p.find_service(name) };
    if (!s) { return; }

    auto &m{ marks[name] };
    if (m == mark::done) { return; }
    if (m == mark::visiting) {
      chain.push_back(name);
      throw compile_error{ "dependency cycle detected: " + util_join(chain, " -> ") };
    }

    m = mark::visiting;
    chain.push_back(name);
    for (auto const &dep : s->depends_on) { self(self, dep.service); }
    chain.pop_back();
    marks[name] = mark::done;
    order.push_back(name);
  };

  // Walk in declaration order so output is stable regardless of request order.
  for (auto const &s : p.services) {
    if (std::find(targets.begin(), targets.end(), s.name) != targets.end()) {
      visit(visit, s.name);
    }
  }
  return order;
}

std::string project_service_image(project const &p, service const &s) {
  if (!s.image.empty()) { return s.image; }
  return p.name + "-" + s.name;
}

}  // namespace stackctl
