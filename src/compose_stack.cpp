#include "compose_stack.h"

#include "errors.h"
#include "task_group.h"
#include "trace.h"
#include "tui.h"

#include <stdexcept>

namespace stackctl {

namespace {

std::string stack_name_from(std::vector<stack_option_t> const &options) {
  std::string name;
  for (auto const &option : options) {
    if (auto const *id{ std::get_if<stack_options::stack_identifier>(&option) }) {
      name = id->name;
    }
  }
  return name.empty() ? util_make_uuid() : normalize_project_name(name);
}

}  // namespace

up_settings up_settings_apply(up_settings settings, up_option_t const &option) {
  std::visit(match{
                 [&](up_options::run_services const &o) { settings.services = o.names; },
                 [&](up_options::ignore_orphans const &o) { settings.ignore_orphans = o.value; },
                 [&](up_options::remove_orphans const &o) { settings.remove_orphans = o.value; },
                 [&](up_options::wait const &o) { settings.wait = o.value; },
             },
             option);
  return settings;
}

down_settings down_settings_apply(down_settings settings, down_option_t const &option) {
  std::visit(match{
                 [&](down_options::remove_orphans const &o) {
                   settings.remove_orphans = o.value;
                 },
                 [&](down_options::remove_images const &o) { settings.images = o.policy; },
             },
             option);
  return settings;
}

compose_stack::compose_stack(std::shared_ptr<runtime_gateway> gateway,
                             std::vector<stack_option_t> const &options)
    : gateway_{ std::move(gateway) },
      name_{ stack_name_from(options) },
      cache_{ name_, gateway_ } {
  if (!gateway_) { throw std::invalid_argument("compose_stack: gateway is null"); }

  for (auto const &option : options) {
    std::visit(match{
                   [&](stack_options::stack_files const &o) {
                     paths_.insert(paths_.end(), o.paths.begin(), o.paths.end());
                   },
                   [&](stack_options::stack_readers const &o) {
                     auto const staged{ stage_manifests(o.streams) };
                     paths_.insert(paths_.end(), staged.begin(), staged.end());
                   },
                   [](stack_options::stack_identifier const &) {},
               },
               option);
  }
}

stack &compose_stack::with_env(env_map_t values) {
  std::lock_guard const lock{ mutex_ };

  for (auto const &[key, value] : values) {
    if (injected_keys_.contains(key)) { throw duplicate_key_error{ key }; }
  }
  for (auto const &[key, value] : values) { injected_keys_.insert(key); }
  compile_options_.push_back(compile_options::env_overrides{ std::move(values) });
  return *this;
}

stack &compose_stack::with_os_env() {
  std::lock_guard const lock{ mutex_ };
  compile_options_.push_back(compile_options::inherit_os_env{});
  return *this;
}

stack &compose_stack::wait_for_service(std::string service, readiness_ptr strategy) {
  std::lock_guard const lock{ mutex_ };
  readiness_.bind(std::move(service), std::move(strategy));
  return *this;
}

void compose_stack::up(context const &ctx, std::vector<up_option_t> const &options) {
  std::lock_guard const lock{ mutex_ };

  up_settings settings{};
  for (auto const &option : options) { settings = up_settings_apply(std::move(settings), option); }

  // Identifier and default path go last so caller options cannot override them.
  auto compile_opts{ compile_options_ };
  compile_opts.push_back(compile_options::name_override{ name_ });
  compile_opts.push_back(compile_options::default_config_path{});

  project_.reset();
  auto compiled{ compile_project(paths_, compile_opts) };

  if (!settings.services.empty()) {
    auto const before{ compiled.services.size() };
    compiled = project_filter_services(std::move(compiled), settings.services);
    STACKCTL_TRACE_SERVICES_FILTERED(name_,
                                     static_cast<std::int64_t>(settings.services.size()),
                                     static_cast<std::int64_t>(compiled.services.size()));
    tui::debug("%s: %zu of %zu services selected",
               name_.c_str(),
               compiled.services.size(),
               before);
  }
  project_ = std::move(compiled);

  up_request const request{
    .create = create_options{ .services = settings.services.empty() ? project_->service_names()
                                                                    : settings.services,
                              .recreate = recreate_policy::diverged,
                              .recreate_dependencies = recreate_policy::diverged,
                              .remove_orphans = settings.remove_orphans,
                              .ignore_orphans = settings.ignore_orphans },
    .start = start_options{ .wait = settings.wait },
  };
  gateway_->up(ctx, *project_, request);

  if (readiness_.empty()) { return; }
  await_readiness(ctx);
}

void compose_stack::await_readiness(context const &ctx) {
  task_group group{ ctx };
  for (auto const &binding : readiness_.bindings()) {
    group.go([this, service = binding.first, strategy = binding.second](
                 context const &task_ctx) {
      readiness_trace_scope const trace{ name_, service };
      auto const target{ cache_.lookup(task_ctx, service) };
      strategy->wait_until_ready(task_ctx, *target);
    });
  }
  group.wait();
}

void compose_stack::down(context const &ctx, std::vector<down_option_t> const &options) {
  std::lock_guard const lock{ mutex_ };

  if (!project_) { throw usage_error{ "down called before up on stack " + name_ }; }

  down_settings settings{};
  for (auto const &option : options) {
    settings = down_settings_apply(std::move(settings), option);
  }

  STACKCTL_TRACE_GATEWAY_DOWN(name_,
                              settings.remove_orphans,
                              std::string{ image_removal_name(settings.images) });
  gateway_->down(ctx,
                 project_->name,
                 down_request{ .remove_orphans = settings.remove_orphans,
                               .images = settings.images });
  cache_.clear();
}

std::vector<std::string> compose_stack::services() const {
  std::lock_guard const lock{ mutex_ };
  if (!project_) { throw usage_error{ "services called before up on stack " + name_ }; }
  return project_->service_names();
}

std::shared_ptr<container> compose_stack::service_container(context const &ctx,
                                                            std::string const &service) {
  std::lock_guard const lock{ mutex_ };
  return cache_.lookup(ctx, service);
}

void compose_stack::clear_container_cache() {
  std::lock_guard const lock{ mutex_ };
  cache_.clear();
}

std::unique_ptr<stack> make_compose_stack(std::shared_ptr<runtime_gateway> gateway,
                                          std::vector<stack_option_t> const &options) {
  return std::make_unique<compose_stack>(std::move(gateway), options);
}

}  // namespace stackctl
