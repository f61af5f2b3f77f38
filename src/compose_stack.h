#pragma once

#include "container.h"
#include "container_cache.h"
#include "context.h"
#include "manifest_staging.h"
#include "project.h"
#include "project_compiler.h"
#include "readiness.h"
#include "runtime_gateway.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace stackctl {

namespace stack_options {

struct stack_files {
  std::vector<std::filesystem::path> paths;
};

// Staged to manifest_staging_dir(cwd) while the option is applied.
struct stack_readers {
  manifest_stream_list streams;
};

// Normalized like any project name; compile_error when nothing valid remains.
struct stack_identifier {
  std::string name;
};

}  // namespace stack_options

using stack_option_t = std::variant<stack_options::stack_files,
                                    stack_options::stack_readers,
                                    stack_options::stack_identifier>;

namespace up_options {

struct run_services {
  std::vector<std::string> names;
};

struct ignore_orphans {
  bool value{ true };
};

struct remove_orphans {
  bool value{ true };
};

struct wait {
  bool value{ true };
};

}  // namespace up_options

using up_option_t = std::variant<up_options::run_services,
                                 up_options::ignore_orphans,
                                 up_options::remove_orphans,
                                 up_options::wait>;

namespace down_options {

struct remove_orphans {
  bool value{ true };
};

struct remove_images {
  image_removal policy{ image_removal::all };
};

}  // namespace down_options

using down_option_t = std::variant<down_options::remove_orphans, down_options::remove_images>;

struct up_settings {
  std::vector<std::string> services;
  bool ignore_orphans{ false };
  bool remove_orphans{ false };
  bool wait{ false };
};

struct down_settings {
  bool remove_orphans{ false };
  image_removal images{ image_removal::none };
};

// Options apply in order; a later option of the same kind wins.
up_settings up_settings_apply(up_settings settings, up_option_t const &option);
down_settings down_settings_apply(down_settings settings, down_option_t const &option);

// Lifecycle of one compose stack. Every member call is serialized against every other
// on the same instance, for its full duration.
class stack {
 public:
  virtual ~stack() = default;

  virtual std::string name() const = 0;

  // Throws duplicate_key_error if an earlier call injected any of the keys; the call
  // then has no effect.
  virtual stack &with_env(env_map_t values) = 0;
  virtual stack &with_os_env() = 0;

  // Replaces any strategy already bound to `service`.
  virtual stack &wait_for_service(std::string service, readiness_ptr strategy) = 0;

  virtual void up(context const &ctx, std::vector<up_option_t> const &options = {}) = 0;
  virtual void down(context const &ctx, std::vector<down_option_t> const &options = {}) = 0;

  // Compiled service names in declaration order. usage_error before up().
  virtual std::vector<std::string> services() const = 0;

  virtual std::shared_ptr<container> service_container(context const &ctx,
                                                       std::string const &service) = 0;
  virtual void clear_container_cache() = 0;
};

class compose_stack : public stack, unmovable {
 public:
  compose_stack(std::shared_ptr<runtime_gateway> gateway,
                std::vector<stack_option_t> const &options);

  std::string name() const override { return name_; }

  stack &with_env(env_map_t values) override;
  stack &with_os_env() override;
  stack &wait_for_service(std::string service, readiness_ptr strategy) override;

  void up(context const &ctx, std::vector<up_option_t> const &options = {}) override;
  void down(context const &ctx, std::vector<down_option_t> const &options = {}) override;

  std::vector<std::string> services() const override;
  std::shared_ptr<container> service_container(context const &ctx,
                                               std::string const &service) override;
  void clear_container_cache() override;

  std::vector<std::filesystem::path> const &config_paths() const { return paths_; }

 private:
  void await_readiness(context const &ctx);

  std::shared_ptr<runtime_gateway> gateway_;
  std::string name_;
  std::vector<std::filesystem::path> paths_;
  std::vector<compile_option_t> compile_options_;
  std::set<std::string> injected_keys_;
  readiness_registry readiness_;
  container_cache cache_;
  std::optional<project> project_;

  mutable std::mutex mutex_;
};

// Default stack name is a random UUID.
std::unique_ptr<stack> make_compose_stack(std::shared_ptr<runtime_gateway> gateway,
                                          std::vector<stack_option_t> const &options = {});

}  // namespace stackctl
