#pragma once

#include "container.h"
#include "context.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stackctl {

// Decides when a container is fit for use. Implementations must return promptly (by
// throwing) once `ctx` is done; failures are reported by throwing.
class readiness_strategy {
 public:
  virtual ~readiness_strategy() = default;
  virtual void wait_until_ready(context const &ctx, container const &target) = 0;
};

using readiness_ptr = std::shared_ptr<readiness_strategy>;

class readiness_fn : public readiness_strategy {
 public:
  using fn_t = std::function<void(context const &, container const &)>;

  explicit readiness_fn(fn_t fn);
  void wait_until_ready(context const &ctx, container const &target) override;

 private:
  fn_t fn_;
};

// Runs each strategy in turn; all must pass.
class readiness_all : public readiness_strategy {
 public:
  explicit readiness_all(std::vector<readiness_ptr> strategies);
  void wait_until_ready(context const &ctx, container const &target) override;

 private:
  std::vector<readiness_ptr> strategies_;
};

readiness_ptr make_readiness(readiness_fn::fn_t fn);
readiness_ptr make_readiness_all(std::vector<readiness_ptr> strategies);

// Service name -> strategy. A later binding for the same service replaces the earlier.
class readiness_registry {
 public:
  using map_t = std::map<std::string, readiness_ptr>;

  void bind(std::string service, readiness_ptr strategy);
  bool empty() const { return bindings_.empty(); }
  size_t size() const { return bindings_.size(); }
  map_t const &bindings() const { return bindings_; }

 private:
  map_t bindings_;
};

}  // namespace stackctl
