#include "readiness.h"

#include <stdexcept>

namespace stackctl {

readiness_fn::readiness_fn(fn_t fn) : fn_{ std::move(fn) } {
  if (!fn_) { throw std::invalid_argument{ "readiness_fn: empty function" }; }
}

void readiness_fn::wait_until_ready(context const &ctx, container const &target) {
  fn_(ctx, target);
}

readiness_all::readiness_all(std::vector<readiness_ptr> strategies)
    : strategies_{ std::move(strategies) } {}

void readiness_all::wait_until_ready(context const &ctx, container const &target) {
  for (auto const &strategy : strategies_) {
    ctx.throw_if_done();
    strategy->wait_until_ready(ctx, target);
  }
}

readiness_ptr make_readiness(readiness_fn::fn_t fn) {
  return std::make_shared<readiness_fn>(std::move(fn));
}

readiness_ptr make_readiness_all(std::vector<readiness_ptr> strategies) {
  return std::make_shared<readiness_all>(std::move(strategies));
}

void readiness_registry::bind(std::string service, readiness_ptr strategy) {
  if (!strategy) { throw std::invalid_argument{ "readiness_registry: null strategy" }; }
  bindings_.insert_or_assign(std::move(service), std::move(strategy));
}

}  // namespace stackctl
