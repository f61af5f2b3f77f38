#include "container_cache.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

namespace stackctl {

container_cache::container_cache(std::string stack_name,
                                 std::shared_ptr<runtime_gateway> gateway)
    : stack_name_{ std::move(stack_name) }, gateway_{ std::move(gateway) } {}

std::shared_ptr<container> container_cache::lookup(context const &ctx,
                                                   std::string const &service) {
  {
    std::lock_guard const lock{ mutex_ };
    if (auto const it{ containers_.find(service) }; it != containers_.end()) {
      STACKCTL_TRACE_CONTAINER_CACHE_HIT(stack_name_, service, it->second->id());
      return it->second;
    }
  }

  STACKCTL_TRACE_CONTAINER_CACHE_MISS(stack_name_, service);

  auto const summaries{ gateway_->list_containers(
      ctx,
      container_list_request{
          .all = true,
          .label_filters = { std::string{ kProjectLabel } + "=" + stack_name_,
                             std::string{ kServiceLabel } + "=" + service },
      }) };

  STACKCTL_TRACE_CONTAINERS_LISTED(stack_name_,
                                   service,
                                   static_cast<std::int64_t>(summaries.size()));

  if (summaries.empty()) { throw service_not_found_error{ service }; }
  if (summaries.size() > 1) {
    tui::debug("%s: %zu containers match service %s, using %s",
               stack_name_.c_str(),
               summaries.size(),
               service.c_str(),
               summaries.front().id.c_str());
  }

  auto handle{ std::make_shared<container>(summaries.front().id, service, gateway_) };

  std::lock_guard const lock{ mutex_ };
  return containers_.try_emplace(service, std::move(handle)).first->second;
}

void container_cache::clear() {
  std::lock_guard const lock{ mutex_ };
  containers_.clear();
}

size_t container_cache::size() const {
  std::lock_guard const lock{ mutex_ };
  return containers_.size();
}

}  // namespace stackctl
