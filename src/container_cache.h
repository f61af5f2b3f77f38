#pragma once

#include "container.h"
#include "context.h"
#include "runtime_gateway.h"
#include "util.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace stackctl {

// Service name -> container, filled on first lookup through a labelled list query and
// never refreshed. A service recreated behind our back keeps returning the old handle
// until clear() is called.
class container_cache : unmovable {
 public:
  container_cache(std::string stack_name, std::shared_ptr<runtime_gateway> gateway);

  // Throws service_not_found_error when the engine reports no matching container.
  std::shared_ptr<container> lookup(context const &ctx, std::string const &service);

  void clear();
  size_t size() const;

 private:
  std::string stack_name_;
  std::shared_ptr<runtime_gateway> gateway_;

  // Readiness tasks resolve different services concurrently; guards the map only.
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<container>> containers_;
};

}  // namespace stackctl
