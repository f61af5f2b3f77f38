#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace stackctl {

namespace trace_events {

struct stack_compiled {
  std::string stack;
  std::int64_t service_count;
  std::string config_files;
};

struct services_filtered {
  std::string stack;
  std::int64_t requested;
  std::int64_t retained;
};

struct gateway_up_start {
  std::string stack;
  std::string services;
};

struct gateway_up_complete {
  std::string stack;
  std::int64_t duration_ms;
  bool ok;
};

struct gateway_down {
  std::string stack;
  bool remove_orphans;
  std::string images;
};

struct readiness_start {
  std::string stack;
  std::string service;
};

struct readiness_complete {
  std::string stack;
  std::string service;
  std::int64_t duration_ms;
  bool ok;
};

struct container_cache_hit {
  std::string stack;
  std::string service;
  std::string container_id;
};

struct container_cache_miss {
  std::string stack;
  std::string service;
};

struct containers_listed {
  std::string stack;
  std::string service;
  std::int64_t count;
};

struct http_request {
  std::string method;
  std::string path;
  std::int64_t status;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::stack_compiled,
                                   trace_events::services_filtered,
                                   trace_events::gateway_up_start,
                                   trace_events::gateway_up_complete,
                                   trace_events::gateway_down,
                                   trace_events::readiness_start,
                                   trace_events::readiness_complete,
                                   trace_events::container_cache_hit,
                                   trace_events::container_cache_miss,
                                   trace_events::containers_listed,
                                   trace_events::http_request>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits readiness_start on construction and readiness_complete on destruction;
// ok is false when the scope unwinds through an exception.
struct readiness_trace_scope {
  std::string stack;
  std::string service;
  std::chrono::steady_clock::time_point start;
  int uncaught_at_entry;

  readiness_trace_scope(std::string stack_name, std::string service_name);
  ~readiness_trace_scope();
};

}  // namespace stackctl

#define STACKCTL_TRACE_UNLIKELY [[unlikely]]

#define STACKCTL_TRACE_EMIT(event_expr) \
  do { \
    if (::stackctl::tui::g_trace_enabled) STACKCTL_TRACE_UNLIKELY { \
        ::stackctl::tui::trace event_expr; \
      } \
  } while (0)

#define STACKCTL_TRACE_STACK_COMPILED(stack_value, count_value, files_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::stack_compiled{ \
      .stack = (stack_value), \
      .service_count = (count_value), \
      .config_files = (files_value), \
  }))

#define STACKCTL_TRACE_SERVICES_FILTERED(stack_value, requested_value, retained_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::services_filtered{ \
      .stack = (stack_value), \
      .requested = (requested_value), \
      .retained = (retained_value), \
  }))

#define STACKCTL_TRACE_GATEWAY_UP_START(stack_value, services_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::gateway_up_start{ \
      .stack = (stack_value), \
      .services = (services_value), \
  }))

#define STACKCTL_TRACE_GATEWAY_UP_COMPLETE(stack_value, duration_value, ok_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::gateway_up_complete{ \
      .stack = (stack_value), \
      .duration_ms = (duration_value), \
      .ok = (ok_value), \
  }))

#define STACKCTL_TRACE_GATEWAY_DOWN(stack_value, remove_orphans_value, images_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::gateway_down{ \
      .stack = (stack_value), \
      .remove_orphans = (remove_orphans_value), \
      .images = (images_value), \
  }))

#define STACKCTL_TRACE_READINESS_START(stack_value, service_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::readiness_start{ \
      .stack = (stack_value), \
      .service = (service_value), \
  }))

#define STACKCTL_TRACE_READINESS_COMPLETE(stack_value, \
                                          service_value, \
                                          duration_value, \
                                          ok_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::readiness_complete{ \
      .stack = (stack_value), \
      .service = (service_value), \
      .duration_ms = (duration_value), \
      .ok = (ok_value), \
  }))

#define STACKCTL_TRACE_CONTAINER_CACHE_HIT(stack_value, service_value, id_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::container_cache_hit{ \
      .stack = (stack_value), \
      .service = (service_value), \
      .container_id = (id_value), \
  }))

#define STACKCTL_TRACE_CONTAINER_CACHE_MISS(stack_value, service_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::container_cache_miss{ \
      .stack = (stack_value), \
      .service = (service_value), \
  }))

#define STACKCTL_TRACE_CONTAINERS_LISTED(stack_value, service_value, count_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::containers_listed{ \
      .stack = (stack_value), \
      .service = (service_value), \
      .count = (count_value), \
  }))

#define STACKCTL_TRACE_HTTP_REQUEST(method_value, path_value, status_value, duration_value) \
  STACKCTL_TRACE_EMIT((::stackctl::trace_events::http_request{ \
      .method = (method_value), \
      .path = (path_value), \
      .status = (status_value), \
      .duration_ms = (duration_value), \
  }))
