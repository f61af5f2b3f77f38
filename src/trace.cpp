#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <exception>
#include <sstream>
#include <string>

namespace stackctl {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start)
                                       .count());
}

}  // namespace

readiness_trace_scope::readiness_trace_scope(std::string stack_name,
                                             std::string service_name)
    : stack{ std::move(stack_name) },
      service{ std::move(service_name) },
      start{ std::chrono::steady_clock::now() },
      uncaught_at_entry{ std::uncaught_exceptions() } {
  STACKCTL_TRACE_READINESS_START(stack, service);
}

readiness_trace_scope::~readiness_trace_scope() {
  bool const ok{ std::uncaught_exceptions() == uncaught_at_entry };
  STACKCTL_TRACE_READINESS_COMPLETE(stack, service, elapsed_ms(start), ok);
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(stack_compiled),
                        TRACE_NAME(services_filtered),
                        TRACE_NAME(gateway_up_start),
                        TRACE_NAME(gateway_up_complete),
                        TRACE_NAME(gateway_down),
                        TRACE_NAME(readiness_start),
                        TRACE_NAME(readiness_complete),
                        TRACE_NAME(container_cache_hit),
                        TRACE_NAME(container_cache_miss),
                        TRACE_NAME(containers_listed),
                        TRACE_NAME(http_request),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(
      match{
          [&](trace_events::stack_compiled const &value) {
            oss << " stack=" << value.stack << " services=" << value.service_count
                << " files=" << value.config_files;
          },
          [&](trace_events::services_filtered const &value) {
            oss << " stack=" << value.stack << " requested=" << value.requested
                << " retained=" << value.retained;
          },
          [&](trace_events::gateway_up_start const &value) {
            oss << " stack=" << value.stack << " services=" << value.services;
          },
          [&](trace_events::gateway_up_complete const &value) {
            oss << " stack=" << value.stack << " duration_ms=" << value.duration_ms
                << " ok=" << bool_string(value.ok);
          },
          [&](trace_events::gateway_down const &value) {
            oss << " stack=" << value.stack
                << " remove_orphans=" << bool_string(value.remove_orphans)
                << " images=" << (value.images.empty() ? "none" : value.images);
          },
          [&](trace_events::readiness_start const &value) {
            oss << " stack=" << value.stack << " service=" << value.service;
          },
          [&](trace_events::readiness_complete const &value) {
            oss << " stack=" << value.stack << " service=" << value.service
                << " duration_ms=" << value.duration_ms
                << " ok=" << bool_string(value.ok);
          },
          [&](trace_events::container_cache_hit const &value) {
            oss << " stack=" << value.stack << " service=" << value.service
                << " container=" << value.container_id;
          },
          [&](trace_events::container_cache_miss const &value) {
            oss << " stack=" << value.stack << " service=" << value.service;
          },
          [&](trace_events::containers_listed const &value) {
            oss << " stack=" << value.stack << " service=" << value.service
                << " count=" << value.count;
          },
          [&](trace_events::http_request const &value) {
            oss << " " << value.method << " " << value.path << " status=" << value.status
                << " duration_ms=" << value.duration_ms;
          },
      },
      event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(match{
                 [&](trace_events::stack_compiled const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "service_count", value.service_count);
                   append_kv(output, "config_files", value.config_files);
                 },
                 [&](trace_events::services_filtered const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "requested", value.requested);
                   append_kv(output, "retained", value.retained);
                 },
                 [&](trace_events::gateway_up_start const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "services", value.services);
                 },
                 [&](trace_events::gateway_up_complete const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "duration_ms", value.duration_ms);
                   append_kv(output, "ok", value.ok);
                 },
                 [&](trace_events::gateway_down const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "remove_orphans", value.remove_orphans);
                   append_kv(output, "images", value.images);
                 },
                 [&](trace_events::readiness_start const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "service", value.service);
                 },
                 [&](trace_events::readiness_complete const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "service", value.service);
                   append_kv(output, "duration_ms", value.duration_ms);
                   append_kv(output, "ok", value.ok);
                 },
                 [&](trace_events::container_cache_hit const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "service", value.service);
                   append_kv(output, "container_id", value.container_id);
                 },
                 [&](trace_events::container_cache_miss const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "service", value.service);
                 },
                 [&](trace_events::containers_listed const &value) {
                   append_kv(output, "stack", value.stack);
                   append_kv(output, "service", value.service);
                   append_kv(output, "count", value.count);
                 },
                 [&](trace_events::http_request const &value) {
                   append_kv(output, "method", value.method);
                   append_kv(output, "path", value.path);
                   append_kv(output, "status", value.status);
                   append_kv(output, "duration_ms", value.duration_ms);
                 },
             },
             event);

  output.push_back('}');
  return output;
}

}  // namespace stackctl
