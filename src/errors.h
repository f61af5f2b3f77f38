#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace stackctl {

struct stack_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Environment injection saw a key that an earlier injection already set.
struct duplicate_key_error : stack_error {
  explicit duplicate_key_error(std::string key)
      : stack_error{ "duplicate environment key: " + key }, key_{ std::move(key) } {}

  std::string const &key() const { return key_; }

 private:
  std::string key_;
};

struct compile_error : stack_error {
  using stack_error::stack_error;
};

struct gateway_error : stack_error {
  explicit gateway_error(std::string const &what, std::optional<long> status = std::nullopt)
      : stack_error{ what }, status_{ status } {}

  std::optional<long> status() const { return status_; }

 private:
  std::optional<long> status_;
};

struct service_not_found_error : stack_error {
  explicit service_not_found_error(std::string service)
      : stack_error{ "no container found for service: " + service },
        service_{ std::move(service) } {}

  std::string const &service() const { return service_; }

 private:
  std::string service_;
};

// Caller misuse, e.g. down() or services() before any up().
struct usage_error : stack_error {
  using stack_error::stack_error;
};

struct readiness_error : stack_error {
  using stack_error::stack_error;
};

struct context_error : stack_error {
  using stack_error::stack_error;
};

struct canceled_error : context_error {
  canceled_error() : context_error{ "context canceled" } {}
};

struct deadline_exceeded_error : context_error {
  deadline_exceeded_error() : context_error{ "context deadline exceeded" } {}
};

}  // namespace stackctl
