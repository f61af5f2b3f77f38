#pragma once

#include <chrono>
#include <memory>
#include <optional>

namespace stackctl {

// Cancellation and deadline token handed to every blocking operation. Copies share
// state; derived contexts are canceled when their parent is canceled or expires.
class context {
 public:
  using clock = std::chrono::steady_clock;

  enum class reason { canceled, deadline_exceeded };

  static context background();

  context with_cancel() const;
  context with_timeout(clock::duration timeout) const;
  context with_deadline(clock::time_point deadline) const;

  void cancel() const;

  bool done() const;
  std::optional<reason> err() const;
  void throw_if_done() const;  // canceled_error or deadline_exceeded_error

  // Sleeps up to `duration`; returns false early once the context is done.
  bool wait_for(clock::duration duration) const;

  std::optional<clock::time_point> deadline() const;
  std::optional<clock::duration> remaining() const;

 private:
  struct state;

  explicit context(std::shared_ptr<state> s);
  context derive(std::optional<clock::time_point> deadline) const;

  std::shared_ptr<state> state_;
};

}  // namespace stackctl
