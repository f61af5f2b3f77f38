#include "context.h"

#include "errors.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace stackctl {

struct context::state {
  std::shared_ptr<state> parent;
  std::optional<clock::time_point> deadline;

  std::mutex mutex;
  std::condition_variable cv;
  std::optional<reason> canceled;
  std::vector<std::weak_ptr<state>> children;

  void cancel(reason why) {
    std::vector<std::weak_ptr<state>> to_cancel;
    {
      std::lock_guard const lock{ mutex };
      if (canceled) { return; }
      canceled = why;
      to_cancel.swap(children);
    }
    cv.notify_all();

    for (auto const &weak : to_cancel) {
      if (auto child{ weak.lock() }) { child->cancel(why); }
    }
  }

  std::optional<reason> err() {
    {
      std::lock_guard const lock{ mutex };
      if (canceled) { return canceled; }
    }
    if (deadline && clock::now() >= *deadline) { return reason::deadline_exceeded; }
    return std::nullopt;
  }
};

context::context(std::shared_ptr<state> s) : state_{ std::move(s) } {}

context context::background() { return context{ std::make_shared<state>() }; }

context context::derive(std::optional<clock::time_point> deadline) const {
  auto child{ std::make_shared<state>() };
  child->parent = state_;
  child->deadline = state_->deadline;
  if (deadline) {
    child->deadline = child->deadline ? std::min(*child->deadline, *deadline) : *deadline;
  }

  std::optional<reason> inherited;
  {
    std::lock_guard const lock{ state_->mutex };
    if (state_->canceled) {
      inherited = state_->canceled;
    } else {
      // Drop registrations for children that no longer exist.
      std::erase_if(state_->children, [](auto const &w) { return w.expired(); });
      state_->children.push_back(child);
    }
  }
  if (inherited) { child->cancel(*inherited); }

  return context{ std::move(child) };
}

context context::with_cancel() const { return derive(std::nullopt); }

context context::with_timeout(clock::duration timeout) const {
  return derive(clock::now() + timeout);
}

context context::with_deadline(clock::time_point deadline) const { return derive(deadline); }

void context::cancel() const { state_->cancel(reason::canceled); }

bool context::done() const { return state_->err().has_value(); }

std::optional<context::reason> context::err() const { return state_->err(); }

void context::throw_if_done() const {
  if (auto const why{ err() }) {
    if (*why == reason::canceled) { throw canceled_error{}; }
    throw deadline_exceeded_error{};
  }
}

bool context::wait_for(clock::duration duration) const {
  auto until{ clock::now() + duration };
  if (state_->deadline) { until = std::min(until, *state_->deadline); }

  {
    std::unique_lock lock{ state_->mutex };
    state_->cv.wait_until(lock, until, [this] { return state_->canceled.has_value(); });
  }
  return !done();
}

std::optional<context::clock::time_point> context::deadline() const {
  return state_->deadline;
}

std::optional<context::clock::duration> context::remaining() const {
  if (!state_->deadline) { return std::nullopt; }
  return std::max(clock::duration::zero(), *state_->deadline - clock::now());
}

}  // namespace stackctl
