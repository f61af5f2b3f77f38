#include "task_group.h"

#include <utility>

namespace stackctl {

task_group::task_group(context const &parent) : ctx_{ parent.with_cancel() } {}

task_group::~task_group() {
  ctx_.cancel();
  join_all();
}

void task_group::go(std::function<void(context const &)> task) {
  threads_.emplace_back([this, task = std::move(task)] {
    try {
      task(ctx_);
    } catch (...) {
      {
        std::lock_guard const lock{ mutex_ };
        if (!first_error_) { first_error_ = std::current_exception(); }
      }
      ctx_.cancel();
    }
  });
}

void task_group::wait() {
  join_all();

  std::exception_ptr error;
  {
    std::lock_guard const lock{ mutex_ };
    error = std::exchange(first_error_, nullptr);
  }
  ctx_.cancel();  // group context ends with the group
  if (error) { std::rethrow_exception(error); }
}

void task_group::join_all() {
  for (auto &t : threads_) {
    if (t.joinable()) { t.join(); }
  }
  threads_.clear();
}

}  // namespace stackctl
