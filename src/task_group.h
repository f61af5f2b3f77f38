#pragma once

#include "context.h"
#include "util.h"

#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace stackctl {

// Runs tasks on their own threads. The first task to throw cancels the group context;
// wait() joins everything and rethrows that first exception. Later failures are dropped.
class task_group : unmovable {
 public:
  explicit task_group(context const &parent);
  ~task_group();

  context const &ctx() const { return ctx_; }

  void go(std::function<void(context const &)> task);
  void wait();

 private:
  void join_all();

  context ctx_;
  std::vector<std::thread> threads_;
  std::mutex mutex_;
  std::exception_ptr first_error_;
};

}  // namespace stackctl
