#include "task_group.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("task_group runs every task and joins before returning") {
  std::atomic_int ran{ 0 };
  stackctl::task_group group{ stackctl::context::background() };
  for (int i{ 0 }; i < 8; ++i) {
    group.go([&ran](stackctl::context const &) { ++ran; });
  }
  CHECK_NOTHROW(group.wait());
  CHECK(ran.load() == 8);
}

TEST_CASE("task_group rethrows the first failure and cancels siblings") {
  std::atomic_bool sibling_observed_cancel{ false };
  auto const start{ std::chrono::steady_clock::now() };

  stackctl::task_group group{ stackctl::context::background() };
  group.go([&](stackctl::context const &ctx) {
    if (!ctx.wait_for(30s)) { sibling_observed_cancel = true; }
  });
  group.go([](stackctl::context const &) { throw std::runtime_error{ "boom" }; });

  CHECK_THROWS_WITH_AS(group.wait(), "boom", std::runtime_error);
  CHECK(sibling_observed_cancel.load());
  CHECK(std::chrono::steady_clock::now() - start < 10s);
}

TEST_CASE("task_group keeps only the first error") {
  stackctl::task_group group{ stackctl::context::background() };
  group.go([](stackctl::context const &) { throw stackctl::readiness_error{ "first" }; });
  group.go([](stackctl::context const &ctx) {
    ctx.wait_for(30s);
    throw stackctl::readiness_error{ "second" };
  });

  CHECK_THROWS_WITH_AS(group.wait(), "first", stackctl::readiness_error);
}

TEST_CASE("task_group context follows the parent") {
  auto const parent{ stackctl::context::background().with_cancel() };
  stackctl::task_group group{ parent };
  CHECK_FALSE(group.ctx().done());
  parent.cancel();
  CHECK(group.ctx().done());
  group.wait();
}

TEST_CASE("task_group destructor joins outstanding tasks") {
  std::atomic_bool finished{ false };
  {
    stackctl::task_group group{ stackctl::context::background() };
    group.go([&finished](stackctl::context const &ctx) {
      ctx.wait_for(30s);
      finished = true;
    });
  }
  CHECK(finished.load());
}
