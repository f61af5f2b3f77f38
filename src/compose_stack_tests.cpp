#include "compose_stack.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct manifest_dir {
  explicit manifest_dir(std::string_view yaml)
      : path{ std::filesystem::temp_directory_path() /
              ("stackctl-stack-test-" + stackctl::util_make_uuid()) },
        cleanup{ path } {
    std::filesystem::create_directories(path);
    std::ofstream{ manifest() } << yaml;
  }

  std::filesystem::path manifest() const { return path / "compose.yaml"; }

  std::filesystem::path path;
  stackctl::scoped_path_cleanup cleanup;
};

constexpr char kDbApi[]{ R"(
services:
  db:
    image: postgres:16
    healthcheck:
      test: ["CMD-SHELL", "pg_isready"]
  api:
    image: example/api:1.0
    depends_on:
      db:
        condition: service_healthy
)" };

constexpr char kFourServices[]{ R"(
services:
  a: { image: alpine }
  b: { image: alpine }
  c: { image: alpine }
  d: { image: alpine }
)" };

struct fixture {
  explicit fixture(std::string_view yaml, std::string name = "teststack")
      : dir{ yaml },
        gateway{ std::make_shared<stackctl::test::fake_gateway>() },
        stack{ stackctl::make_compose_stack(
            gateway,
            { stackctl::stack_options::stack_files{ { dir.manifest() } },
              stackctl::stack_options::stack_identifier{ std::move(name) } }) } {}

  manifest_dir dir;
  std::shared_ptr<stackctl::test::fake_gateway> gateway;
  std::unique_ptr<stackctl::stack> stack;
};

stackctl::context bg() { return stackctl::context::background(); }

}  // namespace

TEST_CASE("up settings: later options win") {
  stackctl::up_settings s{};
  s = stackctl::up_settings_apply(s, stackctl::up_options::wait{});
  s = stackctl::up_settings_apply(s, stackctl::up_options::run_services{ { "a" } });
  s = stackctl::up_settings_apply(s, stackctl::up_options::run_services{ { "b", "c" } });
  s = stackctl::up_settings_apply(s, stackctl::up_options::remove_orphans{});
  s = stackctl::up_settings_apply(s, stackctl::up_options::remove_orphans{ false });
  CHECK(s.wait);
  CHECK(s.services == std::vector<std::string>({ "b", "c" }));
  CHECK_FALSE(s.remove_orphans);
  CHECK_FALSE(s.ignore_orphans);
}

TEST_CASE("down settings: later options win") {
  stackctl::down_settings s{};
  s = stackctl::down_settings_apply(
      s, stackctl::down_options::remove_images{ stackctl::image_removal::all });
  s = stackctl::down_settings_apply(
      s, stackctl::down_options::remove_images{ stackctl::image_removal::local });
  s = stackctl::down_settings_apply(s, stackctl::down_options::remove_orphans{});
  CHECK(s.images == stackctl::image_removal::local);
  CHECK(s.remove_orphans);
}

TEST_CASE("compose_stack name defaults to a uuid and normalizes identifiers") {
  auto gateway{ std::make_shared<stackctl::test::fake_gateway>() };

  auto const anonymous{ stackctl::make_compose_stack(gateway) };
  CHECK(anonymous->name().size() == 36);
  CHECK(anonymous->name() != stackctl::make_compose_stack(gateway)->name());

  auto const named{ stackctl::make_compose_stack(
      gateway, { stackctl::stack_options::stack_identifier{ "My_Stack" } }) };
  CHECK(named->name() == "my_stack");

  CHECK_THROWS_AS(stackctl::make_compose_stack(
                      gateway, { stackctl::stack_options::stack_identifier{ "!!" } }),
                  stackctl::compile_error);
  CHECK_THROWS_AS(stackctl::make_compose_stack(nullptr), std::invalid_argument);
}

TEST_CASE("compose_stack stages manifest streams") {
  auto gateway{ std::make_shared<stackctl::test::fake_gateway>() };
  stackctl::scoped_path_cleanup cleanup{ stackctl::manifest_staging_dir(
      std::filesystem::current_path()) };

  std::istringstream manifest{ "services:\n  web:\n    image: nginx\n" };
  stackctl::compose_stack stack{ gateway,
                                 { stackctl::stack_options::stack_readers{ { manifest } },
                                   stackctl::stack_options::stack_identifier{ "staged" } } };

  REQUIRE(stack.config_paths().size() == 1);
  CHECK(stack.config_paths()[0].filename() == "docker-compose-0.yaml");

  stack.up(bg());
  CHECK(stack.services() == std::vector<std::string>({ "web" }));
}

TEST_CASE("compose_stack labels are deterministic across compilations") {
  fixture f{ kDbApi };
  f.stack->up(bg());
  f.stack->up(bg());

  auto const calls{ f.gateway->up_calls() };
  REQUIRE(calls.size() == 2);
  REQUIRE(calls[0].compiled.services.size() == 2);
  for (size_t i{ 0 }; i < 2; ++i) {
    CHECK(calls[0].compiled.services[i].custom_labels ==
          calls[1].compiled.services[i].custom_labels);
  }
  CHECK(calls[0].compiled.services[0].custom_labels.at(stackctl::kProjectLabel) ==
        "teststack");
  CHECK(calls[0].compiled.services[1].custom_labels.at(stackctl::kServiceLabel) == "api");
}

TEST_CASE("compose_stack filtering keeps compiled order") {
  fixture f{ kFourServices };
  f.stack->up(bg(), { stackctl::up_options::run_services{ { "d", "b" } } });

  auto const calls{ f.gateway->up_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].compiled.service_names() == std::vector<std::string>({ "b", "d" }));
  CHECK(calls[0].request.create.services == std::vector<std::string>({ "d", "b" }));
  CHECK(f.stack->services() == std::vector<std::string>({ "b", "d" }));
}

TEST_CASE("compose_stack filtering drops unknown services") {
  fixture f{ "services:\n  a:\n    image: alpine\n" };
  f.stack->up(bg(), { stackctl::up_options::run_services{ { "a", "ghost" } } });

  auto const calls{ f.gateway->up_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].compiled.service_names() == std::vector<std::string>({ "a" }));
}

TEST_CASE("compose_stack forwards up options to the gateway") {
  fixture f{ kFourServices };
  f.stack->up(bg(),
              { stackctl::up_options::remove_orphans{},
                stackctl::up_options::ignore_orphans{},
                stackctl::up_options::wait{} });

  auto const calls{ f.gateway->up_calls() };
  REQUIRE(calls.size() == 1);
  auto const &request{ calls[0].request };
  CHECK(request.create.services == std::vector<std::string>({ "a", "b", "c", "d" }));
  CHECK(request.create.recreate == stackctl::recreate_policy::diverged);
  CHECK(request.create.recreate_dependencies == stackctl::recreate_policy::diverged);
  CHECK(request.create.remove_orphans);
  CHECK(request.create.ignore_orphans);
  CHECK(request.start.wait);
}

TEST_CASE("compose_stack rejects a duplicate environment key and keeps the first value") {
  fixture f{ "services:\n  a:\n    image: alpine\n    environment:\n      VALUE: ${X}\n" };

  f.stack->with_env({ { "X", "1" } });
  CHECK_THROWS_AS(f.stack->with_env({ { "X", "2" } }), stackctl::duplicate_key_error);
  CHECK_THROWS_AS(f.stack->with_env({ { "Y", "3" }, { "X", "2" } }),
                  stackctl::duplicate_key_error);
  f.stack->with_env({ { "Y", "4" } });

  f.stack->up(bg());
  auto const calls{ f.gateway->up_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].compiled.services[0].environment.at("VALUE") == "1");
  CHECK(calls[0].compiled.environment.at("Y") == "4");
}

TEST_CASE("compose_stack service_container reuses cached handles") {
  fixture f{ kDbApi };
  f.gateway->add_container("teststack", "api", "c-api");

  auto const first{ f.stack->service_container(bg(), "api") };
  auto const second{ f.stack->service_container(bg(), "api") };

  CHECK(first == second);
  CHECK(first->id() == "c-api");
  CHECK(first->service() == "api");
  REQUIRE(f.gateway->list_calls().size() == 1);
  CHECK(f.gateway->list_calls()[0].label_filters ==
        std::vector<std::string>({ "com.docker.compose.project=teststack",
                                   "com.docker.compose.service=api" }));

  f.stack->clear_container_cache();
  f.stack->service_container(bg(), "api");
  CHECK(f.gateway->list_calls().size() == 2);
}

TEST_CASE("compose_stack service_container reports missing services") {
  fixture f{ kDbApi };
  f.gateway->add_container("otherstack", "api", "c-other");

  try {
    f.stack->service_container(bg(), "api");
    FAIL("expected service_not_found_error");
  } catch (stackctl::service_not_found_error const &e) {
    CHECK(e.service() == "api");
  }
}

TEST_CASE("compose_stack readiness fan-out stops at the first failure") {
  fixture f{ "services:\n  a:\n    image: alpine\n  b:\n    image: alpine\n" };
  f.gateway->add_container("teststack", "a", "c-a");
  f.gateway->add_container("teststack", "b", "c-b");

  std::atomic<bool> a_canceled{ false };
  f.stack->wait_for_service(
      "a",
      stackctl::make_readiness([&](stackctl::context const &ctx, stackctl::container const &) {
        if (ctx.wait_for(10s)) { return; }
        a_canceled = true;
        ctx.throw_if_done();
      }));
  f.stack->wait_for_service(
      "b",
      stackctl::make_readiness([](stackctl::context const &, stackctl::container const &) {
        throw stackctl::readiness_error{ "b never became ready" };
      }));

  auto const start{ std::chrono::steady_clock::now() };
  CHECK_THROWS_WITH_AS(f.stack->up(bg()), "b never became ready", stackctl::readiness_error);
  CHECK(std::chrono::steady_clock::now() - start < 5s);
  CHECK(a_canceled.load());
}

TEST_CASE("compose_stack a later readiness binding replaces the earlier") {
  fixture f{ kDbApi };
  f.gateway->add_container("teststack", "api", "c-api");

  std::atomic<int> first_calls{ 0 };
  std::atomic<int> second_calls{ 0 };
  f.stack->wait_for_service(
      "api",
      stackctl::make_readiness([&](stackctl::context const &, stackctl::container const &) {
        ++first_calls;
      }));
  f.stack->wait_for_service(
      "api",
      stackctl::make_readiness([&](stackctl::context const &, stackctl::container const &) {
        ++second_calls;
      }));

  f.stack->up(bg());
  CHECK(first_calls.load() == 0);
  CHECK(second_calls.load() == 1);
}

TEST_CASE("compose_stack down and services require a prior up") {
  fixture f{ kDbApi };

  CHECK_THROWS_AS(f.stack->down(bg()), stackctl::usage_error);
  CHECK_THROWS_AS(f.stack->services(), stackctl::usage_error);
  CHECK(f.gateway->down_calls().empty());
}

TEST_CASE("compose_stack compile failure leaves no project") {
  fixture f{ "services:\n  a:\n    environment: { A: b }\n" };

  CHECK_THROWS_AS(f.stack->up(bg()), stackctl::compile_error);
  CHECK(f.gateway->up_calls().empty());
  CHECK_THROWS_AS(f.stack->services(), stackctl::usage_error);
}

TEST_CASE("compose_stack gateway failure skips readiness") {
  fixture f{ kDbApi };
  f.gateway->up_error = "engine unreachable";

  std::atomic<int> checks{ 0 };
  f.stack->wait_for_service(
      "api",
      stackctl::make_readiness([&](stackctl::context const &, stackctl::container const &) {
        ++checks;
      }));

  CHECK_THROWS_WITH_AS(f.stack->up(bg()), "engine unreachable", stackctl::gateway_error);
  CHECK(checks.load() == 0);
  CHECK(f.gateway->list_calls().empty());
  CHECK(f.stack->services() == std::vector<std::string>({ "db", "api" }));
}

TEST_CASE("compose_stack down forwards options and clears the cache") {
  fixture f{ kDbApi };
  f.gateway->add_container("teststack", "db", "c-db");
  f.stack->up(bg());
  f.stack->service_container(bg(), "db");

  f.stack->down(bg(),
                { stackctl::down_options::remove_orphans{},
                  stackctl::down_options::remove_images{ stackctl::image_removal::local } });

  auto const calls{ f.gateway->down_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].stack_name == "teststack");
  CHECK(calls[0].request.remove_orphans);
  CHECK(calls[0].request.images == stackctl::image_removal::local);

  f.stack->service_container(bg(), "db");
  CHECK(f.gateway->list_calls().size() == 2);
}

TEST_CASE("compose_stack end to end with a dependent service") {
  fixture f{ kDbApi };
  f.gateway->add_container("teststack", "db", "c-db", "healthy");
  f.gateway->add_container("teststack", "api", "c-api", "healthy");

  std::atomic<int> readiness_runs{ 0 };
  f.stack->wait_for_service(
      "api",
      stackctl::make_readiness(
          [&](stackctl::context const &ctx, stackctl::container const &target) {
            ++readiness_runs;
            for (;;) {
              if (target.inspect(ctx).health == std::optional<std::string>{ "healthy" }) {
                return;
              }
              if (!ctx.wait_for(10ms)) { ctx.throw_if_done(); }
            }
          }));

  f.stack->up(bg());

  auto const calls{ f.gateway->up_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].request.create.services == std::vector<std::string>({ "db", "api" }));
  CHECK(calls[0].compiled.service_names() == std::vector<std::string>({ "db", "api" }));
  CHECK(readiness_runs.load() == 1);
  REQUIRE(f.gateway->list_calls().size() == 1);
  CHECK(f.gateway->list_calls()[0].label_filters.back() == "com.docker.compose.service=api");
  CHECK(f.stack->services() == std::vector<std::string>({ "db", "api" }));

  auto const api{ f.stack->service_container(bg(), "api") };
  CHECK(api->mapped_port(bg(), "80") == std::optional<std::string>{ "49153" });
  CHECK(f.gateway->list_calls().size() == 1);
}
