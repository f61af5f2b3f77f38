#include "cmd.h"
#include "cmd_common.h"
#include "cmd_down.h"
#include "cmd_ps.h"
#include "cmd_up.h"

#include "container.h"
#include "errors.h"
#include "test_support.h"
#include "util.h"

#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using namespace std::chrono_literals;

namespace {

class test_cmd : public stackctl::cmd {
 public:
  struct cfg : stackctl::cmd_cfg<test_cmd> {};
  explicit test_cmd(cfg) {}
  void execute() override {}
};

// Routes cli_gateway() to a fake for the lifetime of the guard.
struct gateway_override {
  gateway_override() {
    stackctl::set_cli_gateway_factory([g = gateway] { return g; });
  }
  ~gateway_override() { stackctl::set_cli_gateway_factory(nullptr); }

  std::shared_ptr<stackctl::test::fake_gateway> gateway{
    std::make_shared<stackctl::test::fake_gateway>()
  };
};

struct manifest_dir {
  manifest_dir()
      : path{ std::filesystem::temp_directory_path() /
              ("stackctl-cmd-test-" + stackctl::util_make_uuid()) },
        cleanup{ path } {
    std::filesystem::create_directories(path);
    std::ofstream{ manifest() } << "services:\n"
                                   "  db:\n"
                                   "    image: postgres:${PG_TAG:-16}\n"
                                   "  api:\n"
                                   "    image: example/api\n"
                                   "    depends_on: [db]\n";
  }

  std::filesystem::path manifest() const { return path / "compose.yaml"; }

  stackctl::stack_cli_cfg stack_cfg(std::string name = "shop") const {
    stackctl::stack_cli_cfg cfg;
    cfg.files = { manifest() };
    cfg.project_name = std::move(name);
    return cfg;
  }

  std::filesystem::path path;
  stackctl::scoped_path_cleanup cleanup;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  CHECK(std::is_same_v<test_cmd::cfg::cmd_t, test_cmd>);
  CHECK(std::is_same_v<stackctl::cmd_up::cfg::cmd_t, stackctl::cmd_up>);
}

TEST_CASE("cmd factory creates command from cfg") {
  auto cmd{ stackctl::cmd::create(test_cmd::cfg{}) };
  REQUIRE(cmd);
  CHECK(dynamic_cast<test_cmd *>(cmd.get()));
}

TEST_CASE("parse_env_assignments") {
  SUBCASE("splits on the first equals sign") {
    auto const env{ stackctl::parse_env_assignments({ "A=1", "B=x=y", "C=" }) };
    CHECK(env.at("A") == "1");
    CHECK(env.at("B") == "x=y");
    CHECK(env.at("C").empty());
  }

  SUBCASE("later assignment wins") {
    auto const env{ stackctl::parse_env_assignments({ "A=1", "A=2" }) };
    CHECK(env.at("A") == "2");
  }

  SUBCASE("missing key or separator") {
    CHECK_THROWS_AS(stackctl::parse_env_assignments({ "NOVALUE" }), stackctl::usage_error);
    CHECK_THROWS_AS(stackctl::parse_env_assignments({ "=v" }), stackctl::usage_error);
  }
}

TEST_CASE("cli_context applies the timeout") {
  stackctl::stack_cli_cfg cfg;
  CHECK_FALSE(stackctl::cli_context(cfg).deadline().has_value());

  cfg.timeout_seconds = 5.0;
  auto const remaining{ stackctl::cli_context(cfg).remaining() };
  REQUIRE(remaining.has_value());
  CHECK(*remaining <= std::chrono::duration_cast<stackctl::context::clock::duration>(5s));
  CHECK(*remaining > std::chrono::duration_cast<stackctl::context::clock::duration>(4s));
}

TEST_CASE("cli_compile_project honors injected env and name") {
  manifest_dir dir;
  auto cfg{ dir.stack_cfg("_shop") };
  cfg.env = { "PG_TAG=15" };

  SUBCASE("invalid name is rejected") {
    CHECK_THROWS_AS(stackctl::cli_compile_project(cfg), stackctl::compile_error);
  }

  SUBCASE("valid name") {
    cfg.project_name = "shop";
    auto const p{ stackctl::cli_compile_project(cfg) };
    CHECK(p.name == "shop");
    REQUIRE(p.find_service("db") != nullptr);
    CHECK(p.find_service("db")->image == "postgres:15");
  }
}

TEST_CASE("make_cli_stack names the stack") {
  manifest_dir dir;
  auto const gateway{ std::make_shared<stackctl::test::fake_gateway>() };

  SUBCASE("explicit project name") {
    CHECK(stackctl::make_cli_stack(gateway, dir.stack_cfg("shop"))->name() == "shop");
  }

  SUBCASE("compiled default name matches the manifest directory") {
    auto const cfg{ dir.stack_cfg("") };
    auto const expected{ stackctl::cli_compile_project(cfg).name };
    CHECK(stackctl::make_cli_stack(gateway, cfg)->name() == expected);
  }
}

TEST_CASE("cmd_up drives the stack through the gateway") {
  manifest_dir dir;
  gateway_override override;
  override.gateway->add_container("shop", "db", "c-db");

  stackctl::cmd_up::cfg cfg;
  cfg.stack = dir.stack_cfg();
  cfg.stack.env = { "PG_TAG=15" };
  cfg.services = { "db" };
  cfg.remove_orphans = true;
  cfg.wait = true;
  cfg.wait_logs = { "db=logs of c-db" };

  stackctl::cmd_up{ cfg }.execute();

  auto const calls{ override.gateway->up_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].compiled.name == "shop");
  REQUIRE(calls[0].compiled.find_service("db") != nullptr);
  CHECK(calls[0].compiled.find_service("db")->image == "postgres:15");
  CHECK(calls[0].compiled.find_service("api") == nullptr);
  CHECK(calls[0].request.create.services == std::vector<std::string>({ "db" }));
  CHECK(calls[0].request.create.remove_orphans);
  CHECK_FALSE(calls[0].request.create.ignore_orphans);
  CHECK(calls[0].request.start.wait);
  CHECK(override.gateway->list_calls().size() == 1);
}

TEST_CASE("cmd_up fails when a readiness service has no container") {
  manifest_dir dir;
  gateway_override override;

  stackctl::cmd_up::cfg cfg;
  cfg.stack = dir.stack_cfg();
  cfg.wait_logs = { "db=ready" };

  CHECK_THROWS_AS(stackctl::cmd_up{ cfg }.execute(), stackctl::service_not_found_error);
}

TEST_CASE("cmd_down tears down by project name") {
  manifest_dir dir;
  gateway_override override;

  stackctl::cmd_down::cfg cfg;
  cfg.stack = dir.stack_cfg();
  cfg.remove_orphans = true;
  cfg.images = stackctl::image_removal::local;

  stackctl::cmd_down{ cfg }.execute();

  auto const calls{ override.gateway->down_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].stack_name == "shop");
  CHECK(calls[0].request.remove_orphans);
  CHECK(calls[0].request.images == stackctl::image_removal::local);
  CHECK(override.gateway->up_calls().empty());
}

TEST_CASE("cmd_down normalizes the project name like up does") {
  manifest_dir dir;
  gateway_override override;

  stackctl::cmd_down::cfg cfg;
  cfg.stack = dir.stack_cfg("MyShop");
  stackctl::cmd_down{ cfg }.execute();

  auto const calls{ override.gateway->down_calls() };
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].stack_name == "myshop");
  CHECK(stackctl::make_cli_stack(override.gateway, cfg.stack)->name() == "myshop");
}

TEST_CASE("cmd_ps resolves the service container") {
  manifest_dir dir;
  gateway_override override;

  stackctl::cmd_ps::cfg cfg;
  cfg.stack = dir.stack_cfg();
  cfg.service = "db";
  cfg.port = "80";

  SUBCASE("missing container") {
    CHECK_THROWS_AS(stackctl::cmd_ps{ cfg }.execute(), stackctl::service_not_found_error);
  }

  SUBCASE("running container") {
    override.gateway->add_container("shop", "db", "c-db", "healthy");
    stackctl::cmd_ps{ cfg }.execute();
    CHECK(override.gateway->inspect_count() >= 1);
  }
}

TEST_CASE("log readiness") {
  auto const gateway{ std::make_shared<stackctl::test::fake_gateway>() };
  gateway->add_container("shop", "db", "c-db");
  stackctl::container const target{ "c-db", "db", gateway };

  SUBCASE("passes once the text is logged") {
    auto const strategy{ stackctl::make_log_readiness("of c-db", 1ms) };
    CHECK_NOTHROW(strategy->wait_until_ready(stackctl::context::background(), target));
  }

  SUBCASE("honors the context deadline") {
    auto const strategy{ stackctl::make_log_readiness("never logged", 1ms) };
    auto const ctx{ stackctl::context::background().with_timeout(20ms) };
    CHECK_THROWS_AS(strategy->wait_until_ready(ctx, target),
                    stackctl::deadline_exceeded_error);
  }
}
