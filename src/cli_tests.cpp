#include "cli.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

stackctl::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return stackctl::cli_parse(static_cast<int>(args.size()), argv.data());
}

template <typename cfg_t>
cfg_t const &expect_cfg(stackctl::cli_args const &parsed) {
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<cfg_t>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  return *cfg;
}

}  // namespace

TEST_CASE("cli_parse: no arguments prints help") {
  auto const parsed{ parse({ "stackctl" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("stackctl") != std::string::npos);
}

TEST_CASE("cli_parse: version") {
  SUBCASE("-v flag") { expect_cfg<stackctl::cmd_version::cfg>(parse({ "stackctl", "-v" })); }
  SUBCASE("--version flag") {
    expect_cfg<stackctl::cmd_version::cfg>(parse({ "stackctl", "--version" }));
  }
  SUBCASE("subcommand") {
    expect_cfg<stackctl::cmd_version::cfg>(parse({ "stackctl", "version" }));
  }
}

TEST_CASE("cli_parse: up options") {
  auto const parsed{ parse({ "stackctl",
                             "up",
                             "-p",
                             "shop",
                             "-s",
                             "db",
                             "--service",
                             "api",
                             "-e",
                             "TAG=1.2",
                             "--os-env",
                             "--remove-orphans",
                             "--wait",
                             "--timeout",
                             "30",
                             "--wait-log",
                             "db=ready to accept" }) };
  auto const &cfg{ expect_cfg<stackctl::cmd_up::cfg>(parsed) };
  CHECK(cfg.stack.project_name == "shop");
  CHECK(cfg.services == std::vector<std::string>({ "db", "api" }));
  CHECK(cfg.stack.env == std::vector<std::string>({ "TAG=1.2" }));
  CHECK(cfg.stack.os_env);
  CHECK(cfg.remove_orphans);
  CHECK_FALSE(cfg.ignore_orphans);
  CHECK(cfg.wait);
  REQUIRE(cfg.stack.timeout_seconds.has_value());
  CHECK(*cfg.stack.timeout_seconds == doctest::Approx(30.0));
  CHECK(cfg.wait_logs == std::vector<std::string>({ "db=ready to accept" }));
}

TEST_CASE("cli_parse: up rejects both orphan flags") {
  auto const parsed{ parse({ "stackctl", "up", "--remove-orphans", "--ignore-orphans" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: manifest files must exist") {
  auto const dir{ std::filesystem::temp_directory_path() / "stackctl-cli-tests" };
  std::filesystem::create_directories(dir);
  auto const manifest{ dir / "compose.yaml" };
  { std::ofstream{ manifest } << "services:\n  db:\n    image: postgres\n"; }

  SUBCASE("existing file") {
    auto const parsed{ parse({ "stackctl", "config", "-f", manifest.string(), "--labels" }) };
    auto const &cfg{ expect_cfg<stackctl::cmd_config::cfg>(parsed) };
    REQUIRE(cfg.stack.files.size() == 1);
    CHECK(cfg.stack.files[0] == manifest);
    CHECK(cfg.show_labels);
  }

  SUBCASE("missing file") {
    auto const parsed{ parse({ "stackctl", "config", "-f", (dir / "nope.yaml").string() }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  std::filesystem::remove_all(dir);
}

TEST_CASE("cli_parse: down image policy") {
  SUBCASE("default keeps images") {
    auto const parsed{ parse({ "stackctl", "down" }) };
    auto const &cfg{ expect_cfg<stackctl::cmd_down::cfg>(parsed) };
    CHECK(cfg.images == stackctl::image_removal::none);
    CHECK_FALSE(cfg.remove_orphans);
  }

  SUBCASE("local") {
    auto const parsed{ parse({ "stackctl", "down", "--rmi", "local", "--remove-orphans" }) };
    auto const &cfg{ expect_cfg<stackctl::cmd_down::cfg>(parsed) };
    CHECK(cfg.images == stackctl::image_removal::local);
    CHECK(cfg.remove_orphans);
  }

  SUBCASE("unknown policy") {
    auto const parsed{ parse({ "stackctl", "down", "--rmi", "some" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
  }
}

TEST_CASE("cli_parse: ps requires a service") {
  SUBCASE("with service") {
    auto const parsed{ parse({ "stackctl", "ps", "db", "--port", "5432", "--logs" }) };
    auto const &cfg{ expect_cfg<stackctl::cmd_ps::cfg>(parsed) };
    CHECK(cfg.service == "db");
    CHECK(cfg.port == "5432");
    CHECK(cfg.logs);
  }

  SUBCASE("without service") {
    auto const parsed{ parse({ "stackctl", "ps" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }
}

TEST_CASE("cli_parse: logging flags") {
  SUBCASE("default") {
    auto const parsed{ parse({ "stackctl", "version" }) };
    CHECK(parsed.verbosity == stackctl::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
    CHECK(parsed.trace_outputs.empty());
  }

  SUBCASE("verbose") {
    auto const parsed{ parse({ "stackctl", "--verbose", "version" }) };
    CHECK(parsed.verbosity == stackctl::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }

  SUBCASE("bare trace goes to stderr") {
    auto const parsed{ parse({ "stackctl", "--trace", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(parsed.verbosity == stackctl::tui::level::TUI_TRACE);
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == stackctl::tui::trace_output_type::std_err);
  }

  SUBCASE("trace to stderr and file") {
    auto const parsed{ parse({ "stackctl", "--trace=stderr,file:/tmp/t.jsonl", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[0].type == stackctl::tui::trace_output_type::std_err);
    CHECK(parsed.trace_outputs[1].type == stackctl::tui::trace_output_type::file);
    REQUIRE(parsed.trace_outputs[1].file_path.has_value());
    CHECK(*parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/t.jsonl" });
  }

  SUBCASE("invalid trace spec drops the command") {
    auto const parsed{ parse({ "stackctl", "--trace=syslog", "version" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: syslog");
    CHECK(parsed.trace_outputs.empty());
  }
}
