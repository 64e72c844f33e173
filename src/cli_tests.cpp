#include "cli.h"
#include "cmds/cmd_collect.h"
#include "cmds/cmd_version.h"

#include <doctest/doctest.h>

#include <filesystem>
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

tasker::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return tasker::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "tasker" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "tasker", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<tasker::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "tasker", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<tasker::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("version subcommand") {
    auto const parsed{ parse({ "tasker", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<tasker::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_collect") {
  SUBCASE("defaults") {
    auto const parsed{ parse({ "tasker", "collect" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<tasker::cmd_collect::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->paths.empty());
    CHECK_FALSE(cfg->root.has_value());
    CHECK_FALSE(cfg->show_nodes);
  }

  SUBCASE("paths, root and nodes") {
    auto const root{ std::filesystem::temp_directory_path() };
    auto const parsed{
      parse({ "tasker", "collect", "a", "b/task_x.lua", "--root", root.string(), "--nodes" })
    };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<tasker::cmd_collect::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->paths == std::vector<std::filesystem::path>{ "a", "b/task_x.lua" });
    REQUIRE(cfg->root.has_value());
    CHECK(*cfg->root == root);
    CHECK(cfg->show_nodes);
  }

  SUBCASE("missing root directory") {
    auto const parsed{
      parse({ "tasker", "collect", "--root", "/nonexistent/tasker/root/dir" })
    };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }
}

TEST_CASE("cli_parse: verbosity") {
  SUBCASE("default is info, undecorated") {
    auto const parsed{ parse({ "tasker", "version" }) };
    REQUIRE(parsed.verbosity.has_value());
    CHECK(*parsed.verbosity == tasker::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
    CHECK(parsed.trace_outputs.empty());
  }

  SUBCASE("--verbose") {
    auto const parsed{ parse({ "tasker", "--verbose", "version" }) };
    REQUIRE(parsed.verbosity.has_value());
    CHECK(*parsed.verbosity == tasker::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("--trace=stderr") {
    auto const parsed{ parse({ "tasker", "--trace=stderr", "collect" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    REQUIRE(parsed.verbosity.has_value());
    CHECK(*parsed.verbosity == tasker::tui::level::TUI_TRACE);
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == tasker::tui::trace_output_type::std_err);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "tasker", "--trace=stderr,file:trace.jsonl", "collect" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[1].type == tasker::tui::trace_output_type::file);
    REQUIRE(parsed.trace_outputs[1].file_path.has_value());
    CHECK(*parsed.trace_outputs[1].file_path == std::filesystem::path{ "trace.jsonl" });
  }

  SUBCASE("invalid spec") {
    auto const parsed{ parse({ "tasker", "--trace=bogus", "collect" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: bogus");
    CHECK(parsed.trace_outputs.empty());
  }
}
