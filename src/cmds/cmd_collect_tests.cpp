#include "cmds/cmd_collect.h"

#include "util.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <type_traits>

namespace {

struct cmd_collect_fixture {
  cmd_collect_fixture() { std::filesystem::create_directories(root); }

  void write(std::filesystem::path const &relative, char const *content) {
    std::ofstream{ root / relative } << content;
  }

  std::filesystem::path root{ std::filesystem::temp_directory_path() /
                              "tasker-cmd-collect-test" };
  tasker::scoped_path_cleanup cleanup{ root };
};

}  // namespace

TEST_CASE("cmd_collect config exposes cmd_t alias") {
  CHECK(std::is_same_v<tasker::cmd_collect::cfg::cmd_t, tasker::cmd_collect>);
}

TEST_CASE_FIXTURE(cmd_collect_fixture, "cmd_collect succeeds when every task collects") {
  write("task_ok.lua", R"(
task_build = task{ depends_on("in.txt"), produces({ obj = "out.o" }), run = function() end }
)");

  tasker::cmd_collect::cfg cfg{};
  cfg.root = root;
  cfg.show_nodes = true;

  CHECK(tasker::cmd::create(cfg)->execute());
}

TEST_CASE_FIXTURE(cmd_collect_fixture, "cmd_collect fails when a task does not collect") {
  write("task_bad.lua", R"(task_bad = task{ depends_on(true), run = function() end })");

  tasker::cmd_collect::cfg cfg{};
  cfg.root = root;

  CHECK_FALSE(tasker::cmd::create(cfg)->execute());
}
