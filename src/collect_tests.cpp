#include "collect.h"

#include "session.h"
#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::filesystem::path make_temp_root() {
  static std::atomic<int> counter{ 0 };
  return std::filesystem::temp_directory_path() /
         ("tasker-collect-test-" + std::to_string(counter.fetch_add(1)));
}

struct collect_fixture {
  collect_fixture() { std::filesystem::create_directories(root); }

  std::filesystem::path write(std::filesystem::path const &relative,
                              std::string const &content) {
    auto const path{ root / relative };
    std::filesystem::create_directories(path.parent_path());
    std::ofstream{ path } << content;
    return path;
  }

  std::filesystem::path root{ make_temp_root() };
  tasker::scoped_path_cleanup cleanup{ root };
};

std::vector<std::string> short_names(tasker::collect_result const &result) {
  std::vector<std::string> names;
  for (auto const &t : result.tasks) { names.push_back(t->short_name()); }
  return names;
}

}  // namespace

TEST_CASE_FIXTURE(collect_fixture, "collect_task_files searches directories recursively") {
  auto const a{ write("task_a.lua", "") };
  auto const b{ write("sub/deeper/task_b.lua", "") };
  write("helper.lua", "");
  write("sub/task_c.txt", "");

  tasker::session s{ tasker::session_cfg{ .root = root } };
  CHECK(tasker::collect_task_files(s) == std::vector<std::filesystem::path>{ b, a });
}

TEST_CASE_FIXTURE(collect_fixture, "collect_task_files resolves relative paths against the root") {
  auto const a{ write("one/task_a.lua", "") };
  write("two/task_b.lua", "");
  auto const named{ write("two/build.lua", "") };

  tasker::session s{ tasker::session_cfg{ .root = root,
                                          .paths = { "one", "two/build.lua", "one" } } };

  CHECK(tasker::collect_task_files(s) == std::vector<std::filesystem::path>{ a, named });
}

TEST_CASE_FIXTURE(collect_fixture, "collect_task_files rejects missing paths") {
  tasker::session s{ tasker::session_cfg{ .root = root, .paths = { "nope" } } };
  CHECK_THROWS_AS(tasker::collect_task_files(s), std::runtime_error);
}

TEST_CASE_FIXTURE(collect_fixture, "collect_tasks builds tasks in sorted file order") {
  write("task_a.lua", R"(
task_produce = task{ produces("shared.txt"), run = function() end }
)");
  write("sub/task_b.lua", R"(
task_consume = task{ depends_on("../shared.txt"), run = function() end }
task_other = task{ run = function() end }
)");

  tasker::session s{ tasker::session_cfg{ .root = root } };
  auto const result{ tasker::collect_tasks(s) };

  CHECK(result.failures.empty());
  CHECK(result.modules.size() == 2);
  CHECK(short_names(result) == std::vector<std::string>{ "sub/task_b.lua::task_consume",
                                                         "sub/task_b.lua::task_other",
                                                         "task_a.lua::task_produce" });
  CHECK(result.tasks[2]->name() == (root / "task_a.lua").generic_string() + "::task_produce");

  REQUIRE(result.tasks[0]->depends_on().is_leaf());
  REQUIRE(result.tasks[2]->produces().is_leaf());
  CHECK(result.tasks[2]->produces().leaf() == result.tasks[0]->depends_on().leaf());
  CHECK(s.node_cache().size() == 1);
}

TEST_CASE_FIXTURE(collect_fixture, "collect_tasks isolates failing tasks and files") {
  write("task_good.lua", R"(
task_ok = task{ depends_on("in.txt"), run = function() end }
task_bad = task{ depends_on(5), run = function() end }
)");
  auto const broken{ write("task_broken.lua", "this is not lua\n") };

  tasker::session s{ tasker::session_cfg{ .root = root } };
  auto const result{ tasker::collect_tasks(s) };

  CHECK(short_names(result) == std::vector<std::string>{ "task_good.lua::task_ok" });
  REQUIRE(result.failures.size() == 2);

  CHECK(result.failures[0].path == broken);
  CHECK(result.failures[0].task_name.empty());

  CHECK(result.failures[1].task_name ==
        (root / "task_good.lua").generic_string() + "::task_bad");
  CHECK(result.failures[1].message.find("cannot be parsed as a dependency or product") !=
        std::string::npos);
}

TEST_CASE_FIXTURE(collect_fixture, "collect_tasks starts from an empty node cache") {
  write("task_a.lua", R"(task_x = task{ depends_on("a.txt"), run = function() end })");

  tasker::session s{ tasker::session_cfg{ .root = root } };
  (void)s.node_cache().get_or_create(root / "stale.txt");

  auto const result{ tasker::collect_tasks(s) };

  CHECK(result.tasks.size() == 1);
  CHECK(s.node_cache().find(root / "stale.txt") == nullptr);
  CHECK(s.node_cache().find(root / "a.txt") != nullptr);
}

TEST_CASE_FIXTURE(collect_fixture, "collect_tasks keeps full names outside the root") {
  auto const outside_root{ make_temp_root() };
  tasker::scoped_path_cleanup outside_cleanup{ outside_root };
  std::filesystem::create_directories(outside_root);
  auto const file{ outside_root / "task_far.lua" };
  std::ofstream{ file } << "task_far = task{ run = function() end }\n";

  tasker::session s{ tasker::session_cfg{ .root = root, .paths = { file } } };
  auto const result{ tasker::collect_tasks(s) };

  REQUIRE(result.tasks.size() == 1);
  CHECK(result.tasks[0]->short_name() == result.tasks[0]->name());
}
