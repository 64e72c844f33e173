#include "util.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("tasker-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

void write_dummy_file(std::filesystem::path const &path) {
  std::ofstream out{ path };
  out << "tasker-test";
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto result1{ std::visit(
      tasker::match{ [](int x) { return x * 2; },
                     [](std::string const &s) { return static_cast<int>(s.size()); } },
      v1) };

  auto result2{ std::visit(
      tasker::match{ [](int x) { return x * 2; },
                     [](std::string const &s) { return static_cast<int>(s.size()); } },
      v2) };

  CHECK(result1 == 84);
  CHECK(result2 == 5);
}

TEST_CASE("util_find_duplicates") {
  SUBCASE("one repeated value") {
    std::vector<std::string> const items{ "a", "b", "a" };
    CHECK(tasker::util_find_duplicates(items) == std::set<std::string>{ "a" });
  }

  SUBCASE("no repeated values") {
    std::vector<std::string> const items{ "a", "b" };
    CHECK(tasker::util_find_duplicates(items).empty());
  }

  SUBCASE("each repeated value reported once") {
    std::vector<std::string> const items{ "a", "a", "a", "b", "c", "b" };
    CHECK(tasker::util_find_duplicates(items) == std::set<std::string>{ "a", "b" });
  }

  SUBCASE("empty input") {
    std::vector<int> const items;
    CHECK(tasker::util_find_duplicates(items).empty());
  }
}

TEST_CASE("util_mtime_fingerprint is stable while the file is unchanged") {
  auto const path{ make_temp_path("stable") };
  tasker::scoped_path_cleanup cleanup{ path };
  write_dummy_file(path);

  auto const first{ tasker::util_mtime_fingerprint(path) };
  CHECK_FALSE(first.empty());
  CHECK(tasker::util_mtime_fingerprint(path) == first);
}

TEST_CASE("util_mtime_fingerprint follows the modification time") {
  auto const path{ make_temp_path("touched") };
  tasker::scoped_path_cleanup cleanup{ path };
  write_dummy_file(path);

  auto const before{ tasker::util_mtime_fingerprint(path) };
  std::filesystem::last_write_time(path,
                                   std::filesystem::last_write_time(path) +
                                       std::chrono::seconds{ 10 });
  CHECK(tasker::util_mtime_fingerprint(path) != before);
}

TEST_CASE("util_mtime_fingerprint throws node_not_found for a missing path") {
  auto const path{ make_temp_path("missing") };
  CHECK_THROWS_AS(tasker::util_mtime_fingerprint(path), tasker::node_not_found);
}

TEST_CASE("scoped_path_cleanup removes a directory tree") {
  auto const root{ make_temp_path("cleanup") };
  std::filesystem::create_directories(root / "sub");
  write_dummy_file(root / "sub" / "file.txt");

  { tasker::scoped_path_cleanup cleanup{ root }; }

  CHECK_FALSE(std::filesystem::exists(root));
}

TEST_CASE("scoped_path_cleanup reset removes the previous path") {
  auto const first{ make_temp_path("reset-first") };
  auto const second{ make_temp_path("reset-second") };
  write_dummy_file(first);
  write_dummy_file(second);

  tasker::scoped_path_cleanup cleanup{ first };
  cleanup.reset(second);
  CHECK_FALSE(std::filesystem::exists(first));
  CHECK(std::filesystem::exists(second));
  CHECK(cleanup.path() == second);

  cleanup.reset();
  CHECK_FALSE(std::filesystem::exists(second));
}
