#include "mark.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

tasker::mark make_mark(std::string name,
                       std::vector<tasker::node_spec> args,
                       tasker::kwargs_t kwargs = {}) {
  return tasker::mark{ .name = std::move(name),
                       .args = std::move(args),
                       .kwargs = std::move(kwargs) };
}

tasker::task_function_ptr make_wrapped(std::vector<tasker::mark> markers) {
  auto inner{ std::make_shared<tasker::task_function>() };
  inner->body = [](tasker::task_call const &) {};

  auto outer{ std::make_shared<tasker::task_function>() };
  outer->markers = std::move(markers);
  outer->wrapped = std::move(inner);
  return outer;
}

std::vector<std::string> marker_names(std::vector<tasker::mark> const &markers) {
  std::vector<std::string> names;
  for (auto const &m : markers) { names.push_back(m.name); }
  return names;
}

}  // namespace

TEST_CASE("unwrap follows wrapped layers to the innermost one") {
  auto const fn{ make_wrapped({}) };
  auto const outer{ std::make_shared<tasker::task_function>() };
  outer->wrapped = fn;

  auto const inner{ tasker::unwrap(outer) };
  CHECK(inner == fn->wrapped);
  CHECK(static_cast<bool>(inner->body));
  CHECK(inner->wrapped == nullptr);
}

TEST_CASE("unwrap of an unwrapped function is the function itself") {
  auto const fn{ std::make_shared<tasker::task_function const>() };
  CHECK(tasker::unwrap(fn) == fn);
}

TEST_CASE("unwrap rejects a null function") {
  CHECK_THROWS_AS(tasker::unwrap(nullptr), std::invalid_argument);
}

TEST_CASE("remove_markers splits markers by name and keeps their order") {
  auto const fn{ make_wrapped({ make_mark("depends_on", { "a.txt" }),
                                make_mark("slow", {}),
                                make_mark("depends_on", { "b.txt" }),
                                make_mark("produces", { "out.txt" }) }) };

  auto const removed{ tasker::remove_markers(fn, "depends_on") };

  REQUIRE(removed.markers.size() == 2);
  CHECK(removed.markers[0].args == std::vector<tasker::node_spec>{ "a.txt" });
  CHECK(removed.markers[1].args == std::vector<tasker::node_spec>{ "b.txt" });
  CHECK(marker_names(removed.function->markers) ==
        std::vector<std::string>{ "slow", "produces" });
  CHECK(removed.function->wrapped == fn->wrapped);

  CHECK(fn->markers.size() == 4);
}

TEST_CASE("remove_markers without matches returns an equivalent copy") {
  auto const fn{ make_wrapped({ make_mark("slow", {}) }) };
  auto const removed{ tasker::remove_markers(fn, "depends_on") };

  CHECK(removed.markers.empty());
  CHECK(removed.function != fn);
  CHECK(removed.function->markers == fn->markers);
}

TEST_CASE("depends_on and produces return their objects argument") {
  tasker::node_spec const objects{ tasker::node_spec::sequence{ "a.txt", "b.txt" } };

  SUBCASE("positional") {
    CHECK(tasker::depends_on(make_mark("depends_on", { objects })) == objects);
    CHECK(tasker::produces(make_mark("produces", { objects })) == objects);
  }

  SUBCASE("keyword") {
    CHECK(tasker::depends_on(make_mark("depends_on", {}, { { "objects", objects } })) ==
          objects);
  }
}

TEST_CASE("declaration signature errors name the declaration") {
  CHECK_THROWS_WITH_AS(tasker::depends_on(make_mark("depends_on", {})),
                       "depends_on() missing 1 required positional argument: 'objects'",
                       tasker::declaration_error);

  CHECK_THROWS_WITH_AS(tasker::produces(make_mark("produces", { "a", "b" })),
                       "produces() takes 1 positional argument but 2 were given",
                       tasker::declaration_error);

  CHECK_THROWS_WITH_AS(
      tasker::depends_on(make_mark("depends_on", {}, { { "x", tasker::node_spec{ "a" } } })),
      "depends_on() got an unexpected keyword argument 'x'",
      tasker::declaration_error);

  CHECK_THROWS_WITH_AS(
      tasker::produces(
          make_mark("produces", { "a" }, { { "objects", tasker::node_spec{ "b" } } })),
      "produces() got multiple values for argument 'objects'",
      tasker::declaration_error);
}

TEST_CASE("declaration_error is an invalid_argument") {
  try {
    tasker::depends_on(make_mark("depends_on", {}));
    FAIL("expected declaration_error");
  } catch (std::invalid_argument const &e) {
    auto const *declaration{ dynamic_cast<tasker::declaration_error const *>(&e) };
    REQUIRE(declaration != nullptr);
    CHECK(declaration->declaration() == "depends_on");
  }
}
