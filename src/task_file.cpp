#include "task_file.h"

#include "session.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace tasker {

namespace {

// Value produced by task{}. `order` restores definition order, which the globals
// table does not keep.
struct lua_task_definition {
  task_function_ptr function;
  std::uint64_t order;
};

node_ref lua_number_to_ref(double value) {
  constexpr double kMin{ static_cast<double>(std::numeric_limits<std::int64_t>::min()) };
  constexpr double kMax{ 9223372036854775808.0 };  // 2^63
  if (std::trunc(value) == value && value >= kMin && value < kMax) {
    return node_ref{ static_cast<std::int64_t>(value) };
  }
  return node_ref{ value };
}

// Lua 5.4 numbers carry an integer subtype; read it without a round trip through
// double so values above 2^53 stay exact.
node_ref lua_number_object_to_ref(sol::object const &value) {
  lua_State *L{ value.lua_state() };
  value.push(L);
  std::optional<std::int64_t> integer;
  if (lua_isinteger(L, -1)) { integer = static_cast<std::int64_t>(lua_tointeger(L, -1)); }
  lua_pop(L, 1);

  if (integer) { return node_ref{ *integer }; }
  return lua_number_to_ref(value.as<double>());
}

node_spec table_to_node_spec(sol::table const &table) {
  std::vector<std::pair<std::int64_t, sol::object>> indexed;
  std::vector<std::pair<std::string, sol::object>> named;
  std::string bad_key;

  for (auto const &[key, value] : table) {
    if (key.get_type() == sol::type::string) {
      named.emplace_back(key.as<std::string>(), value);
      continue;
    }
    if (key.get_type() == sol::type::number) {
      auto const ref{ lua_number_object_to_ref(key) };
      if (auto const *index{ std::get_if<std::int64_t>(&ref) }) {
        indexed.emplace_back(*index, value);
        continue;
      }
    }
    if (bad_key.empty()) { bad_key = sol_util_type_name(key.get_type()); }
  }

  if (!bad_key.empty()) {
    throw std::runtime_error("table keys must be strings or integers, got " + bad_key);
  }

  std::sort(indexed.begin(), indexed.end(), [](auto const &a, auto const &b) {
    return a.first < b.first;
  });
  std::sort(named.begin(), named.end(), [](auto const &a, auto const &b) {
    return a.first < b.first;
  });

  bool is_sequence{ named.empty() };
  for (std::size_t i{ 0 }; is_sequence && i < indexed.size(); ++i) {
    is_sequence = indexed[i].first == static_cast<std::int64_t>(i + 1);
  }

  if (is_sequence) {
    node_spec::sequence items;
    items.reserve(indexed.size());
    for (auto const &entry : indexed) { items.push_back(lua_to_node_spec(entry.second)); }
    return node_spec{ std::move(items) };
  }

  node_spec::mapping entries;
  entries.reserve(indexed.size() + named.size());
  for (auto const &[index, value] : indexed) {
    entries.emplace_back(node_key{ index }, lua_to_node_spec(value));
  }
  for (auto const &[name, value] : named) {
    entries.emplace_back(node_key{ name }, lua_to_node_spec(value));
  }
  return node_spec{ std::move(entries) };
}

void set_entry(sol::table &table, node_key const &key, sol::object const &value) {
  if (auto const index{ key.index() }) {
    table[*index] = value;
  } else if (auto const name{ key.name() }) {
    table[std::string{ *name }] = value;
  } else {
    throw std::logic_error("unresolved key " + key.str() + " in a finished tree");
  }
}

mark make_mark(std::string name, sol::variadic_args const &args) {
  mark m{ .name = std::move(name), .args = {}, .kwargs = {} };
  for (auto const &arg : args) { m.args.push_back(lua_to_node_spec(arg.as<sol::object>())); }
  return m;
}

kwargs_t parse_kwargs(sol::table const &table) {
  node_spec const spec{ lua_to_node_spec(sol::make_object(table.lua_state(), table)) };
  if (spec.is_sequence()) {
    if (!std::get<node_spec::sequence>(spec.value).empty()) {
      throw std::runtime_error("task: kwargs must be a table with string keys");
    }
    return {};
  }

  kwargs_t kwargs;
  for (auto const &[key, value] : std::get<node_spec::mapping>(spec.value)) {
    auto const name{ key.name() };
    if (!name) { throw std::runtime_error("task: kwargs must be a table with string keys"); }
    kwargs.emplace(std::string{ *name }, value);
  }
  return kwargs;
}

task_body make_body(sol::protected_function run) {
  return [run = std::move(run)](task_call const &call) {
    sol::state_view lua{ run.lua_state() };

    sol::table kwargs{ lua.create_table() };
    for (auto const &[key, value] : call.kwargs) { kwargs[key] = lua_from_node_spec(lua, value); }

    sol::table arg{ lua.create_table() };
    arg["depends_on"] = lua_from_node_tree(lua, call.depends_on);
    arg["produces"] = lua_from_node_tree(lua, call.produces);
    arg["kwargs"] = kwargs;

    sol::protected_function_result result{ run(arg) };
    if (!result.valid()) {
      sol::error err = result;
      throw std::runtime_error(err.what());
    }
  };
}

lua_task_definition make_definition(sol::table const &definition, std::uint64_t order) {
  auto run{ sol_util_get_required<sol::protected_function>(definition, "run", "task") };

  std::vector<mark> markers;
  auto const count{ definition.size() };
  for (std::size_t i{ 1 }; i <= count; ++i) {
    sol::object const element{ definition[i] };
    if (!element.is<mark>()) {
      throw std::runtime_error("task: element " + std::to_string(i) +
                               " is not a marker (" +
                               std::string{ sol_util_type_name(element.get_type()) } + ")");
    }
    markers.push_back(element.as<mark>());
  }

  kwargs_t kwargs;
  if (auto const table{ sol_util_get_optional<sol::table>(definition, "kwargs", "task") }) {
    kwargs = parse_kwargs(*table);
  }

  auto inner{ std::make_shared<task_function>() };
  inner->body = make_body(std::move(run));

  auto outer{ std::make_shared<task_function>() };
  outer->markers = std::move(markers);
  outer->kwargs = std::move(kwargs);
  outer->wrapped = std::move(inner);

  return lua_task_definition{ .function = std::move(outer), .order = order };
}

}  // namespace

bool task_file_matches(std::filesystem::path const &path, session_cfg const &cfg) {
  std::string const filename{ path.filename().string() };
  return filename.starts_with(cfg.task_file_prefix) &&
         path.extension().string() == cfg.task_file_extension;
}

void task_file_install(sol::state &lua) {
  lua.new_usertype<mark>("tasker_mark", sol::no_constructor, "name", sol::readonly(&mark::name));

  lua["depends_on"] = [](sol::variadic_args args) { return make_mark("depends_on", args); };
  lua["produces"] = [](sol::variadic_args args) { return make_mark("produces", args); };
  lua["mark"] = [](std::string name, sol::variadic_args args) {
    return make_mark(std::move(name), args);
  };

  auto next_order{ std::make_shared<std::uint64_t>(0) };
  lua["task"] = [next_order](sol::table definition) {
    return make_definition(definition, (*next_order)++);
  };
}

task_module task_file_load(std::filesystem::path const &path, session_cfg const &cfg) {
  task_module module{ .path = path, .lua = sol_util_make_lua_state(), .tasks = {} };
  task_file_install(*module.lua);

  sol::protected_function_result result{
    module.lua->safe_script_file(path.string(), sol::script_pass_on_error)
  };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(err.what());
  }

  std::vector<std::pair<std::string, lua_task_definition>> found;
  for (auto const &[key, value] : module.lua->globals()) {
    if (key.get_type() != sol::type::string || !value.is<lua_task_definition>()) {
      continue;
    }
    std::string name{ key.as<std::string>() };
    if (!name.starts_with(cfg.task_prefix)) { continue; }
    found.emplace_back(std::move(name), value.as<lua_task_definition>());
  }

  std::sort(found.begin(), found.end(), [](auto const &a, auto const &b) {
    return a.second.order < b.second.order;
  });

  module.tasks.reserve(found.size());
  for (auto &[name, definition] : found) {
    module.tasks.emplace_back(std::move(name), std::move(definition.function));
  }

  tui::debug("loaded %s: %zu task(s)", path.string().c_str(), module.tasks.size());
  TASKER_TRACE_TASK_FILE_LOADED(path.generic_string(),
                                static_cast<std::int64_t>(module.tasks.size()));
  return module;
}

node_spec lua_to_node_spec(sol::object const &value) {
  switch (value.get_type()) {
    case sol::type::string: return node_spec{ value.as<std::string>() };
    case sol::type::boolean: return node_spec{ node_ref{ value.as<bool>() } };
    case sol::type::number: return node_spec{ lua_number_object_to_ref(value) };
    case sol::type::table: return table_to_node_spec(value.as<sol::table>());
    default:
      throw std::runtime_error("cannot use a " +
                               std::string{ sol_util_type_name(value.get_type()) } +
                               " as a node reference");
  }
}

sol::object lua_from_node_spec(sol::state_view lua, node_spec const &spec) {
  return std::visit(
      match{
          [&](node_ref const &ref) {
            return std::visit(
                [&](auto const &scalar) { return sol::make_object(lua.lua_state(), scalar); },
                ref);
          },
          [&](node_spec::sequence const &items) {
            sol::table table{ lua.create_table() };
            for (std::size_t i{ 0 }; i < items.size(); ++i) {
              table[i + 1] = lua_from_node_spec(lua, items[i]);
            }
            return sol::make_object(lua.lua_state(), table);
          },
          [&](node_spec::mapping const &entries) {
            sol::table table{ lua.create_table() };
            for (auto const &[key, value] : entries) {
              set_entry(table, key, lua_from_node_spec(lua, value));
            }
            return sol::make_object(lua.lua_state(), table);
          },
      },
      spec.value);
}

sol::object lua_from_node_tree(sol::state_view lua, node_tree const &tree) {
  if (tree.is_leaf()) { return sol::make_object(lua.lua_state(), tree.leaf()->path().string()); }

  sol::table table{ lua.create_table() };
  for (auto const &[key, child] : tree.entries()) {
    set_entry(table, key, lua_from_node_tree(lua, child));
  }
  return sol::make_object(lua.lua_state(), table);
}

}  // namespace tasker
