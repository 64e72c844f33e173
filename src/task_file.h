#pragma once

#include "mark.h"
#include "node.h"
#include "node_spec.h"
#include "sol_util.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace tasker {

struct session_cfg;

// A loaded task file. Task bodies call back into `lua`, so the module must outlive
// every task built from it.
struct task_module {
  std::filesystem::path path;
  sol_state_ptr lua;
  std::vector<std::pair<std::string, task_function_ptr>> tasks;  // definition order
};

// True for files named <task_file_prefix>*<task_file_extension>.
bool task_file_matches(std::filesystem::path const &path, session_cfg const &cfg);

// Runs the script and collects every global named <task_prefix>* that holds a task{}
// definition. Throws std::runtime_error with the Lua message on script errors.
task_module task_file_load(std::filesystem::path const &path, session_cfg const &cfg);

// Installs depends_on(), produces(), mark() and task() into `lua`.
void task_file_install(sol::state &lua);

// Strings, numbers and booleans are scalars. A table whose keys are exactly 1..n is a
// sequence; any other table is a mapping, integer keys ascending, then string keys.
node_spec lua_to_node_spec(sol::object const &value);

sol::object lua_from_node_spec(sol::state_view lua, node_spec const &spec);

// Leaves appear as the node's path string.
sol::object lua_from_node_tree(sol::state_view lua, node_tree const &tree);

}  // namespace tasker
