#pragma once

#include "task.h"
#include "task_file.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tasker {

class session;

struct collect_failure {
  std::filesystem::path path;
  std::string task_name;  // empty when the whole file failed to load
  std::string message;
};

struct collect_result {
  std::vector<task_module> modules;  // declared first: tasks call into these
  std::vector<std::unique_ptr<task>> tasks;  // file order, then definition order
  std::vector<collect_failure> failures;
};

// Task files named by the session's paths, relative paths taken from the root.
// Directories are searched recursively. Sorted, without duplicates. Throws
// std::runtime_error for a path that does not exist.
std::vector<std::filesystem::path> collect_task_files(session const &s);

// Loads every task file and builds its tasks, files in parallel. A task either
// appears complete in `tasks` or not at all, with its error in `failures`. Resets the
// session's node cache first, so nodes from an earlier result must not be used.
collect_result collect_tasks(session &s);

}  // namespace tasker
