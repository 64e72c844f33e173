#include "collect.h"

#include "session.h"
#include "trace.h"
#include "tui.h"

#include <tbb/task_group.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace tasker {

namespace {

struct file_outcome {
  std::optional<task_module> module;
  std::vector<std::unique_ptr<task>> tasks;
  std::vector<collect_failure> failures;
};

void record_failure(std::vector<collect_failure> &failures,
                    std::filesystem::path const &path,
                    std::string task_name,
                    std::string message) {
  tui::debug("collection failed for %s: %s",
             task_name.empty() ? path.string().c_str() : task_name.c_str(),
             message.c_str());
  TASKER_TRACE_COLLECTION_FAILED(task_name, path.generic_string(), message);
  failures.push_back(collect_failure{ .path = path,
                                      .task_name = std::move(task_name),
                                      .message = std::move(message) });
}

file_outcome collect_file(session &s, std::filesystem::path const &path) {
  file_outcome out;

  try {
    out.module = task_file_load(path, s.cfg());
  } catch (std::exception const &e) {
    record_failure(out.failures, path, {}, e.what());
    return out;
  }

  for (auto const &[base_name, fn] : out.module->tasks) {
    try {
      out.tasks.push_back(task::from_definition(path, base_name, fn, s));
    } catch (std::exception const &e) {
      record_failure(out.failures, path, create_task_name(path, base_name), e.what());
    }
  }
  return out;
}

std::string short_task_name(task const &t, std::filesystem::path const &root) {
  auto const relative{ t.path().lexically_relative(root) };
  if (relative.empty() || *relative.begin() == "..") { return t.name(); }
  return create_task_name(relative, t.base_name());
}

}  // namespace

std::vector<std::filesystem::path> collect_task_files(session const &s) {
  auto const &cfg{ s.cfg() };
  std::vector<std::filesystem::path> roots{ cfg.paths };
  if (roots.empty()) { roots.push_back(cfg.root); }

  std::vector<std::filesystem::path> files;
  for (auto const &p : roots) {
    auto const path{ (p.is_absolute() ? p : cfg.root / p).lexically_normal() };

    if (std::filesystem::is_directory(path)) {
      for (auto const &entry : std::filesystem::recursive_directory_iterator(path)) {
        if (entry.is_regular_file() && task_file_matches(entry.path(), cfg)) {
          files.push_back(entry.path().lexically_normal());
        }
      }
    } else if (std::filesystem::exists(path)) {
      files.push_back(path);
    } else {
      throw std::runtime_error("path does not exist: " + path.string());
    }
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

collect_result collect_tasks(session &s) {
  auto const files{ collect_task_files(s) };
  s.reset();

  std::vector<file_outcome> outcomes(files.size());
  tbb::task_group tg;
  for (std::size_t i{}; i < files.size(); ++i) {
    tg.run([&, i]() { outcomes[i] = collect_file(s, files[i]); });
  }
  tg.wait();

  collect_result result;
  std::unordered_set<std::string> names;
  for (std::size_t i{ 0 }; i < outcomes.size(); ++i) {
    auto &outcome{ outcomes[i] };
    if (outcome.module) { result.modules.push_back(std::move(*outcome.module)); }

    for (auto &failure : outcome.failures) { result.failures.push_back(std::move(failure)); }

    for (auto &t : outcome.tasks) {
      if (!names.insert(t->name()).second) {
        record_failure(result.failures,
                       files[i],
                       t->name(),
                       "task name '" + t->name() + "' is defined more than once");
        continue;
      }
      t->set_short_name(short_task_name(*t, s.cfg().root));
      result.tasks.push_back(std::move(t));
    }
  }

  tui::debug("collected %zu task(s) from %zu file(s), %zu failure(s)",
             result.tasks.size(),
             files.size(),
             result.failures.size());
  return result;
}

}  // namespace tasker
