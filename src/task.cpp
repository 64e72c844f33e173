#include "task.h"

#include "node_collector.h"
#include "node_normalize.h"
#include "session.h"
#include "trace.h"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace tasker {

namespace {

using declaration_fn = node_spec (*)(mark const &);

// Strips every `name` marker from `fn` and parses each through `parser`.
std::vector<node_spec> extract_declarations(task_function_ptr &fn,
                                            char const *name,
                                            declaration_fn parser) {
  auto removed{ remove_markers(fn, name) };
  fn = std::move(removed.function);

  std::vector<node_spec> declarations;
  declarations.reserve(removed.markers.size());
  for (auto const &m : removed.markers) { declarations.push_back(parser(m)); }
  return declarations;
}

node_tree resolve(ref_tree const &refs,
                  session &s,
                  std::filesystem::path const &path,
                  std::string const &task_name) {
  return tree_map(refs, [&](node_ref const &ref) -> node * {
    return &collect_node(s, path, task_name, ref);
  });
}

}  // namespace

std::string create_task_name(std::filesystem::path const &path,
                             std::string_view base_name) {
  return path.generic_string() + "::" + std::string{ base_name };
}

char const *task_status_name(task_status status) {
  switch (status) {
    case task_status::collected: return "collected";
    case task_status::executing: return "executing";
    case task_status::succeeded: return "succeeded";
    case task_status::failed: return "failed";
  }
  return "unknown";
}

std::unique_ptr<task> task::from_definition(std::filesystem::path const &path,
                                            std::string const &base_name,
                                            task_function_ptr const &fn,
                                            session &s) {
  if (!fn) { throw std::invalid_argument("task '" + base_name + "' has no function"); }

  std::string const name{ create_task_name(path, base_name) };

  task_function_ptr stripped{ fn };
  auto const dependency_specs{
    extract_declarations(stripped, "depends_on", &tasker::depends_on)
  };
  auto const product_specs{ extract_declarations(stripped, "produces", &tasker::produces) };

  auto dependencies{
    resolve(convert_to_node_tree(dependency_specs, "depends_on"), s, path, name)
  };
  auto products{ resolve(convert_to_node_tree(product_specs, "produces"), s, path, name) };

  auto inner{ unwrap(fn) };
  if (!inner->body) { throw std::invalid_argument("task '" + name + "' has no body"); }

  TASKER_TRACE_TASK_COLLECTED(name,
                              static_cast<std::int64_t>(tree_leaves(dependencies).size()),
                              static_cast<std::int64_t>(tree_leaves(products).size()));

  return std::unique_ptr<task>(new task(path,
                                        base_name,
                                        std::move(inner),
                                        std::move(dependencies),
                                        std::move(products),
                                        stripped->markers,
                                        stripped->kwargs));
}

task::task(std::filesystem::path path,
           std::string base_name,
           task_function_ptr function,
           node_tree depends_on,
           node_tree produces,
           std::vector<mark> markers,
           kwargs_t kwargs)
    : base_name_{ std::move(base_name) },
      name_{ create_task_name(path, base_name_) },
      short_name_{ name_ },
      path_{ std::move(path) },
      function_{ std::move(function) },
      depends_on_{ std::move(depends_on) },
      produces_{ std::move(produces) },
      markers_{ std::move(markers) },
      kwargs_{ std::move(kwargs) } {}

std::string task::state() const { return util_mtime_fingerprint(path_); }

void task::execute() {
  if (status_ != task_status::collected) {
    throw std::logic_error("task '" + name_ + "' cannot execute while " +
                           task_status_name(status_));
  }

  status_ = task_status::executing;
  try {
    function_->body(task_call{ depends_on_, produces_, kwargs_ });
  } catch (...) {
    status_ = task_status::failed;
    throw;
  }
  status_ = task_status::succeeded;
}

void task::add_report_section(std::string when, std::string key, std::string content) {
  if (status_ == task_status::collected) {
    throw std::logic_error("task '" + name_ + "' has not started executing");
  }
  if (content.empty()) { return; }
  report_sections_.push_back(report_section{ .when = std::move(when),
                                             .key = std::move(key),
                                             .content = std::move(content) });
}

}  // namespace tasker
