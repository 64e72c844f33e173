#include "node_collector.h"

#include "errors.h"
#include "file_node_cache.h"
#include "session.h"
#include "trace.h"

#include <string>
#include <variant>

namespace tasker {

node *file_path_collector::try_collect(session &s,
                                       std::filesystem::path const &defining_path,
                                       node_ref const &ref) {
  auto const *value{ std::get_if<std::string>(&ref) };
  if (!value || value->empty()) { return nullptr; }

  std::filesystem::path path{ *value };
  if (!path.is_absolute()) { path = defining_path.parent_path() / path; }

  return &s.node_cache().get_or_create(path.lexically_normal());
}

node &collect_node(session &s,
                   std::filesystem::path const &defining_path,
                   std::string const &task_name,
                   node_ref const &ref) {
  for (auto const &collector : s.collectors()) {
    if (node *n{ collector->try_collect(s, defining_path, ref) }) {
      TASKER_TRACE_NODE_COLLECTED(task_name,
                                  node_ref_repr(ref),
                                  n->name(),
                                  std::string{ collector->name() });
      return *n;
    }
  }
  throw node_not_collected(node_ref_repr(ref), task_name, defining_path);
}

}  // namespace tasker
