#pragma once

#include "node.h"
#include "node_ref.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <string>

namespace tasker {

class session;

// Turns a raw reference into a node. Sessions try collectors in registration order
// and take the first non-null result.
class node_collector : unmovable {
 public:
  using ptr_t = std::unique_ptr<node_collector>;

  virtual ~node_collector() = default;

  virtual char const *name() const = 0;

  // nullptr if this collector does not recognize `ref`.
  virtual node *try_collect(session &s,
                            std::filesystem::path const &defining_path,
                            node_ref const &ref) = 0;

 protected:
  node_collector() = default;
};

// String references are file paths, relative ones anchored at the defining file's
// directory. Nodes come from the session's file_node_cache.
class file_path_collector : public node_collector {
 public:
  char const *name() const override { return "file_path"; }

  node *try_collect(session &s,
                    std::filesystem::path const &defining_path,
                    node_ref const &ref) override;
};

// Resolve `ref` for the task `task_name` defined in `defining_path`.
// Throws node_not_collected if no collector recognizes it.
node &collect_node(session &s,
                   std::filesystem::path const &defining_path,
                   std::string const &task_name,
                   node_ref const &ref);

}  // namespace tasker
