#pragma once

#include "node.h"
#include "node_spec.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tasker {

using kwargs_t = std::map<std::string, node_spec>;

// Annotation attached to a task function, e.g. depends_on("in.txt").
struct mark {
  std::string name;
  std::vector<node_spec> args;
  kwargs_t kwargs;

  bool operator==(mark const &) const = default;
};

// What a task body sees when executed.
struct task_call {
  node_tree const &depends_on;
  node_tree const &produces;
  kwargs_t const &kwargs;
};

using task_body = std::function<void(task_call const &)>;

// One layer of a task callable. Declarations wrap the user's body in outer layers
// that carry the markers; `wrapped` points at the next inner layer.
struct task_function {
  task_body body;
  std::vector<mark> markers;
  kwargs_t kwargs;
  std::shared_ptr<task_function const> wrapped;
};

using task_function_ptr = std::shared_ptr<task_function const>;

// Innermost layer of `fn`.
task_function_ptr unwrap(task_function_ptr fn);

struct removed_markers {
  task_function_ptr function;  // copy of the outer layer without the removed markers
  std::vector<mark> markers;   // removed markers, in attachment order
};

removed_markers remove_markers(task_function_ptr const &fn, std::string_view name);

// Declaration functions with the signature (objects). Both return `objects`
// unchanged; they exist to reject malformed declarations with a named error.
node_spec depends_on(mark const &m);
node_spec produces(mark const &m);

}  // namespace tasker
