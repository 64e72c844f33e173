#include "mark.h"

#include "errors.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace tasker {

namespace {

constexpr char kObjectsParam[]{ "objects" };

node_spec parse_objects_signature(std::string const &declaration, mark const &m) {
  if (m.args.size() > 1) {
    throw declaration_error(declaration,
                            "takes 1 positional argument but " +
                                std::to_string(m.args.size()) + " were given");
  }

  for (auto const &[key, value] : m.kwargs) {
    if (key != kObjectsParam) {
      throw declaration_error(declaration,
                              "got an unexpected keyword argument '" + key + "'");
    }
  }

  bool const has_kwarg{ m.kwargs.contains(kObjectsParam) };

  if (m.args.size() == 1 && has_kwarg) {
    throw declaration_error(declaration,
                            "got multiple values for argument '" +
                                std::string{ kObjectsParam } + "'");
  }

  if (m.args.size() == 1) { return m.args.front(); }
  if (has_kwarg) { return m.kwargs.at(kObjectsParam); }

  throw declaration_error(declaration,
                          "missing 1 required positional argument: '" +
                              std::string{ kObjectsParam } + "'");
}

}  // namespace

task_function_ptr unwrap(task_function_ptr fn) {
  if (!fn) { throw std::invalid_argument("unwrap: null task function"); }
  while (fn->wrapped) { fn = fn->wrapped; }
  return fn;
}

removed_markers remove_markers(task_function_ptr const &fn, std::string_view name) {
  if (!fn) { throw std::invalid_argument("remove_markers: null task function"); }

  auto stripped{ std::make_shared<task_function>(*fn) };
  removed_markers result;

  std::vector<mark> kept;
  for (auto const &m : fn->markers) {
    if (m.name == name) {
      result.markers.push_back(m);
    } else {
      kept.push_back(m);
    }
  }
  stripped->markers = std::move(kept);
  result.function = std::move(stripped);
  return result;
}

node_spec depends_on(mark const &m) { return parse_objects_signature("depends_on", m); }

node_spec produces(mark const &m) { return parse_objects_signature("produces", m); }

}  // namespace tasker
