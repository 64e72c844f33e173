#include "errors.h"

#include <utility>

namespace tasker {

namespace {

std::string join_names(std::set<std::string> const &names) {
  std::string out;
  for (auto const &name : names) {
    if (!out.empty()) { out += ", "; }
    out += name;
  }
  return out;
}

}  // namespace

invalid_reference::invalid_reference(std::string reference)
    : std::invalid_argument("Node must be instantiated from an absolute path: " +
                            reference),
      reference_{ std::move(reference) } {}

duplicate_node_name::duplicate_node_name(std::string kind, std::set<std::string> names)
    : std::runtime_error("'" + kind +
                         "' has nodes with the same name: " + join_names(names)),
      kind_{ std::move(kind) },
      names_{ std::move(names) } {}

node_not_collected::node_not_collected(std::string reference,
                                       std::string task_name,
                                       std::filesystem::path path)
    : std::runtime_error(reference + " cannot be parsed as a dependency or product for "
                                     "task '" +
                         task_name + "' in '" + path.generic_string() + "'."),
      reference_{ std::move(reference) },
      task_name_{ std::move(task_name) },
      path_{ std::move(path) } {}

node_not_found::node_not_found(std::filesystem::path path)
    : std::runtime_error("Node not found: " + path.generic_string()),
      path_{ std::move(path) } {}

declaration_error::declaration_error(std::string declaration, std::string const &message)
    : std::invalid_argument(declaration + "() " + message),
      declaration_{ std::move(declaration) } {}

}  // namespace tasker
