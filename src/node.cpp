#include "node.h"

#include "errors.h"

#include <utility>

namespace tasker {

file_node::file_node(std::filesystem::path path) {
  if (!path.is_absolute()) { throw invalid_reference(path.generic_string()); }
  name_ = path.generic_string();
  value_ = path;
  path_ = std::move(path);
}

std::string file_node::state() const { return util_mtime_fingerprint(path_); }

}  // namespace tasker
