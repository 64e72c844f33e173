#include "file_node_cache.h"

#include "errors.h"
#include "trace.h"

#include <memory>
#include <utility>

namespace tasker {

file_node &file_node_cache::get_or_create(std::filesystem::path const &absolute_path) {
  if (!absolute_path.is_absolute()) {
    throw invalid_reference(absolute_path.generic_string());
  }

  std::string key{ absolute_path.generic_string() };

  {
    map_t::const_accessor acc;
    if (nodes_.find(acc, key)) {
      TASKER_TRACE_NODE_CACHE_HIT(key);
      return *acc->second;
    }
  }

  // insert() holds the element write lock until acc is released, so a racing caller
  // blocks and then observes our node. A losing candidate is discarded unseen.
  std::unique_ptr<file_node> candidate{ new file_node(absolute_path) };
  map_t::accessor acc;
  if (nodes_.insert(acc, key)) {
    acc->second = std::move(candidate);
    TASKER_TRACE_NODE_CACHE_INSERT(key);
  } else {
    TASKER_TRACE_NODE_CACHE_HIT(key);
  }
  return *acc->second;
}

file_node *file_node_cache::find(std::filesystem::path const &absolute_path) const {
  map_t::const_accessor acc;
  if (!nodes_.find(acc, absolute_path.generic_string())) { return nullptr; }
  return acc->second.get();
}

}  // namespace tasker
