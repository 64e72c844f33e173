#pragma once

#include "node.h"
#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace tasker {

// One file_node per absolute location for the lifetime of a run. The graph layer
// deduplicates edges by node identity, so every lookup of a location must return
// the same object. Thread-safe; get_or_create is atomic per location.
class file_node_cache : unmovable {
 public:
  file_node_cache() = default;

  // Throws invalid_reference for relative paths. Callers normalize first.
  file_node &get_or_create(std::filesystem::path const &absolute_path);

  // Lookup without insertion; nullptr if the location was never requested.
  file_node *find(std::filesystem::path const &absolute_path) const;

  std::size_t size() const { return nodes_.size(); }

  // Forget every node. Only valid between runs: outstanding references dangle.
  void reset() { nodes_.clear(); }

 private:
  using map_t = tbb::concurrent_hash_map<std::string, std::unique_ptr<file_node>>;
  map_t nodes_;
};

}  // namespace tasker
