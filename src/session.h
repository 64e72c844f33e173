#pragma once

#include "file_node_cache.h"
#include "node_collector.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <vector>

namespace tasker {

struct session_cfg {
  std::filesystem::path root;                // short names are relative to this
  std::vector<std::filesystem::path> paths;  // files or directories; empty = root
  std::string task_file_prefix{ "task_" };
  std::string task_file_extension{ ".lua" };
  std::string task_prefix{ "task_" };  // globals defining tasks
};

// Run context shared by every task collected in one run. Collectors must be
// registered before collection starts; the node cache is safe to share across threads.
class session : unmovable {
 public:
  // Registers a file_path_collector. An empty root becomes the current directory.
  explicit session(session_cfg cfg);

  session_cfg const &cfg() const { return cfg_; }

  void register_collector(node_collector::ptr_t collector);
  std::vector<node_collector::ptr_t> const &collectors() const { return collectors_; }

  file_node_cache &node_cache() { return node_cache_; }
  file_node_cache const &node_cache() const { return node_cache_; }

  // Start of a new run: forget every node of the previous one.
  void reset();

 private:
  session_cfg cfg_;
  std::vector<node_collector::ptr_t> collectors_;
  file_node_cache node_cache_;
};

}  // namespace tasker
