#pragma once

#include "node_tree.h"
#include "util.h"

#include <filesystem>
#include <string>

namespace tasker {

// Addressable entity of the dependency graph: a task or a resource.
class node : unmovable {
 public:
  virtual ~node() = default;

  virtual std::string const &name() const = 0;
  virtual std::filesystem::path const &path() const = 0;

  // Fingerprint of the current content/version; throws node_not_found if absent.
  // Equal fingerprints mean no visible change (coarse: modification time).
  virtual std::string state() const = 0;

 protected:
  node() = default;
};

using node_tree = basic_node_tree<node *>;

class file_node_cache;

// Resource node backed by a file. Only file_node_cache creates these, so there is
// exactly one instance per absolute location.
class file_node : public node {
 public:
  std::string const &name() const override { return name_; }
  std::filesystem::path const &path() const override { return path_; }
  std::filesystem::path const &value() const { return value_; }

  std::string state() const override;

 private:
  friend class file_node_cache;

  // Throws invalid_reference unless `path` is absolute.
  explicit file_node(std::filesystem::path path);

  std::string name_;             // forward-slash form of path_
  std::filesystem::path value_;  // location handed to the task body
  std::filesystem::path path_;
};

}  // namespace tasker
