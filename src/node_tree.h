#pragma once

#include "node_key.h"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tasker {

// Keyed tree whose interior levels are ordered mappings and whose leaves are `Leaf`.
// Top level may itself be a bare leaf (a task with one bare dependency).
template <typename Leaf>
struct basic_node_tree {
  using leaf_t = Leaf;
  using mapping = std::vector<std::pair<node_key, basic_node_tree>>;

  std::variant<Leaf, mapping> value;

  basic_node_tree() : value{ mapping{} } {}
  basic_node_tree(Leaf leaf) : value{ std::move(leaf) } {}
  basic_node_tree(mapping entries) : value{ std::move(entries) } {}

  bool is_leaf() const { return std::holds_alternative<Leaf>(value); }
  Leaf const &leaf() const { return std::get<Leaf>(value); }
  mapping const &entries() const { return std::get<mapping>(value); }
  mapping &entries() { return std::get<mapping>(value); }

  bool operator==(basic_node_tree const &) const = default;
};

template <typename Leaf>
basic_node_tree<Leaf> const *tree_find(typename basic_node_tree<Leaf>::mapping const &m,
                                       node_key const &key) {
  for (auto const &[k, v] : m) {
    if (k == key) { return &v; }
  }
  return nullptr;
}

// Child at `key`; throws std::out_of_range if the tree is a leaf or lacks the key.
template <typename Leaf>
basic_node_tree<Leaf> const &tree_at(basic_node_tree<Leaf> const &tree,
                                     node_key const &key) {
  if (tree.is_leaf()) {
    throw std::out_of_range("tree_at: tree is a leaf, no key " + key.str());
  }
  if (auto const *child{ tree_find<Leaf>(tree.entries(), key) }) { return *child; }
  throw std::out_of_range("tree_at: no key " + key.str());
}

// Apply `fn` to every leaf, preserving keys and order.
template <typename Leaf, typename Fn>
auto tree_map(basic_node_tree<Leaf> const &tree, Fn &&fn)
    -> basic_node_tree<std::invoke_result_t<Fn &, Leaf const &>> {
  using out_t = basic_node_tree<std::invoke_result_t<Fn &, Leaf const &>>;
  if (tree.is_leaf()) { return out_t{ fn(tree.leaf()) }; }

  typename out_t::mapping out;
  out.reserve(tree.entries().size());
  for (auto const &[key, child] : tree.entries()) {
    out.emplace_back(key, tree_map(child, fn));
  }
  return out_t{ std::move(out) };
}

// Leaves in depth-first, insertion order.
template <typename Leaf>
void tree_leaves(basic_node_tree<Leaf> const &tree, std::vector<Leaf> &out) {
  if (tree.is_leaf()) {
    out.push_back(tree.leaf());
    return;
  }
  for (auto const &entry : tree.entries()) { tree_leaves(entry.second, out); }
}

template <typename Leaf>
std::vector<Leaf> tree_leaves(basic_node_tree<Leaf> const &tree) {
  std::vector<Leaf> out;
  tree_leaves(tree, out);
  return out;
}

}  // namespace tasker
