#pragma once

#include "node_key.h"
#include "node_ref.h"
#include "node_spec.h"
#include "node_tree.h"

#include <string>
#include <vector>

namespace tasker {

using ref_tree = basic_node_tree<node_ref>;
using ref_map = ref_tree::mapping;

// Flatten one declaration payload into a keyed mapping.
//   top-level scalar     -> { <scalar placeholder>: value }
//   top-level sequence   -> { <placeholder>: elem, <placeholder>: elem, ... }
//   nested sequence      -> { 0: elem, 1: elem, ... }
//   mapping (any level)  -> { key: normalized value, ... }
//   nested scalar        -> value, unwrapped
// Throws std::invalid_argument if a mapping at any level has a placeholder key or
// repeats a key.
ref_map normalize(node_spec const &spec, placeholder_source &placeholders);

// Shallow union; an equal key seen later replaces the earlier value in place.
ref_map union_of_node_maps(std::vector<ref_map> const &maps);

// Merge all declarations of one kind ("depends_on" / "produces") for one task.
// Throws duplicate_node_name if an explicit top-level key repeats across declarations.
// One scalar placeholder collapses to the bare value, one collection placeholder to
// { 0: value }; otherwise placeholders take the lowest free non-negative integers.
ref_tree merge_node_maps(std::vector<ref_map> const &maps, std::string const &kind);

// normalize() every declaration with one placeholder_source, then merge_node_maps().
ref_tree convert_to_node_tree(std::vector<node_spec> const &declarations,
                              std::string const &kind);

}  // namespace tasker
