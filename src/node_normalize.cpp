#include "node_normalize.h"

#include "errors.h"
#include "util.h"

#include <cstdint>
#include <set>
#include <stdexcept>
#include <utility>

namespace tasker {

namespace {

void assign(ref_map &m, node_key const &key, ref_tree value) {
  for (auto &entry : m) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  m.emplace_back(key, std::move(value));
}

bool contains(ref_map const &m, node_key const &key) {
  return tree_find<node_ref>(m, key) != nullptr;
}

void add_explicit(ref_map &m, node_key const &key, ref_tree value) {
  if (key.is_placeholder()) {
    throw std::invalid_argument("normalize: mapping key must be a name or an index, got " +
                                key.str());
  }
  if (contains(m, key)) {
    throw std::invalid_argument("normalize: mapping repeats key " + key.repr());
  }
  m.emplace_back(key, std::move(value));
}

ref_tree normalize_nested(node_spec const &spec) {
  return std::visit(match{
                        [](node_ref const &ref) { return ref_tree{ ref }; },
                        [](node_spec::sequence const &items) {
                          ref_map out;
                          out.reserve(items.size());
                          for (std::size_t i{ 0 }; i < items.size(); ++i) {
                            out.emplace_back(node_key{ static_cast<std::int64_t>(i) },
                                             normalize_nested(items[i]));
                          }
                          return ref_tree{ std::move(out) };
                        },
                        [](node_spec::mapping const &entries) {
                          ref_map out;
                          out.reserve(entries.size());
                          for (auto const &[key, value] : entries) {
                            add_explicit(out, key, normalize_nested(value));
                          }
                          return ref_tree{ std::move(out) };
                        },
                    },
                    spec.value);
}

}  // namespace

ref_map normalize(node_spec const &spec, placeholder_source &placeholders) {
  return std::visit(match{
                        [&](node_ref const &ref) {
                          ref_map out;
                          out.emplace_back(placeholders.next(true), ref_tree{ ref });
                          return out;
                        },
                        [&](node_spec::sequence const &items) {
                          ref_map out;
                          out.reserve(items.size());
                          for (auto const &item : items) {
                            out.emplace_back(placeholders.next(false),
                                             normalize_nested(item));
                          }
                          return out;
                        },
                        [](node_spec::mapping const &entries) {
                          ref_map out;
                          out.reserve(entries.size());
                          for (auto const &[key, value] : entries) {
                            add_explicit(out, key, normalize_nested(value));
                          }
                          return out;
                        },
                    },
                    spec.value);
}

ref_map union_of_node_maps(std::vector<ref_map> const &maps) {
  ref_map out;
  for (auto const &m : maps) {
    for (auto const &[key, value] : m) { assign(out, key, value); }
  }
  return out;
}

ref_tree merge_node_maps(std::vector<ref_map> const &maps, std::string const &kind) {
  std::vector<node_key> names;
  for (auto const &m : maps) {
    for (auto const &entry : m) {
      if (!entry.first.is_placeholder()) { names.push_back(entry.first); }
    }
  }

  if (auto const duplicated{ util_find_duplicates(names) }; !duplicated.empty()) {
    std::set<std::string> duplicated_names;
    for (auto const &key : duplicated) { duplicated_names.insert(key.repr()); }
    throw duplicate_node_name(kind, std::move(duplicated_names));
  }

  ref_map merged{ union_of_node_maps(maps) };

  if (merged.size() == 1 && merged.front().first.is_placeholder()) {
    auto &[placeholder, value] = merged.front();
    if (placeholder.is_scalar_placeholder()) { return std::move(value); }
    ref_map out;
    out.emplace_back(node_key{ 0 }, std::move(value));
    return ref_tree{ std::move(out) };
  }

  ref_map out;
  out.reserve(merged.size());
  std::int64_t counter{ 0 };
  for (auto &[key, value] : merged) {
    if (!key.is_placeholder()) {
      out.emplace_back(key, std::move(value));
      continue;
    }

    while (contains(merged, node_key{ counter }) || contains(out, node_key{ counter })) {
      ++counter;
    }
    out.emplace_back(node_key{ counter++ }, std::move(value));
  }

  return ref_tree{ std::move(out) };
}

ref_tree convert_to_node_tree(std::vector<node_spec> const &declarations,
                              std::string const &kind) {
  placeholder_source placeholders;
  std::vector<ref_map> maps;
  maps.reserve(declarations.size());
  for (auto const &declaration : declarations) {
    maps.push_back(normalize(declaration, placeholders));
  }
  return merge_node_maps(maps, kind);
}

}  // namespace tasker
