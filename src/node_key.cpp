#include "node_key.h"

#include "util.h"

#include <functional>
#include <utility>

namespace tasker {

node_key::node_key(std::string name) : value_{ std::move(name) } {}

node_key::node_key(char const *name) : value_{ std::string{ name } } {}

node_key::node_key(std::int64_t index) : value_{ index } {}

node_key::node_key(placeholder p) : value_{ p } {}

bool node_key::is_scalar_placeholder() const {
  auto const *p{ std::get_if<placeholder>(&value_) };
  return p && p->scalar;
}

std::optional<std::string_view> node_key::name() const {
  if (auto const *s{ std::get_if<std::string>(&value_) }) { return *s; }
  return std::nullopt;
}

std::optional<std::int64_t> node_key::index() const {
  if (auto const *i{ std::get_if<std::int64_t>(&value_) }) { return *i; }
  return std::nullopt;
}

std::string node_key::str() const {
  return std::visit(match{
                        [](std::string const &s) { return s; },
                        [](std::int64_t i) { return std::to_string(i); },
                        [](placeholder const &p) {
                          return std::string{ p.scalar ? "<scalar-placeholder#"
                                                       : "<placeholder#" } +
                                 std::to_string(p.token) + ">";
                        },
                    },
                    value_);
}

std::string node_key::repr() const {
  if (is_name()) { return "'" + str() + "'"; }
  return str();
}

std::size_t node_key::hash() const {
  std::size_t const alt{ value_.index() };
  std::size_t const h{ std::visit(
      match{
          [](std::string const &s) { return std::hash<std::string>{}(s); },
          [](std::int64_t i) { return std::hash<std::int64_t>{}(i); },
          [](placeholder const &p) {
            return std::hash<std::uint64_t>{}(p.token) ^ (p.scalar ? 0x9e3779b9u : 0u);
          },
      },
      value_) };
  return h ^ (alt + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
}

}  // namespace tasker
