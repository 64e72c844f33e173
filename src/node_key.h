#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tasker {

// Key of a dependency/product mapping: an explicit name, an explicit integer index,
// or an anonymous placeholder that only exists between normalization and merging.
// Names and indices are distinct keys: "1" never equals 1.
class node_key {
 public:
  struct placeholder {
    bool scalar{ false };     // wraps a bare top-level scalar, not a collection element
    std::uint64_t token{ 0 };  // unique within one merge operation

    bool operator==(placeholder const &) const = default;
    auto operator<=>(placeholder const &) const = default;
  };

  node_key(std::string name);
  node_key(char const *name);
  node_key(std::int64_t index);
  node_key(int index) : node_key(static_cast<std::int64_t>(index)) {}
  node_key(placeholder p);

  bool is_name() const { return std::holds_alternative<std::string>(value_); }
  bool is_index() const { return std::holds_alternative<std::int64_t>(value_); }
  bool is_placeholder() const { return std::holds_alternative<placeholder>(value_); }
  bool is_scalar_placeholder() const;

  std::optional<std::string_view> name() const;
  std::optional<std::int64_t> index() const;

  // "name", "3", or "<placeholder#7>" / "<scalar-placeholder#7>"
  std::string str() const;

  // Like str(), but names are quoted: "'name'" vs "1".
  std::string repr() const;

  bool operator==(node_key const &other) const { return value_ == other.value_; }
  auto operator<=>(node_key const &other) const { return value_ <=> other.value_; }

  std::size_t hash() const;

 private:
  std::variant<std::string, std::int64_t, placeholder> value_;
};

// Issues placeholder keys for one merge operation.
class placeholder_source {
 public:
  node_key next(bool scalar) { return node_key{ node_key::placeholder{ scalar, next_++ } }; }

 private:
  std::uint64_t next_{ 0 };
};

}  // namespace tasker

template <>
struct std::hash<tasker::node_key> {
  std::size_t operator()(tasker::node_key const &k) const { return k.hash(); }
};
