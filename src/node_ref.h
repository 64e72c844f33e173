#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace tasker {

// Raw, unresolved dependency/product value as written in a declaration.
using node_ref = std::variant<bool, std::int64_t, double, std::string>;

// Human-readable form for messages: strings quoted ('a.txt'), bools true/false.
std::string node_ref_repr(node_ref const &ref);

}  // namespace tasker
