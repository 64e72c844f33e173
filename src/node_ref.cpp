#include "node_ref.h"

#include "util.h"

#include <sstream>

namespace tasker {

std::string node_ref_repr(node_ref const &ref) {
  return std::visit(match{
                        [](bool value) -> std::string { return value ? "true" : "false"; },
                        [](std::int64_t value) { return std::to_string(value); },
                        [](double value) {
                          std::ostringstream oss;
                          oss << value;
                          return oss.str();
                        },
                        [](std::string const &value) { return "'" + value + "'"; },
                    },
                    ref);
}

}  // namespace tasker
