#include "session.h"

#include <memory>
#include <stdexcept>
#include <utility>

namespace tasker {

session::session(session_cfg cfg) : cfg_{ std::move(cfg) } {
  if (cfg_.root.empty()) { cfg_.root = std::filesystem::current_path(); }
  cfg_.root = std::filesystem::absolute(cfg_.root).lexically_normal();
  collectors_.push_back(std::make_unique<file_path_collector>());
}

void session::register_collector(node_collector::ptr_t collector) {
  if (!collector) { throw std::invalid_argument("register_collector: null collector"); }
  collectors_.push_back(std::move(collector));
}

void session::reset() { node_cache_.reset(); }

}  // namespace tasker
