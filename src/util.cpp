#include "util.h"

#include "errors.h"

#include <string>
#include <system_error>
#include <utility>

namespace tasker {

std::string util_mtime_fingerprint(std::filesystem::path const &path) {
  std::error_code ec;
  auto const mtime{ std::filesystem::last_write_time(path, ec) };
  if (ec) { throw node_not_found(path); }
  return std::to_string(mtime.time_since_epoch().count());
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace tasker
