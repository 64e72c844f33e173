#pragma once

#include <filesystem>
#include <iterator>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_set>

namespace tasker {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Values occurring more than once in `items`, e.g. ["a","b","a"] -> {"a"}.
// Element type must be ordered (result) and hashable (seen-set).
template <typename Range>
auto util_find_duplicates(Range const &items) {
  using value_t = std::decay_t<decltype(*std::begin(items))>;
  std::unordered_set<value_t> seen;
  std::set<value_t> duplicates;
  for (auto const &item : items) {
    if (!seen.insert(item).second) { duplicates.insert(item); }
  }
  return duplicates;
}

// Modification time of `path` as a decimal count of file clock ticks.
// Throws node_not_found if the path does not exist.
std::string util_mtime_fingerprint(std::filesystem::path const &path);

// Removes a file or directory tree on destruction (errors ignored).
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace tasker
