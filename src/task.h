#pragma once

#include "mark.h"
#include "node.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tasker {

class session;

// "<defining path, forward slashes>::<base_name>", e.g. "module.lua::task_dummy".
std::string create_task_name(std::filesystem::path const &path,
                             std::string_view base_name);

enum class task_status { collected, executing, succeeded, failed };

char const *task_status_name(task_status status);

struct report_section {
  std::string when;     // phase, e.g. "call"
  std::string key;      // kind, e.g. "stdout"
  std::string content;

  bool operator==(report_section const &) const = default;
};

class task : public node {
 public:
  // Extract depends_on/produces declarations from `fn`, normalize and merge them,
  // resolve every reference through the session's collectors. All-or-nothing:
  // throws duplicate_node_name, declaration_error, node_not_collected or
  // invalid_reference, leaving no partially built task behind.
  static std::unique_ptr<task> from_definition(std::filesystem::path const &path,
                                               std::string const &base_name,
                                               task_function_ptr const &fn,
                                               session &s);

  std::string const &name() const override { return name_; }
  std::filesystem::path const &path() const override { return path_; }

  // Modification time of the defining file.
  std::string state() const override;

  std::string const &base_name() const { return base_name_; }
  std::string const &short_name() const { return short_name_; }
  void set_short_name(std::string short_name) { short_name_ = std::move(short_name); }

  node_tree const &depends_on() const { return depends_on_; }
  node_tree const &produces() const { return produces_; }
  std::vector<mark> const &markers() const { return markers_; }
  kwargs_t const &kwargs() const { return kwargs_; }
  task_function_ptr const &function() const { return function_; }

  std::map<std::string, std::string> &attributes() { return attributes_; }
  std::map<std::string, std::string> const &attributes() const { return attributes_; }

  task_status status() const { return status_; }

  // collected -> executing -> succeeded | failed. Exceptions from the body mark the
  // task failed and propagate. Throws std::logic_error unless status is collected.
  void execute();

  // Sections with empty content are dropped. Throws std::logic_error before execute().
  void add_report_section(std::string when, std::string key, std::string content);
  std::vector<report_section> const &report_sections() const { return report_sections_; }

 private:
  task(std::filesystem::path path,
       std::string base_name,
       task_function_ptr function,
       node_tree depends_on,
       node_tree produces,
       std::vector<mark> markers,
       kwargs_t kwargs);

  std::string base_name_;
  std::string name_;
  std::string short_name_;
  std::filesystem::path path_;
  task_function_ptr function_;  // innermost layer
  node_tree depends_on_;
  node_tree produces_;
  std::vector<mark> markers_;
  kwargs_t kwargs_;
  std::map<std::string, std::string> attributes_;
  std::vector<report_section> report_sections_;
  task_status status_{ task_status::collected };
};

}  // namespace tasker
