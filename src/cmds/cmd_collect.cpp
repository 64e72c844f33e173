#include "cmd_collect.h"

#include "collect.h"
#include "session.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <utility>

namespace tasker {

namespace {

void print_entries(node_tree const &tree, int depth) {
  for (auto const &[key, child] : tree.entries()) {
    if (child.is_leaf()) {
      tui::print_stdout("%*s%s: %s\n",
                        depth * 2,
                        "",
                        key.str().c_str(),
                        child.leaf()->name().c_str());
    } else {
      tui::print_stdout("%*s%s:\n", depth * 2, "", key.str().c_str());
      print_entries(child, depth + 1);
    }
  }
}

void print_nodes(char const *kind, node_tree const &tree) {
  if (tree.is_leaf()) {
    tui::print_stdout("  %s: %s\n", kind, tree.leaf()->name().c_str());
    return;
  }
  if (tree.entries().empty()) { return; }

  tui::print_stdout("  %s:\n", kind);
  print_entries(tree, 2);
}

}  // namespace

void cmd_collect::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("collect", "Collect tasks and resolve their nodes") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("paths",
                  cfg_ptr->paths,
                  "Task files or directories (defaults to the root directory)");
  sub->add_option("--root", cfg_ptr->root, "Root directory (defaults to current directory)")
      ->check(CLI::ExistingDirectory);
  sub->add_flag("--nodes", cfg_ptr->show_nodes, "Print dependencies and products");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_collect::cmd_collect(cmd_collect::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_collect::execute() {
  session s{ session_cfg{ .root = cfg_.root.value_or(std::filesystem::path{}),
                          .paths = cfg_.paths } };

  auto const result{ collect_tasks(s) };

  for (auto const &t : result.tasks) {
    tui::print_stdout("%s\n", t->short_name().c_str());
    if (cfg_.show_nodes) {
      print_nodes("depends_on", t->depends_on());
      print_nodes("produces", t->produces());
    }
  }

  for (auto const &failure : result.failures) {
    tui::error("%s: %s",
               failure.task_name.empty() ? failure.path.string().c_str()
                                         : failure.task_name.c_str(),
               failure.message.c_str());
  }

  tui::info("collected %zu task(s), %zu failure(s)",
            result.tasks.size(),
            result.failures.size());
  return result.failures.empty();
}

}  // namespace tasker
