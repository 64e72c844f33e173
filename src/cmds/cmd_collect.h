#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace CLI { class App; }

namespace tasker {

class cmd_collect : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_collect> {
    std::vector<std::filesystem::path> paths;
    std::optional<std::filesystem::path> root;
    bool show_nodes{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_collect(cfg cfg);

  // Prints every collected task; false if any task or file failed to collect.
  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tasker
