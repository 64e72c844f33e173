#include "cmd_version.h"

#include "tui.h"

#include <CLI/CLI.hpp>
#include <sol/sol.hpp>
#include <tbb/version.h>

#include <memory>
#include <utility>

#ifndef TASKER_VERSION_STR
#error "TASKER_VERSION_STR must be defined by the build system"
#endif

namespace tasker {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::print_stdout("tasker version %s\n", TASKER_VERSION_STR);
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %d.%d", TBB_VERSION_MAJOR, TBB_VERSION_MINOR);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace tasker
