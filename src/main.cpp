#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  tfx::tui::init();

  auto args{ tfx::cli_parse(argc, argv) };

  try {
    tfx::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    tfx::tui::scope tui_scope{ args.verbosity, args.decorated_logging };
    tfx::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  }

  tfx::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      tfx::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    tfx::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return tfx::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    tfx::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
