#include "cmd_explain.h"

#include "diff.h"
#include "state_io.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace tfx {

void cmd_explain::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("explain", "Print a readable report of a diff") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("diff", cfg_ptr->diff_path, "Diff document ('-' for stdin)")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_explain::cmd_explain(cmd_explain::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_explain::execute() {
  auto d{ read_diff(cfg_.diff_path) };
  normalize_diff(d);

  auto const report{ explain_diff(d) };
  if (report.empty()) {
    tui::info("no changes");
    return;
  }
  tui::print_stdout("%s\n", report.c_str());
}

}  // namespace tfx
