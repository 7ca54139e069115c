#include "cmd_merge.h"

#include "state.h"
#include "state_io.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace tfx {

namespace {

void register_sub(CLI::App &app,
                  char const *name,
                  char const *description,
                  cmd_merge::op operation,
                  std::function<void(cmd_merge::cfg)> on_selected) {
  auto *sub{ app.add_subcommand(name, description) };
  auto cfg_ptr{ std::make_shared<cmd_merge::cfg>() };
  cfg_ptr->operation = operation;
  sub->add_option("a", cfg_ptr->lhs_path, "Base state document ('-' for stdin)")
      ->required();
  sub->add_option("b", cfg_ptr->rhs_path, "Second state document")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("-o,--output", cfg_ptr->output, "Output state ('-' for stdout)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

}  // namespace

void cmd_merge::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  register_sub(app,
               "merge",
               "Add resources of b missing from a",
               op::add,
               on_selected);
  register_sub(app,
               "subtract",
               "Remove resources of b from a",
               op::subtract,
               std::move(on_selected));
}

cmd_merge::cmd_merge(cmd_merge::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_merge::execute() {
  auto a{ read_state(cfg_.lhs_path) };
  auto const b{ read_state(cfg_.rhs_path) };
  auto const before{ a.resource_count() };

  if (cfg_.operation == op::add) {
    add_state(a, b);
    tui::debug("merge: %zu resources added", a.resource_count() - before);
  } else {
    sub_state(a, b);
    tui::debug("subtract: %zu resources removed", before - a.resource_count());
  }

  write_state(a, cfg_.output);
}

}  // namespace tfx
