#include "cmd_transform.h"

#include "diff.h"
#include "rule_io.h"
#include "state_io.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace tfx {

void cmd_transform::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("transform", "Move, replace and delete resources in a state") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("state", cfg_ptr->state_path, "State document ('-' for stdin)")
      ->required();
  sub->add_option("rules", cfg_ptr->rules_path, "Transform file (Lua TRANSFORM table or JSON)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("-o,--output", cfg_ptr->output, "Output state ('-' for stdout)");
  auto *diff_out{ sub->add_option("--diff-out",
                                  cfg_ptr->diff_output,
                                  "Where to write the remapped diff") };
  sub->add_option("--diff", cfg_ptr->diff_path, "Diff document to remap alongside the state")
      ->check(CLI::ExistingFile)
      ->needs(diff_out);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_transform::cmd_transform(cmd_transform::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_transform::execute() {
  auto const transform{ load_transform(cfg_.rules_path) };
  auto s{ read_state(cfg_.state_path) };

  std::optional<diff> d;
  if (cfg_.diff_path) { d = read_diff(*cfg_.diff_path); }

  // Both documents are remapped before either is written.
  transform.apply(s);
  if (d) {
    transform.apply_to_diff(*d);
    normalize_diff(*d);
  }

  write_state(s, cfg_.output);
  if (d) { write_diff(*d, cfg_.diff_output.value_or("-")); }

  tui::debug("transform: %zu entries applied, %zu resources remain",
             transform.size(),
             s.resource_count());
}

}  // namespace tfx
