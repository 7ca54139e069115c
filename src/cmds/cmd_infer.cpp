#include "cmd_infer.h"

#include "dep_map.h"
#include "rule_io.h"
#include "state_io.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace tfx {

void cmd_infer::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("infer", "Infer dependencies from attribute references") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("state", cfg_ptr->state_path, "State document ('-' for stdin)")
      ->required();
  sub->add_option("depmaps", cfg_ptr->dep_map_paths, "Lua files defining a DEPS table")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("-o,--output", cfg_ptr->output, "Output state ('-' for stdout)");
  sub->add_flag("--permissive",
                cfg_ptr->permissive,
                "Skip rules whose source attribute is ambiguous instead of failing");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_infer::cmd_infer(cmd_infer::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_infer::execute() {
  dep_map rules;
  for (auto const &path : cfg_.dep_map_paths) { rules.add(load_dep_map(path)); }

  auto s{ read_state(cfg_.state_path) };
  auto const stats{ rules.infer(s,
                                cfg_.permissive ? ambiguous_source_policy::skip_spec
                                                : ambiguous_source_policy::abort) };
  write_state(s, cfg_.output);

  if (stats.skipped > 0) {
    tui::warn("infer: %zu rules skipped due to ambiguous sources", stats.skipped);
  }
}

}  // namespace tfx
