#include "cmd_clear_deps.h"

#include "state.h"
#include "state_io.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace tfx {

void cmd_clear_deps::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("clear-deps", "Remove every dependency edge") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("state", cfg_ptr->state_path, "State document ('-' for stdin)")
      ->required();
  sub->add_option("-o,--output", cfg_ptr->output, "Output state ('-' for stdout)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_clear_deps::cmd_clear_deps(cmd_clear_deps::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_clear_deps::execute() {
  auto s{ read_state(cfg_.state_path) };
  clear_deps(s);
  write_state(s, cfg_.output);
}

}  // namespace tfx
