#include "cmd_normalize.h"

#include "state.h"
#include "state_io.h"
#include "state_transform.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace tfx {

void cmd_normalize::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("normalize",
                                "Rename managed resources after their provider and ID") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("state", cfg_ptr->state_path, "State document ('-' for stdin)")
      ->required();
  sub->add_option("-o,--output", cfg_ptr->output, "Output state ('-' for stdout)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_normalize::cmd_normalize(cmd_normalize::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_normalize::execute() {
  auto s{ read_state(cfg_.state_path) };

  name_normalizer const normalizer;
  auto const transform{ norm_state_keys(s, normalizer) };
  if (transform.empty()) {
    tui::debug("normalize: all resource names already normalized");
  } else {
    tui::info("normalize: renaming %zu resources", transform.size());
    transform.apply(s);
  }

  write_state(s, cfg_.output);
}

}  // namespace tfx
