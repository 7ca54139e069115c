#include "cmd_inverse.h"

#include "rule_io.h"
#include "state_io.h"
#include "state_transform.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace tfx {

void cmd_inverse::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("inverse", "Print the reverse of a transform as JSON") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("rules", cfg_ptr->rules_path, "Transform file (Lua TRANSFORM table or JSON)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("-o,--output", cfg_ptr->output, "Output file ('-' for stdout)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_inverse::cmd_inverse(cmd_inverse::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_inverse::execute() {
  auto const inverse{ load_transform(cfg_.rules_path).inverse() };
  if (!inverse) { throw std::runtime_error("transform has no inverse"); }
  write_document(transform_to_json(*inverse), cfg_.output);
}

}  // namespace tfx
