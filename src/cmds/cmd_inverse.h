#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace tfx {

class cmd_inverse : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_inverse> {
    std::filesystem::path rules_path;
    std::filesystem::path output{ "-" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_inverse(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tfx
