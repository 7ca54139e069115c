#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace tfx {

class cmd_clear_deps : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_clear_deps> {
    std::filesystem::path state_path;
    std::filesystem::path output{ "-" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_clear_deps(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tfx
