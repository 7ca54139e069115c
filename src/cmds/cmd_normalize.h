#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace tfx {

class cmd_normalize : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_normalize> {
    std::filesystem::path state_path;
    std::filesystem::path output{ "-" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_normalize(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tfx
