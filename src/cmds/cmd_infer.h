#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <vector>

namespace CLI { class App; }

namespace tfx {

class cmd_infer : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_infer> {
    std::filesystem::path state_path;
    std::vector<std::filesystem::path> dep_map_paths;
    std::filesystem::path output{ "-" };
    bool permissive{ false };  // skip ambiguous rules instead of failing
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_infer(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tfx
