#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace tfx {

class cmd_transform : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_transform> {
    std::filesystem::path state_path;
    std::filesystem::path rules_path;
    std::filesystem::path output{ "-" };
    std::optional<std::filesystem::path> diff_path;
    std::optional<std::filesystem::path> diff_output;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_transform(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tfx
