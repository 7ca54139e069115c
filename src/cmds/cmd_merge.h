#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace tfx {

// merge: a += b, subtract: a -= b
class cmd_merge : public cmd {
 public:
  enum class op { add, subtract };

  struct cfg : cmd_cfg<cmd_merge> {
    op operation{ op::add };
    std::filesystem::path lhs_path;
    std::filesystem::path rhs_path;
    std::filesystem::path output{ "-" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_merge(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace tfx
