#pragma once

#include "cmds/cmd_clear_deps.h"
#include "cmds/cmd_explain.h"
#include "cmds/cmd_infer.h"
#include "cmds/cmd_inverse.h"
#include "cmds/cmd_merge.h"
#include "cmds/cmd_normalize.h"
#include "cmds/cmd_transform.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tfx {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_clear_deps::cfg,
                                 cmd_explain::cfg,
                                 cmd_infer::cfg,
                                 cmd_inverse::cfg,
                                 cmd_merge::cfg,
                                 cmd_normalize::cfg,
                                 cmd_transform::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;  // help text or parse error
};

cli_args cli_parse(int argc, char **argv);

}  // namespace tfx
