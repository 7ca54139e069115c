#include "cmd.h"
#include "cmds/cmd_clear_deps.h"
#include "cmds/cmd_infer.h"
#include "cmds/cmd_inverse.h"
#include "cmds/cmd_merge.h"
#include "cmds/cmd_normalize.h"
#include "cmds/cmd_transform.h"
#include "errors.h"
#include "state_io.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace {

class test_cmd : public tfx::cmd {
 public:
  struct cfg : tfx::cmd_cfg<test_cmd> {};
  explicit test_cmd(cfg) {}
  void execute() override {}
};

struct cmd_workspace {
  std::filesystem::path dir{ std::filesystem::temp_directory_path() / "tfx_cmd_tests" };

  cmd_workspace() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
  }

  ~cmd_workspace() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  std::filesystem::path write(char const *name, std::string_view contents) const {
    auto path{ dir / name };
    tfx::util_write_file(path, contents);
    return path;
  }

  std::filesystem::path out(char const *name) const { return dir / name; }
};

char const *const kGraph{ R"({
  "modules": [{
    "path": ["root"],
    "resources": {
      "gadget.x": {
        "type": "gadget", "provider": "gadget",
        "primary": { "id": "g1", "attributes": { "id": "g1" } }
      },
      "widget.y": {
        "type": "widget", "provider": "widget",
        "depends_on": ["gadget.x"],
        "primary": { "id": "w1", "attributes": { "ref": "g1" } }
      },
      "widget.z": {
        "type": "widget", "provider": "widget",
        "depends_on": ["gadget.x", "widget.y"],
        "primary": { "id": "w2", "attributes": { "ref": "g1" } }
      }
    }
  }]
})" };

std::vector<std::string> deps_of(tfx::state const &s, char const *key) {
  return s.root_module()->find(key)->dependencies;
}

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  using config_type = test_cmd::cfg;
  using expected_command = test_cmd;
  using actual_command = config_type::cmd_t;
  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  auto cmd{ tfx::cmd::create(cfg) };
  REQUIRE(cmd);
  CHECK(dynamic_cast<test_cmd *>(cmd.get()));
}

TEST_CASE_FIXTURE(cmd_workspace, "cmd_transform rewrites state and diff") {
  tfx::cmd_transform::cfg cfg;
  cfg.state_path = write("state.json", kGraph);
  cfg.rules_path = write("moves.lua", R"(TRANSFORM = { ["gadget.x"] = "gadget.w" })");
  cfg.output = out("state.out.json");
  cfg.diff_path = write("diff.json", R"({"modules":[
    {"path":["root"],"resources":{"gadget.x":{"destroy":true}}},
    {"path":["root","empty"],"resources":{}}
  ]})");
  cfg.diff_output = out("diff.out.json");

  tfx::cmd::create(cfg)->execute();

  auto const s{ tfx::read_state(cfg.output) };
  CHECK(s.root_module()->find("gadget.x") == nullptr);
  CHECK(deps_of(s, "widget.y") == std::vector<std::string>{ "gadget.w" });
  CHECK(deps_of(s, "widget.z") == std::vector<std::string>{ "gadget.w", "widget.y" });

  auto const d{ tfx::read_diff(*cfg.diff_output) };
  REQUIRE(d.modules.size() == 1);
  CHECK(d.modules[0].resources.contains("gadget.w"));
}

TEST_CASE_FIXTURE(cmd_workspace, "cmd_transform leaves no output on collision") {
  tfx::cmd_transform::cfg cfg;
  cfg.state_path = write("state.json", kGraph);
  cfg.rules_path = write("moves.json", R"({"widget.y":"widget.q","widget.z":"widget.q"})");
  cfg.output = out("state.out.json");

  CHECK_THROWS_AS(tfx::cmd::create(cfg)->execute(), tfx::address_collision_error);
  CHECK_FALSE(std::filesystem::exists(cfg.output));
}

TEST_CASE_FIXTURE(cmd_workspace, "cmd_infer merges dep maps and infers edges") {
  tfx::cmd_clear_deps::cfg clear;
  clear.state_path = write("state.json", kGraph);
  clear.output = out("cleared.json");
  tfx::cmd::create(clear)->execute();
  CHECK(deps_of(tfx::read_state(clear.output), "widget.z").empty());

  tfx::cmd_infer::cfg cfg;
  cfg.state_path = clear.output;
  cfg.dep_map_paths = {
    write("widget.lua", "DEPS = { widget = { { attr = 'ref', src_type = 'gadget', src_attr = 'id' } } }"),
    write("other.lua", "DEPS = { bolt = { { attr = 'nut', src_type = 'nut', src_attr = 'id' } } }"),
  };
  cfg.output = out("inferred.json");
  tfx::cmd::create(cfg)->execute();

  auto const s{ tfx::read_state(cfg.output) };
  CHECK(deps_of(s, "widget.y") == std::vector<std::string>{ "gadget.x" });
  CHECK(deps_of(s, "widget.z") == std::vector<std::string>{ "gadget.x" });

  cfg.dep_map_paths.push_back(cfg.dep_map_paths.front());
  CHECK_THROWS_AS(tfx::cmd::create(cfg)->execute(), tfx::rule_table_error);
}

TEST_CASE_FIXTURE(cmd_workspace, "cmd_normalize renames to provider and id") {
  tfx::cmd_normalize::cfg cfg;
  cfg.state_path = write("state.json", kGraph);
  cfg.output = out("normalized.json");
  tfx::cmd::create(cfg)->execute();

  auto const s{ tfx::read_state(cfg.output) };
  CHECK(s.root_module()->find("gadget.gadget_g1") != nullptr);
  CHECK(deps_of(s, "widget.widget_w2") ==
        std::vector<std::string>{ "gadget.gadget_g1", "widget.widget_w1" });
}

TEST_CASE_FIXTURE(cmd_workspace, "cmd_merge adds and subtracts states") {
  auto const base{ write("base.json", kGraph) };
  auto const extra{ write("extra.json", R"({"modules":[
    {"path":["root"],"resources":{"widget.y":{"type":"widget"},"bolt.b":{"type":"bolt"}}}
  ]})") };

  tfx::cmd_merge::cfg cfg;
  cfg.lhs_path = base;
  cfg.rhs_path = extra;
  cfg.output = out("merged.json");
  tfx::cmd::create(cfg)->execute();
  auto const merged{ tfx::read_state(cfg.output) };
  CHECK(merged.resource_count() == 4);
  CHECK(merged.root_module()->find("widget.y")->id == "w1");

  cfg.operation = tfx::cmd_merge::op::subtract;
  cfg.output = out("subtracted.json");
  tfx::cmd::create(cfg)->execute();
  auto const subtracted{ tfx::read_state(cfg.output) };
  CHECK(subtracted.resource_count() == 2);
  CHECK(subtracted.root_module()->find("widget.y") == nullptr);
}

TEST_CASE_FIXTURE(cmd_workspace, "cmd_inverse writes the reverse mapping") {
  tfx::cmd_inverse::cfg cfg;
  cfg.rules_path = write("moves.json", R"({"a.a":"b.b"})");
  cfg.output = out("inverse.json");
  tfx::cmd::create(cfg)->execute();
  CHECK(tfx::parse_document(tfx::read_document_text(cfg.output), "inverse") ==
        nlohmann::json::parse(R"({"b.b":"a.a"})"));

  cfg.rules_path = write("deletes.json", R"({"a.a":""})");
  CHECK_THROWS_WITH_AS(tfx::cmd::create(cfg)->execute(),
                       "transform has no inverse",
                       std::runtime_error);
}
