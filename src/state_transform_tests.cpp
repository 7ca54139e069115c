#include "state_transform.h"

#include "diff.h"
#include "errors.h"
#include "state.h"
#include "trace.h"
#include "tui.h"

#include "doctest.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace {

using keys = std::vector<std::string>;

// Resource whose type is taken from its key
void put(tfx::module_state &m, std::string const &key, keys deps = {}) {
  tfx::resource_record r;
  r.type = tfx::parse_state_key(key).type;
  r.id = key;
  r.dependencies = std::move(deps);
  m.insert(key, std::move(r));
}

keys deps_of(tfx::state const &s, std::string_view key, tfx::module_path const &path = {}) {
  auto const *m{ s.module_by_path(path) };
  REQUIRE(m != nullptr);
  auto const *r{ m->find(key) };
  REQUIRE(r != nullptr);
  return r->dependencies;
}

keys keys_of(tfx::state const &s, tfx::module_path const &path = {}) {
  keys out;
  if (auto const *m{ s.module_by_path(path) }) {
    for (auto const &[k, _] : m->resources) { out.push_back(k); }
  }
  return out;
}

void check_no_dangling_edges(tfx::state const &s) {
  for (auto const &m : s.modules) {
    for (auto const &[key, r] : m.resources) {
      for (auto const &dep : r.dependencies) {
        CAPTURE(key);
        CAPTURE(dep);
        CHECK(m.find(dep) != nullptr);
        CHECK(dep != key);
      }
      CHECK(std::is_sorted(r.dependencies.begin(), r.dependencies.end()));
    }
  }
}

tfx::state rename_graph() {
  auto s{ tfx::make_state() };
  auto &root{ s.root_module() };
  put(root, "x.x");
  put(root, "y.y", { "x.x" });
  put(root, "z.z", { "x.x", "y.y" });
  return s;
}

}  // namespace

TEST_CASE("rename rewires dependents") {
  auto s{ rename_graph() };
  tfx::state_transform const t{ { "x.x", "w.w" } };
  t.apply(s);

  CHECK(keys_of(s) == keys{ "w.w", "y.y", "z.z" });
  CHECK(deps_of(s, "w.w").empty());
  CHECK(deps_of(s, "y.y") == keys{ "w.w" });
  CHECK(deps_of(s, "z.z") == keys{ "w.w", "y.y" });
  CHECK(s.root_module().find("w.w")->id == "x.x");
  check_no_dangling_edges(s);
}

TEST_CASE("deletion removes dependents' edges") {
  auto s{ rename_graph() };
  tfx::state_transform{ { "x.x", "w.w" } }.apply(s);
  tfx::state_transform{ { "y.y", "" } }.apply(s);

  CHECK(keys_of(s) == keys{ "w.w", "z.z" });
  CHECK(deps_of(s, "z.z") == keys{ "w.w" });
  check_no_dangling_edges(s);
}

TEST_CASE("collision between explicit mappings is rejected and state unchanged") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a");
  put(s.root_module(), "b.b", { "a.a" });
  auto const before{ s };

  tfx::state_transform const t{ { "a.a", "c.c" }, { "b.b", "c.c" } };
  CHECK_THROWS_AS(t.apply(s), tfx::address_collision_error);
  CHECK(s == before);
}

TEST_CASE("two spellings of one source are a collision") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a");
  auto const before{ s };

  tfx::state_transform const t{ { "a.a", "x.x" }, { "module.root.a.a", "y.y" } };
  CHECK_THROWS_AS(t.apply(s), tfx::address_collision_error);
  CHECK(s == before);
}

TEST_CASE("malformed addresses abort before mutation") {
  auto s{ rename_graph() };
  auto const before{ s };

  CHECK_THROWS_AS(tfx::state_transform({ { "x.x", "w.w" }, { "a..b", "c.c" } }).apply(s),
                  tfx::address_parse_error);
  CHECK(s == before);

  CHECK_THROWS_AS(tfx::state_transform({ { "x.x", "w.w" }, { "y.y", "z[" } }).apply(s),
                  tfx::address_parse_error);
  CHECK(s == before);

  CHECK_THROWS_AS(tfx::state_transform({ { "x.x", "module.net" } }).apply(s),
                  tfx::incomplete_address_error);
  CHECK(s == before);
}

TEST_CASE("malformed state keys abort before mutation") {
  auto s{ rename_graph() };
  tfx::resource_record bad;
  bad.type = "broken";
  s.root_module().resources.emplace("broken", bad);
  auto const before{ s };

  CHECK_THROWS_AS(tfx::state_transform({ { "x.x", "w.w" } }).apply(s), tfx::key_parse_error);
  CHECK(s == before);
}

TEST_CASE("swap, replace and delete in one transform") {
  auto s{ tfx::make_state() };
  auto &root{ s.root_module() };
  put(root, "a.a", { "b.b", "d.d" });
  put(root, "b.b", { "e.e" });
  put(root, "c.c", { "a.a" });
  put(root, "d.d");
  put(root, "e.e", { "c.c" });

  tfx::state_transform const t{
    { "module.root.a.a", "b.b" },
    { "b.b", "module.root.a.a" },
    { "c.c", "e.e" },
    { "d.d", "" },
  };
  t.apply(s);

  CHECK(keys_of(s) == keys{ "a.a", "b.b", "e.e" });
  CHECK(s.root_module().find("a.a")->id == "b.b");
  CHECK(s.root_module().find("b.b")->id == "a.a");
  CHECK(s.root_module().find("e.e")->id == "c.c");

  CHECK(deps_of(s, "b.b") == keys{ "a.a" });
  CHECK(deps_of(s, "a.a") == keys{ "e.e" });
  CHECK(deps_of(s, "e.e") == keys{ "b.b" });
  check_no_dangling_edges(s);
}

TEST_CASE("replacement redirects dependents of the replaced resource") {
  auto s{ tfx::make_state() };
  auto &root{ s.root_module() };
  put(root, "x.x");
  put(root, "y.y");
  put(root, "z.z", { "y.y" });

  tfx::state_transform{ { "x.x", "y.y" } }.apply(s);

  CHECK(keys_of(s) == keys{ "y.y", "z.z" });
  CHECK(s.root_module().find("y.y")->id == "x.x");
  CHECK(deps_of(s, "z.z") == keys{ "y.y" });
}

TEST_CASE("chained moves resolve through one level of replacement") {
  auto s{ tfx::make_state() };
  auto &root{ s.root_module() };
  put(root, "a.a");
  put(root, "b.b");
  put(root, "c.c");
  put(root, "d.d", { "a.a", "b.b", "c.c" });

  tfx::state_transform{ { "a.a", "b.b" }, { "b.b", "c.c" } }.apply(s);

  CHECK(keys_of(s) == keys{ "b.b", "c.c", "d.d" });
  CHECK(s.root_module().find("b.b")->id == "a.a");
  CHECK(s.root_module().find("c.c")->id == "b.b");
  CHECK(deps_of(s, "d.d") == keys{ "b.b", "c.c" });
  check_no_dangling_edges(s);
}

TEST_CASE("dependency lists are sorted and deduplicated without self or dangling edges") {
  auto s{ tfx::make_state() };
  auto &root{ s.root_module() };
  put(root, "a.a", { "c.c", "b.b", "b.b", "a.a", "ghost.g" });
  put(root, "b.b");
  put(root, "c.c");

  tfx::state_transform{}.apply(s);
  CHECK(deps_of(s, "a.a") == keys{ "b.b", "c.c" });

  // Two dependencies collapse onto one resource
  tfx::state_transform{ { "c.c", "b.b" } }.apply(s);
  CHECK(keys_of(s) == keys{ "a.a", "b.b" });
  CHECK(deps_of(s, "a.a") == keys{ "b.b" });
}

TEST_CASE("moves across modules keep edges module-local") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a", { "b.b" });
  put(s.root_module(), "b.b");
  put(s.root_module(), "c.c", { "a.a" });

  tfx::state_transform{ { "b.b", "module.net.b.b" }, { "c.c", "module.net.c.c" } }.apply(s);

  CHECK(keys_of(s) == keys{ "a.a" });
  CHECK(keys_of(s, { "root", "net" }) == keys{ "b.b", "c.c" });
  CHECK(deps_of(s, "a.a").empty());
  CHECK(deps_of(s, "c.c", { "root", "net" }).empty());
  check_no_dangling_edges(s);
}

TEST_CASE("counted, data and nested-module addresses") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "x.y.0");
  put(s.root_module(), "data.d.src");
  put(s.add_module({ "root", "a", "b" }), "m.n.3");

  tfx::state_transform const t{
    { "x.y[0]", "x.z" },
    { "data.d.src", "data.d.dst" },
    { "module.a.module.b.m.n[3]", "m.n[4]" },
  };
  t.apply(s);

  CHECK(keys_of(s) == keys{ "data.d.dst", "m.n.4", "x.z" });
  CHECK(s.module_by_path({ "root", "a", "b" }) == nullptr);
}

TEST_CASE("modules that were already empty are kept") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a");
  s.add_module({ "root", "idle" });
  put(s.add_module({ "root", "net" }), "b.b");

  tfx::state_transform{ { "module.net.b.b", "b.b" } }.apply(s);

  CHECK(keys_of(s) == keys{ "a.a", "b.b" });
  CHECK(s.module_by_path({ "root", "idle" }) != nullptr);
  CHECK(s.module_by_path({ "root", "net" }) == nullptr);
}

TEST_CASE("unknown sources are ignored") {
  auto s{ rename_graph() };
  auto const before{ s };
  tfx::state_transform{ { "missing.m", "other.o" }, { "module.net.x.x", "" } }.apply(s);
  CHECK(s == before);
}

TEST_CASE("identity transform is a no-op") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a", { "b.b" });
  put(s.root_module(), "b.b");
  put(s.add_module({ "root", "m" }), "c.c.1", { "d.d" });
  put(s.add_module({ "root", "m" }), "d.d");
  auto const before{ s };

  tfx::state_transform t;
  for (auto const &m : s.modules) {
    for (auto const &[key, _] : m.resources) {
      t.set(tfx::to_address(m.path, key), tfx::to_address(m.path, key));
    }
  }
  t.apply(s);
  CHECK(s == before);

  tfx::state_transform{}.apply(s);
  CHECK(s == before);
}

TEST_CASE("applying a transform and then its inverse restores the state") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a", { "b.b", "c.c" });
  put(s.root_module(), "b.b");
  put(s.root_module(), "c.c", { "b.b" });
  put(s.root_module(), "lonely.l");
  auto const before{ s };

  tfx::state_transform const t{
    { "a.a", "b.b" },
    { "b.b", "q.q" },
    { "lonely.l", "module.far.lonely.l" },
  };
  auto const inverse{ t.inverse() };
  REQUIRE(inverse.has_value());

  t.apply(s);
  CHECK(deps_of(s, "b.b") == keys{ "c.c", "q.q" });
  inverse->apply(s);

  CHECK(s == before);
}

TEST_CASE("a round trip through another module loses the edges it cut") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a", { "b.b" });
  put(s.root_module(), "b.b");
  auto const before{ s };

  tfx::state_transform const t{ { "b.b", "module.far.b.b" } };
  t.apply(s);
  REQUIRE(s.modules.size() == 2);
  t.inverse()->apply(s);

  CHECK(s.modules.size() == before.modules.size());
  CHECK(keys_of(s) == keys{ "a.a", "b.b" });
  CHECK(deps_of(s, "a.a").empty());
  CHECK_FALSE(s == before);
}

TEST_CASE("inverse") {
  SUBCASE("reverses injective mappings") {
    auto const inv{ tfx::state_transform{ { "a.a", "module.root.b.b" } }.inverse() };
    REQUIRE(inv.has_value());
    CHECK(*inv == tfx::state_transform{ { "b.b", "a.a" } });
  }

  SUBCASE("deletions have no inverse") {
    CHECK_FALSE(tfx::state_transform{ { "a.a", "" } }.inverse().has_value());
  }

  SUBCASE("shared destinations have no inverse") {
    tfx::state_transform const t{ { "a.a", "c.c" }, { "b.b", "c.c" } };
    CHECK_FALSE(t.inverse().has_value());
  }

  SUBCASE("the empty transform is its own inverse") {
    auto const inv{ tfx::state_transform{}.inverse() };
    REQUIRE(inv.has_value());
    CHECK(inv->empty());
  }
}

TEST_CASE("apply_to_diff remaps entries without rewiring") {
  tfx::diff d;
  auto &root{ d.add_module({ "root" }) };
  root.resources["a.a"].attributes["x"] = tfx::attr_diff{ .old_value = "1", .new_value = "2" };
  root.resources["b.b"].destroy = true;
  root.resources["c.c"].attributes["y"] = tfx::attr_diff{ .old_value = "", .new_value = "3" };
  root.resources["d.d"].destroy = true;

  tfx::state_transform const t{
    { "a.a", "module.net.a.a" },
    { "b.b", "" },
    { "c.c", "d.d" },
  };
  t.apply_to_diff(d);

  auto const *r{ d.module_by_path({ "root" }) };
  REQUIRE(r != nullptr);
  REQUIRE(r->resources.size() == 1);
  CHECK(r->resources.at("d.d").attributes.at("y").new_value == "3");
  CHECK_FALSE(r->resources.at("d.d").destroy);

  auto const *net{ d.module_by_path({ "root", "net" }) };
  REQUIRE(net != nullptr);
  CHECK(net->resources.at("a.a").attributes.at("x").new_value == "2");
}

TEST_CASE("apply_to_diff rejects collisions without mutation") {
  tfx::diff d;
  d.add_module({ "root" }).resources["a.a"].destroy = true;
  d.add_module({ "root" }).resources["b.b"].destroy = true;
  auto const before{ d };

  CHECK_THROWS_AS(tfx::state_transform({ { "a.a", "c.c" }, { "b.b", "c.c" } }).apply_to_diff(d),
                  tfx::address_collision_error);
  CHECK(d == before);
}

namespace {

struct traced_output {
  std::vector<std::string> messages;

  traced_output() {
    tfx::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
    tfx::tui::configure_trace_outputs(
        { { tfx::tui::trace_output_type::std_err, std::nullopt } });
  }

  ~traced_output() {
    tfx::tui::configure_trace_outputs({});
    tfx::tui::set_output_handler([](std::string_view) {});
  }

  bool saw(std::string_view needle) const {
    return std::any_of(messages.begin(), messages.end(), [&](std::string const &m) {
      return m.find(needle) != std::string::npos;
    });
  }
};

}  // namespace

TEST_CASE_FIXTURE(traced_output, "apply emits trace events") {
  auto s{ tfx::make_state() };
  put(s.root_module(), "a.a", { "ghost.g" });
  put(s.root_module(), "b.b");
  put(s.root_module(), "c.c", { "a.a" });

  CHECK_NOTHROW(tfx::tui::run(tfx::tui::level::TUI_TRACE, false));
  tfx::state_transform{ { "a.a", "b.b" }, { "c.c", "" } }.apply(s);
  CHECK_NOTHROW(tfx::tui::shutdown());

  CHECK(saw("transform_indexed resources=3 modules=1"));
  CHECK(saw("resource_moved from=a.a to=b.b"));
  CHECK(saw("resource_deleted address=c.c"));
  CHECK(saw("resource_superseded address=b.b by=a.a"));
  CHECK(saw("dependency_dropped resource=a.a dependency=ghost.g reason=dangling"));
  CHECK(saw("transform_applied moved=1 deleted=1 superseded=1"));
}
