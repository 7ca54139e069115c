#include "state.h"
#include "state_transform.h"

#include "doctest.h"

#include <stdexcept>
#include <string>

namespace {

tfx::resource_record record(std::string type, std::string id = {}) {
  tfx::resource_record r;
  r.provider = type.substr(0, type.find('_'));
  r.type = std::move(type);
  r.id = std::move(id);
  return r;
}

}  // namespace

TEST_CASE("make_state has only an empty root module") {
  auto const s{ tfx::make_state() };
  REQUIRE(s.modules.size() == 1);
  CHECK(s.modules[0].path == tfx::root_module_path());
  CHECK(s.modules[0].empty());
  CHECK(s.version == tfx::state::kVersion);
  CHECK(s.lineage == tfx::state::kZeroLineage);
  CHECK(s.resource_count() == 0);
}

TEST_CASE("add_module keeps modules ordered and is idempotent") {
  auto s{ tfx::make_state() };
  s.add_module({ "root", "b" });
  s.add_module({ "root", "a" });
  s.add_module({ "root", "a", "c" });
  auto &again{ s.add_module({ "root", "a" }) };
  again.insert("x.y", record("x"));

  REQUIRE(s.modules.size() == 4);
  CHECK(s.modules[0].path == tfx::module_path{ "root" });
  CHECK(s.modules[1].path == tfx::module_path{ "root", "a" });
  CHECK(s.modules[2].path == tfx::module_path{ "root", "a", "c" });
  CHECK(s.modules[3].path == tfx::module_path{ "root", "b" });
  CHECK(s.module_by_path({ "root", "a" })->find("x.y") != nullptr);
  CHECK(s.module_by_path({ "root", "z" }) == nullptr);
  CHECK(&s.root_module() == s.module_by_path({}));
}

TEST_CASE("module_state insert does not overwrite") {
  tfx::module_state m{ .path = { "root" }, .resources = {} };
  CHECK(m.insert("a.a", record("a", "1")));
  CHECK_FALSE(m.insert("a.a", record("a", "2")));
  CHECK(m.find("a.a")->id == "1");
  CHECK(m.remove("a.a"));
  CHECK_FALSE(m.remove("a.a"));
}

TEST_CASE("state copies are deep") {
  auto a{ tfx::make_state() };
  a.root_module().insert("a.a", record("a"));
  auto b{ a };
  b.root_module().find("a.a")->dependencies.push_back("b.b");
  CHECK_FALSE(a == b);
  CHECK(a.root_module().find("a.a")->dependencies.empty());
}

TEST_CASE("add_state keeps existing resources") {
  auto a{ tfx::make_state() };
  a.root_module().insert("x.one", record("x", "a-side"));

  auto b{ tfx::make_state() };
  b.root_module().insert("x.one", record("x", "b-side"));
  b.root_module().insert("x.two", record("x", "b-side"));
  b.add_module({ "root", "m" }).insert("y.three", record("y"));

  tfx::add_state(a, b);
  CHECK(a.resource_count() == 3);
  CHECK(a.root_module().find("x.one")->id == "a-side");
  CHECK(a.root_module().find("x.two")->id == "b-side");
  CHECK(a.module_by_path({ "root", "m" })->find("y.three") != nullptr);
}

TEST_CASE("sub_state removes by key") {
  auto a{ tfx::make_state() };
  a.root_module().insert("x.one", record("x"));
  a.root_module().insert("x.two", record("x"));
  a.add_module({ "root", "m" }).insert("x.one", record("x"));

  auto b{ tfx::make_state() };
  b.root_module().insert("x.one", record("x", "different"));
  b.add_module({ "root", "other" }).insert("x.two", record("x"));

  tfx::sub_state(a, b);
  CHECK(a.root_module().find("x.one") == nullptr);
  CHECK(a.root_module().find("x.two") != nullptr);
  CHECK(a.module_by_path({ "root", "m" })->find("x.one") != nullptr);
}

TEST_CASE("clear_deps empties every dependency list") {
  auto s{ tfx::make_state() };
  auto r{ record("x") };
  r.dependencies = { "x.b" };
  s.root_module().insert("x.a", r);
  s.add_module({ "root", "m" }).insert("x.a", r);

  tfx::clear_deps(s);
  CHECK(s.root_module().find("x.a")->dependencies.empty());
  CHECK(s.module_by_path({ "root", "m" })->find("x.a")->dependencies.empty());
}

TEST_CASE("name_normalizer rewrites invalid characters") {
  tfx::name_normalizer const n;
  CHECK(n.make_name("_") == "_");
  CHECK(n.make_name("--") == "_-");
  CHECK(n.make_name("-_-") == "_-");
  CHECK(n.make_name("_--") == "_--");
  CHECK(n.make_name("_/a/b-1//2.3$") == "_a_b-1_2_3_");
  CHECK(n.make_name("aws_i-0abc") == "aws_i-0abc");
  CHECK_THROWS_AS(n.make_name(""), std::invalid_argument);
}

TEST_CASE("norm_state_keys renames managed resources and round-trips") {
  auto s{ tfx::make_state() };
  s.root_module().insert("aws_instance.web", record("aws_instance", "i-1"));
  s.root_module().insert("aws_instance.aws_i-2", record("aws_instance", "i-2"));
  s.root_module().insert("data.aws_ami.img", record("aws_ami", "ami-1"));
  auto dependent{ record("aws_eip", "e/1") };
  dependent.dependencies = { "aws_instance.web" };
  s.add_module({ "root", "net" }).insert("aws_eip.ip", dependent);

  tfx::name_normalizer const normalizer;
  auto const t{ tfx::norm_state_keys(s, normalizer) };
  CHECK(t.entries() == tfx::state_transform::map_t{
                           { "aws_instance.web", "aws_instance.aws_i-1" },
                           { "module.net.aws_eip.ip", "module.net.aws_eip.aws_e_1" },
                       });

  auto normalized{ s };
  t.apply(normalized);
  CHECK(normalized.root_module().find("aws_instance.aws_i-1") != nullptr);
  CHECK(normalized.root_module().find("data.aws_ami.img") != nullptr);
  CHECK(tfx::norm_state_keys(normalized, normalizer).empty());

  auto const inverse{ t.inverse() };
  REQUIRE(inverse.has_value());
  inverse->apply(normalized);
  CHECK(normalized.root_module().find("aws_instance.web") != nullptr);
  CHECK(normalized.module_by_path({ "root", "net" })->find("aws_eip.ip") != nullptr);
}
