#include <doctest/doctest.h>

#include "../test_helpers.hpp"
#include "gr4ft/engine/fragment.hpp"
#include "gr4ft/presets/android_dependencies.hpp"
#include "gr4ft/scripting/lua/lua_recipe_loader.hpp"
#include "gr4ft/scripting/recipe_loader.hpp"

namespace {

using gr4ft::engine::anchor_kind;
using gr4ft::engine::error_code;
using gr4ft::scripting::lua::lua_recipe_loader;
using gr4ft::test_helpers::temp_dir;
using gr4ft::test_helpers::write_text;

constexpr const char* minimal_recipe = R"(
return {
  name = "minimal",
  fragments = {
    { name = "deps", marker = "// deps", anchor = { block = "dependencies" },
      body = { "implementation 'x:core:${core}'", "implementation 'x:extra:${core}'" } },
    { name = "tail", marker = "// tail", anchor = "eof", after = { "deps" },
      required = { "force 'x:core:${core}'" },
      body = "configurations.all {\n    force 'x:core:${core}'\n}" },
  },
  versions = {
    modern = { core = "2.0.0" },
    legacy = { core = "1.0.0" },
  },
}
)";

} // namespace

TEST_CASE("lua recipe loader reads fragments and version sets") {
  lua_recipe_loader loader;
  auto loaded = loader.load(minimal_recipe, "minimal.lua");
  REQUIRE(loaded.ok());

  const auto& recipe = loaded.value;
  CHECK(recipe.name == "minimal");
  REQUIRE(recipe.fragments.size() == 2);

  const auto& deps = recipe.fragments[0];
  CHECK(deps.name == "deps");
  CHECK(deps.anchor.kind == anchor_kind::block);
  CHECK(deps.anchor.block_name == "dependencies");
  CHECK(deps.body == "implementation 'x:core:${core}'\nimplementation 'x:extra:${core}'");

  const auto& tail = recipe.fragments[1];
  CHECK(tail.anchor.kind == anchor_kind::end_of_file);
  REQUIRE(tail.after.size() == 1);
  CHECK(tail.after[0] == "deps");
  REQUIRE(tail.required.size() == 1);

  // sorted by name
  REQUIRE(recipe.version_sets.size() == 2);
  CHECK(recipe.version_sets[0].name == "legacy");
  CHECK(recipe.version_sets[1].get("core").value_or("") == "2.0.0");

  CHECK(gr4ft::engine::compile_recipe(recipe.fragments).ok());
}

TEST_CASE("lua recipe loader accepts a global recipe table") {
  lua_recipe_loader loader;
  auto loaded = loader.load(
      "recipe = { fragments = { { name = 'a', marker = '// a', anchor = 'eof', body = 'x = 1' } } }\n"
      "print('recipe assigned', 1)",
      "global.lua"
  );
  REQUIRE(loaded.ok());
  CHECK(loaded.value.name == "global.lua");
  CHECK(loaded.value.fragments.size() == 1);
  CHECK(loaded.value.version_sets.empty());
}

TEST_CASE("lua recipe loader maps errors to invalid_recipe") {
  lua_recipe_loader loader;

  SUBCASE("syntax error") {
    auto loaded = loader.load("return {", "broken.lua");
    CHECK_FALSE(loaded.ok());
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
    CHECK(loaded.status_info.message.find("broken.lua") != std::string::npos);
  }

  SUBCASE("runtime error") {
    auto loaded = loader.load("error('no recipe here')", "raise.lua");
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
  }

  SUBCASE("no table") {
    auto loaded = loader.load("return 42", "number.lua");
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
  }

  SUBCASE("missing marker") {
    auto loaded = loader.load("return { fragments = { { name = 'a', anchor = 'eof', body = 'x' } } }", "m.lua");
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
    CHECK(loaded.status_info.message.find("marker") != std::string::npos);
  }

  SUBCASE("bad anchor") {
    auto loaded = loader.load(
        "return { fragments = { { name = 'a', marker = '// a', anchor = 'top', body = 'x' } } }", "a.lua"
    );
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
  }

  SUBCASE("non-string version") {
    auto loaded = loader.load(
        "return { fragments = { { name = 'a', marker = '// a', anchor = 'eof', body = 'x' } },"
        " versions = { modern = { core = 2 } } }",
        "v.lua"
    );
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
  }

  SUBCASE("no fragments") {
    auto loaded = loader.load("return { fragments = {} }", "empty.lua");
    CHECK(loaded.status_info.code == error_code::invalid_recipe);
  }
}

TEST_CASE("lua recipe loader has no io access") {
  lua_recipe_loader loader;
  auto loaded = loader.load("local f = io.open('/etc/hostname')\nreturn {}", "io.lua");
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.status_info.code == error_code::invalid_recipe);
}

TEST_CASE("recipe files are loaded by extension") {
  temp_dir dir;

  auto missing = gr4ft::scripting::load_recipe_file(dir / "absent.lua");
  CHECK(missing.status_info.code == error_code::file_missing);

  write_text(dir / "recipe.txt", "return {}");
  auto wrong = gr4ft::scripting::load_recipe_file(dir / "recipe.txt");
  CHECK(wrong.status_info.code == error_code::invalid_recipe);

  write_text(dir / "recipe.lua", minimal_recipe);
  auto loaded = gr4ft::scripting::load_recipe_file(dir / "recipe.lua");
  REQUIRE(loaded.ok());
  CHECK(loaded.value.fragments.size() == 2);
}

TEST_CASE("sample recipe matches the built-in preset") {
  auto loaded = gr4ft::scripting::load_recipe_file(
      std::filesystem::path(GR4FT_SOURCE_DIR) / "samples" / "recipes" / "solana_android.lua"
  );
  REQUIRE(loaded.ok());

  auto preset = gr4ft::presets::solana_android_recipe();
  REQUIRE(loaded.value.fragments.size() == preset.fragments.size());

  auto from_lua = gr4ft::engine::compile_recipe(loaded.value.fragments);
  auto built_in = gr4ft::engine::compile_recipe(preset.fragments);
  REQUIRE(from_lua.ok());
  REQUIRE(built_in.ok());
  for (size_t i = 0; i < preset.fragments.size(); ++i) {
    CHECK(from_lua.value[i].spec.marker == built_in.value[i].spec.marker);
    CHECK(from_lua.value[i].body_lines == built_in.value[i].body_lines);
  }

  for (const auto& set : preset.version_sets) {
    const auto* loaded_set = loaded.value.find_version_set(set.name);
    REQUIRE(loaded_set != nullptr);
    CHECK(loaded_set->versions == set.versions);
  }
}
