#include <doctest/doctest.h>

#include "../test_helpers.hpp"
#include "gr4ft/host/unity_project.hpp"
#include "gr4ft/presets/android_dependencies.hpp"

namespace {

using gr4ft::host::toolchain_generation;
using gr4ft::test_helpers::temp_dir;
using gr4ft::test_helpers::write_text;

void write_project_version(const temp_dir& project, const std::string& version) {
  write_text(
      project / "ProjectSettings/ProjectVersion.txt",
      "m_EditorVersion: " + version + "\nm_EditorVersionWithRevision: " + version + " (0123456789ab)\n"
  );
}

} // namespace

TEST_CASE("unity project template path") {
  auto path = gr4ft::host::gradle_template_path("/work/game");
  CHECK(path == std::filesystem::path("/work/game/Assets/Plugins/Android/mainTemplate.gradle"));
}

TEST_CASE("unity setup instructions name the template option") {
  auto text = gr4ft::host::setup_instructions();
  CHECK(text.find("Custom Main Gradle Template") != std::string::npos);
  CHECK(text.find("Publishing Settings") != std::string::npos);
}

TEST_CASE("unity editor versions map to toolchain generations") {
  using gr4ft::host::toolchain_for_editor_version;
  CHECK(toolchain_for_editor_version("2022.3.10f1") == toolchain_generation::modern);
  CHECK(toolchain_for_editor_version("2022.2.0f1") == toolchain_generation::modern);
  CHECK(toolchain_for_editor_version("2023.1.0a5") == toolchain_generation::modern);
  CHECK(toolchain_for_editor_version("6000.0.23f1") == toolchain_generation::modern);
  CHECK(toolchain_for_editor_version("2022.1.24f1") == toolchain_generation::legacy);
  CHECK(toolchain_for_editor_version("2021.3.0f1") == toolchain_generation::legacy);
  CHECK_FALSE(toolchain_for_editor_version("unknown").has_value());
  CHECK_FALSE(toolchain_for_editor_version(".3").has_value());
}

TEST_CASE("unity toolchain detection reads the project version") {
  temp_dir project;

  SUBCASE("legacy editor") {
    write_project_version(project, "2021.3.45f1");
    auto version = gr4ft::host::read_editor_version(project.path());
    REQUIRE(version.has_value());
    CHECK(*version == "2021.3.45f1");
    CHECK(gr4ft::host::detect_toolchain(project.path()) == toolchain_generation::legacy);
  }

  SUBCASE("missing file defaults to modern") {
    CHECK_FALSE(gr4ft::host::read_editor_version(project.path()).has_value());
    CHECK(gr4ft::host::detect_toolchain(project.path()) == toolchain_generation::modern);
  }

  SUBCASE("unparseable version defaults to modern") {
    write_project_version(project, "nightly");
    CHECK(gr4ft::host::detect_toolchain(project.path()) == toolchain_generation::modern);
  }
}

TEST_CASE("unity build target gate") {
  CHECK(gr4ft::host::is_android_target("android"));
  CHECK(gr4ft::host::is_android_target(" Android "));
  CHECK_FALSE(gr4ft::host::is_android_target("ios"));
  CHECK_FALSE(gr4ft::host::is_android_target(""));
}

TEST_CASE("unity backups live in the project library") {
  auto directory = gr4ft::host::default_backup_directory(std::filesystem::path("/work/game"));
  CHECK(directory == std::filesystem::path("/work/game/Library/gr4ft/backups"));
  CHECK_FALSE(gr4ft::host::default_backup_directory(std::nullopt).empty());
}

TEST_CASE("unity version set resolution") {
  auto recipe = gr4ft::presets::solana_android_recipe();
  gr4ft::core::runtime_config config;

  SUBCASE("explicit name wins") {
    config.version_set = "legacy";
    config.toolchain = gr4ft::core::toolchain_selection::modern;
    auto set = gr4ft::host::resolve_version_set(recipe, config, std::nullopt);
    REQUIRE(set.ok());
    CHECK(set.value.name == "legacy");
  }

  SUBCASE("toolchain selection") {
    config.toolchain = gr4ft::core::toolchain_selection::legacy;
    auto set = gr4ft::host::resolve_version_set(recipe, config, std::nullopt);
    REQUIRE(set.ok());
    CHECK(set.value.get("browser").value_or("") == "1.4.0");
  }

  SUBCASE("auto detection from the project") {
    temp_dir project;
    write_project_version(project, "2022.1.0f1");
    auto set = gr4ft::host::resolve_version_set(recipe, config, project.path());
    REQUIRE(set.ok());
    CHECK(set.value.name == "legacy");
  }

  SUBCASE("unknown name") {
    config.version_set = "future";
    auto set = gr4ft::host::resolve_version_set(recipe, config, std::nullopt);
    CHECK_FALSE(set.ok());
    CHECK(set.status_info.code == gr4ft::engine::error_code::invalid_recipe);
  }

  SUBCASE("single set recipes apply to any toolchain") {
    recipe.version_sets = {gr4ft::engine::version_set{"pinned", {{"browser", "1.0.0"}}}};
    config.toolchain = gr4ft::core::toolchain_selection::legacy;
    auto set = gr4ft::host::resolve_version_set(recipe, config, std::nullopt);
    REQUIRE(set.ok());
    CHECK(set.value.name == "pinned");
  }
}
