#include "unity_project.hpp"

#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"
#include <cstdlib>
#include <redlog.hpp>

namespace gr4ft::host {

std::filesystem::path gradle_template_path(const std::filesystem::path& project_root) {
  return project_root / gradle_template_relative_path;
}

std::string setup_instructions() {
  return "android build setup required:\n"
         "  1. open Edit -> Project Settings -> Player -> Android -> Publishing Settings\n"
         "  2. enable 'Custom Main Gradle Template'\n"
         "  3. build again or run `gr4ftx fix` to add the required dependencies";
}

const char* toolchain_generation_name(toolchain_generation generation) {
  switch (generation) {
  case toolchain_generation::modern:
    return "modern";
  case toolchain_generation::legacy:
    return "legacy";
  }
  return "unknown";
}

std::optional<std::string> read_editor_version(const std::filesystem::path& project_root) {
  auto content = utils::read_file_string(project_root / project_version_relative_path);
  if (!content) {
    return std::nullopt;
  }

  const std::string key = "m_EditorVersion:";
  for (const auto& line : utils::split_lines(*content)) {
    auto trimmed = utils::trim_view(line);
    if (trimmed.substr(0, key.size()) == key) {
      std::string version = utils::trim_copy(trimmed.substr(key.size()));
      if (!version.empty()) {
        return version;
      }
    }
  }
  return std::nullopt;
}

std::optional<toolchain_generation> toolchain_for_editor_version(std::string_view editor_version) {
  auto trimmed = utils::trim_view(editor_version);
  size_t dot = trimmed.find('.');
  if (dot == std::string_view::npos || dot == 0) {
    return std::nullopt;
  }

  try {
    int major = std::stoi(std::string(trimmed.substr(0, dot)));
    size_t minor_end = trimmed.find_first_not_of("0123456789", dot + 1);
    std::string minor_text(trimmed.substr(dot + 1, minor_end == std::string_view::npos ? minor_end : minor_end - dot - 1));
    int minor = minor_text.empty() ? 0 : std::stoi(minor_text);

    // unity 6 reports 6000.x
    if (major > 2022 || (major == 2022 && minor >= 2)) {
      return toolchain_generation::modern;
    }
    if (major >= 2000) {
      return toolchain_generation::legacy;
    }
    return major >= 6 ? std::optional(toolchain_generation::modern) : std::nullopt;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

toolchain_generation detect_toolchain(const std::filesystem::path& project_root) {
  auto log = redlog::get_logger("gr4ft.host");
  auto version = read_editor_version(project_root);
  if (!version) {
    log.dbg("editor version unavailable, assuming modern toolchain", redlog::field("project", project_root.string()));
    return toolchain_generation::modern;
  }

  auto generation = toolchain_for_editor_version(*version);
  if (!generation) {
    log.wrn("unrecognized editor version, assuming modern toolchain", redlog::field("version", *version));
    return toolchain_generation::modern;
  }

  log.dbg(
      "detected toolchain", redlog::field("version", *version),
      redlog::field("toolchain", toolchain_generation_name(*generation))
  );
  return *generation;
}

bool is_android_target(std::string_view build_target) { return utils::to_lower(utils::trim_view(build_target)) == "android"; }

std::filesystem::path default_backup_directory(const std::optional<std::filesystem::path>& project_root) {
  if (project_root) {
    // Library/ is unity's untracked cache directory
    return *project_root / "Library" / "gr4ft" / "backups";
  }

  if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
    return std::filesystem::path(state_home) / "gr4ft" / "backups";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".local" / "state" / "gr4ft" / "backups";
  }
  return std::filesystem::temp_directory_path() / "gr4ft-backups";
}

engine::result<engine::version_set> resolve_version_set(
    const engine::recipe& recipe, const core::runtime_config& config,
    const std::optional<std::filesystem::path>& project_root
) {
  auto log = redlog::get_logger("gr4ft.host");

  std::string wanted = config.version_set;
  if (wanted.empty()) {
    toolchain_generation generation = toolchain_generation::modern;
    switch (config.toolchain) {
    case core::toolchain_selection::modern:
      generation = toolchain_generation::modern;
      break;
    case core::toolchain_selection::legacy:
      generation = toolchain_generation::legacy;
      break;
    case core::toolchain_selection::auto_detect:
      generation = project_root ? detect_toolchain(*project_root) : toolchain_generation::modern;
      break;
    }
    wanted = toolchain_generation_name(generation);

    // a recipe with a single version set applies regardless of toolchain
    if (recipe.version_sets.size() == 1 && recipe.find_version_set(wanted) == nullptr) {
      log.dbg("using the recipe's only version set", redlog::field("set", recipe.version_sets.front().name));
      return engine::ok_result(recipe.version_sets.front());
    }
  }

  const auto* set = recipe.find_version_set(wanted);
  if (!set) {
    return engine::error_result<engine::version_set>(
        engine::error_code::invalid_recipe, "recipe '" + recipe.name + "' has no version set '" + wanted + "'"
    );
  }

  log.dbg("selected version set", redlog::field("recipe", recipe.name), redlog::field("set", set->name));
  return engine::ok_result(*set);
}

} // namespace gr4ft::host
