#pragma once

#include "core/config.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gr4ft::host {

inline constexpr const char* gradle_template_relative_path = "Assets/Plugins/Android/mainTemplate.gradle";
inline constexpr const char* project_version_relative_path = "ProjectSettings/ProjectVersion.txt";

std::filesystem::path gradle_template_path(const std::filesystem::path& project_root);

// steps for enabling the custom main gradle template
std::string setup_instructions();

enum class toolchain_generation { modern, legacy };

const char* toolchain_generation_name(toolchain_generation generation);

// m_EditorVersion from ProjectSettings/ProjectVersion.txt
std::optional<std::string> read_editor_version(const std::filesystem::path& project_root);

// 2022.2 and newer ship the modern android gradle plugin
std::optional<toolchain_generation> toolchain_for_editor_version(std::string_view editor_version);

// falls back to modern when the project version cannot be read
toolchain_generation detect_toolchain(const std::filesystem::path& project_root);

bool is_android_target(std::string_view build_target);

// <project>/Library/gr4ft/backups for unity projects, otherwise a per-user state directory
std::filesystem::path default_backup_directory(const std::optional<std::filesystem::path>& project_root);

// picks the version set by explicit name, then by toolchain generation
engine::result<engine::version_set> resolve_version_set(
    const engine::recipe& recipe, const core::runtime_config& config,
    const std::optional<std::filesystem::path>& project_root
);

} // namespace gr4ft::host
