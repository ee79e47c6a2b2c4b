#pragma once

#include "engine/types.hpp"

namespace gr4ft::presets {

inline constexpr const char* dependency_marker = "// [Solana.Unity-SDK] Dependencies";
inline constexpr const char* resolution_marker = "// [Solana.Unity-SDK] Conflict Resolution";

inline constexpr const char* modern_versions = "modern";
inline constexpr const char* legacy_versions = "legacy";

/**
 * @brief Fragments that keep a Unity mainTemplate.gradle buildable with the Solana SDK
 *
 * dependencies: four androidx/guava declarations inside the first `dependencies` block.
 * conflict-resolution: a `configurations.all` block at end of file that drops the empty
 * listenablefuture artifact and pins androidx core.
 */
engine::recipe solana_android_recipe();

engine::version_set solana_android_modern_versions();
engine::version_set solana_android_legacy_versions();

} // namespace gr4ft::presets
