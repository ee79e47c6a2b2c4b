#include "android_dependencies.hpp"

namespace gr4ft::presets {

namespace {

constexpr const char* dependency_body = R"(
implementation 'androidx.browser:browser:${browser}'
implementation 'androidx.versionedparcelable:versionedparcelable:${versionedparcelable}'
implementation 'com.google.guava:guava:${guava}'
implementation 'com.google.guava:listenablefuture:${listenablefuture}'
)";

constexpr const char* resolution_body = R"(
configurations.all {
    resolutionStrategy {
        exclude group: 'com.google.guava', module: 'listenablefuture'
        force 'androidx.core:core:${androidx_core}'
    }
}
)";

} // namespace

engine::version_set solana_android_modern_versions() {
  return engine::version_set{
      modern_versions,
      {{"browser", "1.8.0"},
       {"versionedparcelable", "1.1.1"},
       {"guava", "33.0.0-android"},
       {"listenablefuture", "9999.0-empty-to-avoid-conflict-with-guava"},
       {"androidx_core", "1.13.0"}}
  };
}

engine::version_set solana_android_legacy_versions() {
  return engine::version_set{
      legacy_versions,
      {{"browser", "1.4.0"},
       {"versionedparcelable", "1.1.1"},
       {"guava", "31.1-android"},
       {"listenablefuture", "9999.0-empty-to-avoid-conflict-with-guava"},
       {"androidx_core", "1.9.0"}}
  };
}

engine::recipe solana_android_recipe() {
  engine::recipe recipe;
  recipe.name = "solana-android";

  engine::fragment_spec dependencies;
  dependencies.name = "dependencies";
  dependencies.marker = dependency_marker;
  dependencies.body = dependency_body;
  dependencies.anchor = engine::fragment_anchor::block("dependencies");
  recipe.fragments.push_back(dependencies);

  engine::fragment_spec resolution;
  resolution.name = "conflict-resolution";
  resolution.marker = resolution_marker;
  resolution.body = resolution_body;
  resolution.anchor = engine::fragment_anchor::end_of_file();
  // never injected ahead of the declarations it resolves
  resolution.after = {"dependencies"};
  recipe.fragments.push_back(resolution);

  recipe.version_sets = {solana_android_modern_versions(), solana_android_legacy_versions()};
  return recipe;
}

} // namespace gr4ft::presets
