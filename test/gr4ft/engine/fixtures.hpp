#pragma once

#include "gr4ft/engine/fragment.hpp"

namespace gr4ft::test_fixtures {

inline constexpr const char* deps_marker = "// [test] dependencies";
inline constexpr const char* resolve_marker = "// [test] resolution";

inline engine::fragment_spec deps_spec() {
  engine::fragment_spec spec;
  spec.name = "deps";
  spec.marker = deps_marker;
  spec.body = "implementation 'x:core:${core}'";
  spec.anchor = engine::fragment_anchor::block("dependencies");
  return spec;
}

inline constexpr const char* pair_marker = "// [test] pair";

inline engine::fragment_spec pair_spec() {
  engine::fragment_spec spec;
  spec.name = "pair";
  spec.marker = pair_marker;
  spec.body = "implementation 'x:core:${core}'\nimplementation 'x:extra:${core}'";
  spec.anchor = engine::fragment_anchor::block("dependencies");
  return spec;
}

inline engine::fragment_spec resolve_spec() {
  engine::fragment_spec spec;
  spec.name = "resolve";
  spec.marker = resolve_marker;
  spec.body = "configurations.all {\n    force 'x:core:${core}'\n}";
  spec.anchor = engine::fragment_anchor::end_of_file();
  spec.after = {"deps"};
  return spec;
}

inline engine::version_set versions(const std::string& core) { return engine::version_set{"test", {{"core", core}}}; }

inline engine::compiled_fragment compiled(const engine::fragment_spec& spec) {
  return engine::compile_fragment(spec).value;
}

} // namespace gr4ft::test_fixtures
