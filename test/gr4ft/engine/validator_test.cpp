#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "gr4ft/engine/validator.hpp"

namespace {

using gr4ft::engine::fragment_state;
using gr4ft::engine::patch_document;
using gr4ft::engine::validator;
namespace fx = gr4ft::test_fixtures;

} // namespace

TEST_CASE("validator reports an absent fragment") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  patch_document document("dependencies {\n}\n");

  auto classified = check.classify(document, fx::compiled(fx::deps_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::absent);
  CHECK(classified.value.occurrences == 0);
}

TEST_CASE("validator accepts a correct fragment with surrounding content") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  patch_document document(
      "dependencies {\n    implementation 'user:lib:3'\n    // [test] dependencies\n"
      "    implementation 'x:core:1.8.0'\n    implementation 'user:other:4'\n}\n"
  );

  auto classified = check.classify(document, fx::compiled(fx::deps_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::correct_present);
  CHECK(classified.value.missing.empty());
}

TEST_CASE("validator tolerates trailing comments on fragment lines") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  auto pair = fx::compiled(fx::pair_spec());

  SUBCASE("first line") {
    patch_document document(
        "dependencies {\n    // [test] pair\n    implementation 'x:core:1.8.0' // pinned\n"
        "    implementation 'x:extra:1.8.0'\n}\n"
    );
    auto classified = check.classify(document, pair);
    REQUIRE(classified.ok());
    CHECK(classified.value.state == fragment_state::correct_present);
  }

  SUBCASE("last line") {
    patch_document document(
        "dependencies {\n    // [test] pair\n    implementation 'x:core:1.8.0'\n"
        "    implementation 'x:extra:1.8.0' // keep\n}\n"
    );
    auto classified = check.classify(document, pair);
    REQUIRE(classified.ok());
    CHECK(classified.value.state == fragment_state::correct_present);
  }

  SUBCASE("semicolons") {
    patch_document document(
        "dependencies {\n    // [test] pair\n    implementation 'x:core:1.8.0';\n"
        "    implementation 'x:extra:1.8.0';\n}\n"
    );
    auto classified = check.classify(document, pair);
    REQUIRE(classified.ok());
    CHECK(classified.value.state == fragment_state::correct_present);
  }
}

TEST_CASE("validator accepts a commented block header") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  patch_document document("// [test] resolution\nconfigurations.all { // pinned\n    force 'x:core:1.8.0'\n}\n");

  auto classified = check.classify(document, fx::compiled(fx::resolve_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::correct_present);
}

TEST_CASE("validator flags an outdated version as stale") {
  auto versions = fx::versions("1.15.0");
  validator check(versions);
  patch_document document("dependencies {\n    // [test] dependencies\n    implementation 'x:core:1.8.0'\n}\n");

  auto classified = check.classify(document, fx::compiled(fx::deps_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::stale_present);
  REQUIRE(classified.value.missing.size() == 1);
  CHECK(classified.value.missing[0] == "implementation 'x:core:1.15.0'");
}

TEST_CASE("validator treats duplicate markers as stale") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  patch_document document(
      "dependencies {\n    // [test] dependencies\n    implementation 'x:core:1.8.0'\n"
      "    // [test] dependencies\n    implementation 'x:core:1.8.0'\n}\n"
  );

  auto classified = check.classify(document, fx::compiled(fx::deps_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::stale_present);
  CHECK(classified.value.occurrences == 2);
}

TEST_CASE("validator treats a marker without its block as stale") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  patch_document document("android {\n}\n\n// [test] resolution\nandroid {\n}\n");

  auto classified = check.classify(document, fx::compiled(fx::resolve_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::stale_present);
  CHECK_FALSE(classified.value.detail.empty());
}

TEST_CASE("validator only looks inside the fragment region") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  // the right line exists, but not under the marker
  patch_document document(
      "// [test] resolution\nconfigurations.all {\n    force 'x:core:1.0.0'\n}\n\nforce 'x:core:1.8.0'\n"
  );

  auto classified = check.classify(document, fx::compiled(fx::resolve_spec()));
  REQUIRE(classified.ok());
  CHECK(classified.value.state == fragment_state::stale_present);
}

TEST_CASE("validator fails on an unresolved placeholder") {
  gr4ft::engine::version_set empty{"empty", {}};
  validator check(empty);
  patch_document document("dependencies {\n}\n");

  auto classified = check.classify(document, fx::compiled(fx::deps_spec()));
  CHECK_FALSE(classified.ok());
  CHECK(classified.status_info.code == gr4ft::engine::error_code::invalid_recipe);
}

TEST_CASE("validator classifies every fragment in order") {
  auto versions = fx::versions("1.8.0");
  validator check(versions);
  patch_document document("dependencies {\n    // [test] dependencies\n    implementation 'x:core:1.8.0'\n}\n");

  auto classified = check.classify_all(document, {fx::compiled(fx::deps_spec()), fx::compiled(fx::resolve_spec())});
  REQUIRE(classified.ok());
  REQUIRE(classified.value.size() == 2);
  CHECK(classified.value[0].state == fragment_state::correct_present);
  CHECK(classified.value[1].state == fragment_state::absent);
  CHECK_FALSE(gr4ft::engine::all_correct(classified.value));
}
