#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "gr4ft/engine/sanitizer.hpp"

namespace {

using gr4ft::engine::error_code;
using gr4ft::engine::patch_document;
using gr4ft::engine::sanitizer;
namespace fx = gr4ft::test_fixtures;

} // namespace

TEST_CASE("sanitizer removes only the declared span of a flat fragment") {
  patch_document document(
      "dependencies {\n    // [test] dependencies\n    implementation 'x:core:1.4.0'\n"
      "    implementation 'user:lib:2.0'\n}\n"
  );

  auto removed = sanitizer().remove(document, fx::compiled(fx::deps_spec()));
  REQUIRE(removed.ok());
  CHECK(removed.value == 1);
  CHECK(document.text() == "dependencies {\n    implementation 'user:lib:2.0'\n}\n");
}

TEST_CASE("sanitizer removes fragment lines that carry trailing comments") {
  patch_document document(
      "dependencies {\n    // [test] pair\n    implementation 'x:core:1.4.0' // pinned\n"
      "    implementation 'x:extra:1.4.0' // keep\n    implementation 'user:lib:2.0'\n}\n"
  );

  auto removed = sanitizer().remove(document, fx::compiled(fx::pair_spec()));
  REQUIRE(removed.ok());
  CHECK(removed.value == 1);
  CHECK(document.text() == "dependencies {\n    implementation 'user:lib:2.0'\n}\n");
}

TEST_CASE("sanitizer removes a block fragment through its closing delimiter") {
  patch_document document(
      "android {\n}\n\n// [test] resolution\nconfigurations.all {\n    force 'x:core:1.0'\n}\n"
  );

  auto removed = sanitizer().remove(document, fx::compiled(fx::resolve_spec()));
  REQUIRE(removed.ok());
  CHECK(removed.value == 1);
  CHECK(document.text() == "android {\n}\n\n");
}

TEST_CASE("sanitizer removes every duplicate instance") {
  patch_document document(
      "dependencies {\n    // [test] dependencies\n    implementation 'x:core:1.4.0'\n"
      "    // [test] dependencies\n    implementation 'x:core:1.8.0'\n}\n"
  );

  auto removed = sanitizer().remove(document, fx::compiled(fx::deps_spec()));
  REQUIRE(removed.ok());
  CHECK(removed.value == 2);
  CHECK(document.text() == "dependencies {\n}\n");
}

TEST_CASE("sanitizer is a no-op for an absent fragment") {
  patch_document document("dependencies {\n}\n");
  auto removed = sanitizer().remove(document, fx::compiled(fx::deps_spec()));
  REQUIRE(removed.ok());
  CHECK(removed.value == 0);
  CHECK_FALSE(document.changed());
}

TEST_CASE("sanitizer leaves the document untouched when the shape is not recognized") {
  std::string text = "android {\n}\n// [test] resolution\nandroid {\n}\n";
  patch_document document(text);

  auto removed = sanitizer().remove(document, fx::compiled(fx::resolve_spec()));
  CHECK_FALSE(removed.ok());
  CHECK(removed.status_info.code == error_code::pattern_not_found);
  CHECK(document.text() == text);
}

TEST_CASE("sanitizer refuses a marker followed by unrelated lines") {
  std::string text = "dependencies {\n    // [test] dependencies\n    implementation 'user:lib:2.0'\n}\n";
  patch_document document(text);

  auto removed = sanitizer().remove(document, fx::compiled(fx::deps_spec()));
  CHECK_FALSE(removed.ok());
  CHECK(removed.status_info.code == error_code::pattern_not_found);
  CHECK(document.text() == text);
}
