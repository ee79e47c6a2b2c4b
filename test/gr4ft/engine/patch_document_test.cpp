#include <doctest/doctest.h>

#include "gr4ft/engine/patch_document.hpp"

using gr4ft::engine::patch_document;

TEST_CASE("patch document normalizes crlf and restores it on serialize") {
  patch_document document("a {\r\n  b\r\n}\r\n");
  CHECK(document.uses_crlf());
  CHECK_FALSE(document.has_bom());
  CHECK(document.text() == "a {\n  b\n}\n");

  document.set_text("a {\n  b\n  c\n}\n");
  CHECK(document.changed());
  CHECK(document.serialize() == "a {\r\n  b\r\n  c\r\n}\r\n");
}

TEST_CASE("patch document leaves mixed line endings alone") {
  std::string raw = "a\r\nb\nc\r\n";
  patch_document document(raw);
  CHECK_FALSE(document.uses_crlf());
  CHECK(document.text() == raw);
  CHECK(document.serialize() == raw);
}

TEST_CASE("patch document strips and restores a byte order mark") {
  std::string raw = "\xEF\xBB\xBF" "dependencies {\n}\n";
  patch_document document(raw);
  CHECK(document.has_bom());
  CHECK(document.text() == "dependencies {\n}\n");
  CHECK_FALSE(document.changed());
  CHECK(document.serialize() == raw);
  CHECK(document.original_bytes() == raw);
}

TEST_CASE("patch document changed compares against the loaded text") {
  patch_document document("x\n");
  document.set_text("y\n");
  CHECK(document.changed());
  document.set_text("x\n");
  CHECK_FALSE(document.changed());
}

TEST_CASE("patch document line helpers") {
  patch_document document("one\ntwo\nthree");
  CHECK(document.line_start(5) == 4);
  CHECK(document.line_end(5) == 7);
  CHECK(document.next_line_start(5) == 8);
  CHECK(document.line_at(5) == "two");
  CHECK(document.line_at(9) == "three");
  CHECK(document.line_end(9) == document.text().size());
  CHECK(document.next_line_start(9) == document.text().size());
}
