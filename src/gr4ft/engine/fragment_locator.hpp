#pragma once

#include "fragment.hpp"
#include "patch_document.hpp"
#include "types.hpp"
#include <vector>

namespace gr4ft::engine {

// bounds of one fragment instance found in a document
struct fragment_region {
  text_span span;
  size_t marker_offset = 0;
  size_t flat_lines = 0;
  bool has_block = false;
};

// offsets of every occurrence of the fragment's marker
std::vector<size_t> find_markers(const patch_document& document, const compiled_fragment& fragment);

// computes the declared span of the instance whose marker starts at marker_offset.
// fails with pattern_not_found when the text after the marker does not have the fragment's shape.
result<fragment_region> locate_fragment(
    const patch_document& document, const compiled_fragment& fragment, size_t marker_offset
);

} // namespace gr4ft::engine
