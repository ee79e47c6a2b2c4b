#pragma once

#include "types.hpp"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace gr4ft::engine {

// structure of a template body: flat lines, then at most one trailing named block.
// the declared removal span of a fragment follows this shape.
struct fragment_shape {
  // trimmed flat lines before the block, placeholders unrendered
  std::vector<std::string> flat_lines;
  // header of the trailing block, e.g. "configurations.all"
  std::optional<std::string> block_header;
  // every block header that appears anywhere in the body
  std::vector<std::string> introduced_blocks;
};

struct compiled_fragment {
  fragment_spec spec;
  // body lines after dedent, leading/trailing blank lines removed
  std::vector<std::string> body_lines;
  fragment_shape shape;
  // one pattern per flat line; version placeholders match any version token
  std::vector<std::regex> flat_patterns;
  std::vector<std::string> placeholders;
};

result<compiled_fragment> compile_fragment(const fragment_spec& spec);

// validates a fragment set as a whole and compiles each entry
result<std::vector<compiled_fragment>> compile_recipe(const std::vector<fragment_spec>& specs);

// replaces ${key} with values from the version set
result<std::string> render_template(std::string_view text, const version_set& versions, std::string_view owner = {});

result<std::vector<std::string>> render_body_lines(const compiled_fragment& fragment, const version_set& versions);

// substrings the fragment region must contain to be classified correct
result<std::vector<std::string>> render_required_patterns(
    const compiled_fragment& fragment, const version_set& versions
);

// indices into fragments, dependencies first, declaration order on ties
result<std::vector<size_t>> injection_order(const std::vector<compiled_fragment>& fragments);

// matches a trimmed line of the form `name {` and yields the name
std::optional<std::string> parse_block_header(std::string_view trimmed_line);

} // namespace gr4ft::engine
