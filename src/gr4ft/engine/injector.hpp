#pragma once

#include "fragment.hpp"
#include "patch_document.hpp"
#include "types.hpp"
#include <string>
#include <string_view>

namespace gr4ft::engine {

// offset of the opening delimiter of the first block with the given name
result<size_t> find_anchor_block(std::string_view text, const std::string& block_name);

// inserts rendered fragments at their anchor
class injector {
public:
  explicit injector(const version_set& versions) : versions_(versions) {}

  // true when text was inserted, false when the marker is already in the document
  result<bool> insert(patch_document& document, const compiled_fragment& fragment) const;

private:
  const version_set& versions_;

  status insert_in_block(patch_document& document, const compiled_fragment& fragment, const std::vector<std::string>& lines) const;
  void append_at_end(patch_document& document, const compiled_fragment& fragment, const std::vector<std::string>& lines) const;
};

} // namespace gr4ft::engine
