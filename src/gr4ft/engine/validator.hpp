#pragma once

#include "fragment.hpp"
#include "patch_document.hpp"
#include "types.hpp"
#include <vector>

namespace gr4ft::engine {

// classifies each fragment as absent, present and correct, or present and stale.
// matching is substring based over the located fragment region; surrounding content is ignored.
class validator {
public:
  explicit validator(const version_set& versions) : versions_(versions) {}

  result<fragment_classification> classify(const patch_document& document, const compiled_fragment& fragment) const;

  // one entry per fragment, in input order
  result<std::vector<fragment_classification>> classify_all(
      const patch_document& document, const std::vector<compiled_fragment>& fragments
  ) const;

private:
  const version_set& versions_;
};

bool all_correct(const std::vector<fragment_classification>& classifications);

} // namespace gr4ft::engine
