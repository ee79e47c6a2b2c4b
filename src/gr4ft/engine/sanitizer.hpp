#pragma once

#include "fragment.hpp"
#include "patch_document.hpp"
#include "types.hpp"

namespace gr4ft::engine {

// removes every instance of a fragment using its declared span (marker through end of shape).
// removing an absent fragment is a no-op. on pattern_not_found the document is left as it was.
class sanitizer {
public:
  // number of instances removed
  result<size_t> remove(patch_document& document, const compiled_fragment& fragment) const;
};

} // namespace gr4ft::engine
