#pragma once

#include "result.hpp"
#include <filesystem>
#include <string_view>

namespace gr4ft::engine {

// commits content through a sibling temporary file and a single rename.
// on failure the target keeps its previous content and the temporary file is removed.
class atomic_writer {
public:
  status commit(const std::filesystem::path& target, std::string_view content) const;

  // sibling path used for the temporary copy
  static std::filesystem::path temporary_path_for(const std::filesystem::path& target);
};

} // namespace gr4ft::engine
