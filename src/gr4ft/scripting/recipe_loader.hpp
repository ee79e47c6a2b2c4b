#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gr4ft::scripting {

// turns a recipe script into fragment and version set definitions
class IRecipeLoader {
public:
  virtual ~IRecipeLoader() = default;

  // source_name is used for diagnostics only
  virtual engine::result<engine::recipe> load(const std::string& script_content, const std::string& source_name) = 0;
};

enum class RecipeLoaderType { LUA };

class RecipeLoaderFactory {
public:
  static std::unique_ptr<IRecipeLoader> create();
  static std::unique_ptr<IRecipeLoader> create(RecipeLoaderType loader_type);

  static std::vector<std::string> get_supported_extensions();
};

// reads and loads a recipe script; errors surface as invalid_recipe or file_missing
engine::result<engine::recipe> load_recipe_file(const std::filesystem::path& path);

} // namespace gr4ft::scripting
