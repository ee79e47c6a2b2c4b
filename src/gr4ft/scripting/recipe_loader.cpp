#include "recipe_loader.hpp"

#include "lua/lua_recipe_loader.hpp"
#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>

namespace gr4ft::scripting {

std::unique_ptr<IRecipeLoader> RecipeLoaderFactory::create() { return create(RecipeLoaderType::LUA); }

std::unique_ptr<IRecipeLoader> RecipeLoaderFactory::create(RecipeLoaderType loader_type) {
  auto log = redlog::get_logger("gr4ft.recipe_factory");

  switch (loader_type) {
  case RecipeLoaderType::LUA:
    log.dbg("creating lua recipe loader");
    return std::make_unique<lua::lua_recipe_loader>();
  }

  log.err("unsupported recipe loader type");
  return nullptr;
}

std::vector<std::string> RecipeLoaderFactory::get_supported_extensions() { return {".lua"}; }

engine::result<engine::recipe> load_recipe_file(const std::filesystem::path& path) {
  auto log = redlog::get_logger("gr4ft.recipe_factory");

  std::string extension = utils::to_lower(path.extension().string());
  auto supported = RecipeLoaderFactory::get_supported_extensions();
  bool known = false;
  for (const auto& candidate : supported) {
    known = known || candidate == extension;
  }
  if (!known) {
    return engine::error_result<engine::recipe>(
        engine::error_code::invalid_recipe, "unsupported recipe extension '" + extension + "': " + path.string()
    );
  }

  if (!utils::file_exists(path)) {
    return engine::error_result<engine::recipe>(engine::error_code::file_missing, "recipe not found: " + path.string());
  }

  auto content = utils::read_file_string(path);
  if (!content) {
    return engine::error_result<engine::recipe>(engine::error_code::io_error, "failed to read recipe: " + path.string());
  }

  auto loader = RecipeLoaderFactory::create();
  if (!loader) {
    return engine::error_result<engine::recipe>(engine::error_code::internal_error, "no recipe loader available");
  }

  log.dbg("loading recipe", redlog::field("path", path.string()), redlog::field("size", content->size()));
  return loader->load(*content, path.string());
}

} // namespace gr4ft::scripting
