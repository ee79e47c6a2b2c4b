#pragma once

#include "../recipe_loader.hpp"
#include <sol/sol.hpp>
#include <string>

namespace gr4ft::scripting::lua {

// evaluates a lua recipe script; the script returns the recipe table or assigns it to the global `recipe`
//
//   return {
//     name = "solana-android",
//     fragments = {
//       { name = "dependencies", marker = "// deps", anchor = { block = "dependencies" },
//         body = { "implementation 'x:core:${core}'" } },
//     },
//     versions = { modern = { core = "1.8.0" } },
//   }
class lua_recipe_loader : public IRecipeLoader {
public:
  lua_recipe_loader();
  ~lua_recipe_loader() = default;

  engine::result<engine::recipe> load(const std::string& script_content, const std::string& source_name) override;

  sol::state& get_lua_state() { return lua_; }

private:
  sol::state lua_;

  void setup_lua_environment();
  void setup_logging_integration();
};

} // namespace gr4ft::scripting::lua
