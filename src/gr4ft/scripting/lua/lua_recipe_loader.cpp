#include "lua_recipe_loader.hpp"

#include <algorithm>
#include <redlog.hpp>
#include <sstream>

namespace gr4ft::scripting::lua {

namespace {

// every helper leaves a message in error and returns false on malformed input
bool read_string(const sol::table& table, const char* key, bool required, std::string& out, std::string& error) {
  sol::object value = table[key];
  if (value.get_type() == sol::type::lua_nil || value.get_type() == sol::type::none) {
    if (required) {
      error = std::string("missing field '") + key + "'";
      return false;
    }
    return true;
  }
  if (value.get_type() != sol::type::string) {
    error = std::string("field '") + key + "' must be a string";
    return false;
  }
  out = value.as<std::string>();
  return true;
}

bool read_string_list(const sol::object& value, const char* key, std::vector<std::string>& out, std::string& error) {
  if (value.get_type() == sol::type::lua_nil || value.get_type() == sol::type::none) {
    return true;
  }
  if (value.get_type() == sol::type::string) {
    out.push_back(value.as<std::string>());
    return true;
  }
  if (value.get_type() != sol::type::table) {
    error = std::string("field '") + key + "' must be a string or a list of strings";
    return false;
  }

  sol::table list = value.as<sol::table>();
  for (size_t i = 1; i <= list.size(); ++i) {
    sol::object item = list[i];
    if (item.get_type() != sol::type::string) {
      error = std::string("field '") + key + "' entry " + std::to_string(i) + " must be a string";
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

bool read_anchor(const sol::table& table, engine::fragment_anchor& out, std::string& error) {
  sol::object value = table["anchor"];
  if (value.get_type() == sol::type::string) {
    std::string text = value.as<std::string>();
    if (text == "eof" || text == "end_of_file") {
      out = engine::fragment_anchor::end_of_file();
      return true;
    }
    error = "anchor must be \"eof\" or { block = \"name\" }, got \"" + text + "\"";
    return false;
  }
  if (value.get_type() == sol::type::table) {
    sol::table anchor = value.as<sol::table>();
    std::string block;
    if (!read_string(anchor, "block", true, block, error)) {
      error = "anchor: " + error;
      return false;
    }
    out = engine::fragment_anchor::block(block);
    return true;
  }

  error = "missing field 'anchor'";
  return false;
}

bool read_fragment(const sol::table& table, engine::fragment_spec& out, std::string& error) {
  if (!read_string(table, "name", true, out.name, error) || !read_string(table, "marker", true, out.marker, error) ||
      !read_anchor(table, out.anchor, error)) {
    return false;
  }

  std::vector<std::string> body_lines;
  if (!read_string_list(table["body"], "body", body_lines, error)) {
    return false;
  }
  if (body_lines.empty()) {
    error = "missing field 'body'";
    return false;
  }
  std::ostringstream body;
  for (size_t i = 0; i < body_lines.size(); ++i) {
    if (i > 0) {
      body << "\n";
    }
    body << body_lines[i];
  }
  out.body = body.str();

  return read_string_list(table["required"], "required", out.required, error) &&
         read_string_list(table["after"], "after", out.after, error);
}

bool read_version_sets(const sol::object& value, std::vector<engine::version_set>& out, std::string& error) {
  if (value.get_type() == sol::type::lua_nil || value.get_type() == sol::type::none) {
    return true;
  }
  if (value.get_type() != sol::type::table) {
    error = "field 'versions' must be a table of version sets";
    return false;
  }

  for (const auto& entry : value.as<sol::table>()) {
    if (entry.first.get_type() != sol::type::string || entry.second.get_type() != sol::type::table) {
      error = "versions must map set names to tables";
      return false;
    }

    engine::version_set set;
    set.name = entry.first.as<std::string>();
    for (const auto& version : entry.second.as<sol::table>()) {
      if (version.first.get_type() != sol::type::string || version.second.get_type() != sol::type::string) {
        error = "version set '" + set.name + "' must map keys to version strings";
        return false;
      }
      set.versions[version.first.as<std::string>()] = version.second.as<std::string>();
    }
    out.push_back(std::move(set));
  }

  // lua table iteration order is unspecified
  std::sort(out.begin(), out.end(), [](const engine::version_set& a, const engine::version_set& b) {
    return a.name < b.name;
  });
  return true;
}

} // namespace

lua_recipe_loader::lua_recipe_loader() {
  setup_lua_environment();
  setup_logging_integration();
}

void lua_recipe_loader::setup_lua_environment() {
  auto log = redlog::get_logger("gr4ft.lua_recipe");
  log.dbg("setting up lua environment");

  // recipes are declarative; no io or os access
  lua_.open_libraries(sol::lib::base, sol::lib::string, sol::lib::math, sol::lib::table);
}

void lua_recipe_loader::setup_logging_integration() {
  lua_["print"] = [](sol::variadic_args args) {
    auto log = redlog::get_logger("gr4ft.lua.print");
    std::ostringstream oss;

    for (const auto& arg : args) {
      if (oss.tellp() > 0) {
        oss << "\t";
      }
      oss << luaL_tolstring(args.lua_state(), arg.stack_index(), nullptr);
      lua_pop(args.lua_state(), 1);
    }

    log.inf(oss.str());
  };
}

engine::result<engine::recipe> lua_recipe_loader::load(const std::string& script_content, const std::string& source_name) {
  auto log = redlog::get_logger("gr4ft.lua_recipe");

  auto fail = [&](const std::string& message) {
    log.err("invalid recipe", redlog::field("source", source_name), redlog::field("error", message));
    return engine::error_result<engine::recipe>(engine::error_code::invalid_recipe, source_name + ": " + message);
  };

  try {
    auto script_result = lua_.safe_script(script_content, sol::script_pass_on_error, source_name);
    if (!script_result.valid()) {
      sol::error error = script_result;
      return fail(std::string("lua error: ") + error.what());
    }

    sol::object root = sol::lua_nil;
    if (script_result.return_count() > 0) {
      root = script_result.get<sol::object>();
    }
    if (root.get_type() != sol::type::table) {
      root = lua_["recipe"];
    }
    if (root.get_type() != sol::type::table) {
      return fail("script must return a recipe table or assign one to 'recipe'");
    }
    sol::table table = root.as<sol::table>();

    engine::recipe out;
    std::string error;
    if (!read_string(table, "name", false, out.name, error)) {
      return fail(error);
    }
    if (out.name.empty()) {
      out.name = source_name;
    }

    sol::object fragments = table["fragments"];
    if (fragments.get_type() != sol::type::table) {
      return fail("missing field 'fragments'");
    }
    sol::table fragment_list = fragments.as<sol::table>();
    for (size_t i = 1; i <= fragment_list.size(); ++i) {
      sol::object item = fragment_list[i];
      if (item.get_type() != sol::type::table) {
        return fail("fragment " + std::to_string(i) + " must be a table");
      }
      engine::fragment_spec fragment;
      if (!read_fragment(item.as<sol::table>(), fragment, error)) {
        return fail("fragment " + std::to_string(i) + ": " + error);
      }
      out.fragments.push_back(std::move(fragment));
    }
    if (out.fragments.empty()) {
      return fail("recipe declares no fragments");
    }

    if (!read_version_sets(table["versions"], out.version_sets, error)) {
      return fail(error);
    }

    log.dbg(
        "loaded lua recipe", redlog::field("recipe", out.name), redlog::field("fragments", out.fragments.size()),
        redlog::field("version_sets", out.version_sets.size())
    );
    return engine::ok_result(out);
  } catch (const sol::error& e) {
    return fail(std::string("lua error: ") + e.what());
  }
}

} // namespace gr4ft::scripting::lua
