#pragma once

#include "engine/backup_manager.hpp"
#include <cstddef>
#include <string>

namespace gr4ft::core {

enum class toolchain_selection { auto_detect, modern, legacy };

const char* toolchain_selection_name(toolchain_selection selection);

// run-wide settings; environment first, command line flags override
struct runtime_config {
  // empty means the default location for the target
  std::string backup_dir;
  size_t backup_retention = engine::backup_manager::default_retention;
  engine::backup_policy backup_policy = engine::backup_policy::strict;
  toolchain_selection toolchain = toolchain_selection::auto_detect;
  // explicit version set name, overrides toolchain selection
  std::string version_set;
  // lua recipe replacing the built-in fragments
  std::string recipe_path;
  bool dry_run = false;
  std::string build_target = "android";

  // GR4FT_BACKUP_DIR, GR4FT_BACKUP_RETENTION, GR4FT_BACKUP_POLICY, GR4FT_TOOLCHAIN,
  // GR4FT_VERSION_SET, GR4FT_RECIPE, GR4FT_DRY_RUN, GR4FT_BUILD_TARGET
  static runtime_config from_environment(std::string& error);

  bool validate(std::string& error) const;
};

bool parse_toolchain_selection(const std::string& value, toolchain_selection& out);
bool parse_backup_policy(const std::string& value, engine::backup_policy& out);

} // namespace gr4ft::core
