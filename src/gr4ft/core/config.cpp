#include "config.hpp"

#include "utils/env_config.hpp"
#include "utils/string_utils.hpp"

namespace gr4ft::core {

const char* toolchain_selection_name(toolchain_selection selection) {
  switch (selection) {
  case toolchain_selection::auto_detect:
    return "auto";
  case toolchain_selection::modern:
    return "modern";
  case toolchain_selection::legacy:
    return "legacy";
  }
  return "unknown";
}

bool parse_toolchain_selection(const std::string& value, toolchain_selection& out) {
  std::string lower = utils::to_lower(utils::trim_view(value));
  if (lower == "auto") {
    out = toolchain_selection::auto_detect;
  } else if (lower == "modern") {
    out = toolchain_selection::modern;
  } else if (lower == "legacy") {
    out = toolchain_selection::legacy;
  } else {
    return false;
  }
  return true;
}

bool parse_backup_policy(const std::string& value, engine::backup_policy& out) {
  std::string lower = utils::to_lower(utils::trim_view(value));
  if (lower == "strict") {
    out = engine::backup_policy::strict;
  } else if (lower == "best_effort" || lower == "best-effort") {
    out = engine::backup_policy::best_effort;
  } else {
    return false;
  }
  return true;
}

runtime_config runtime_config::from_environment(std::string& error) {
  error.clear();
  utils::env_config loader("GR4FT");

  runtime_config config;
  config.backup_dir = loader.get<std::string>("BACKUP_DIR", config.backup_dir);
  config.backup_retention = loader.get<size_t>("BACKUP_RETENTION", config.backup_retention);
  config.version_set = loader.get<std::string>("VERSION_SET", config.version_set);
  config.recipe_path = loader.get<std::string>("RECIPE", config.recipe_path);
  config.dry_run = loader.get<bool>("DRY_RUN", config.dry_run);
  config.build_target = loader.get<std::string>("BUILD_TARGET", config.build_target);

  if (auto policy = loader.find("BACKUP_POLICY")) {
    if (!parse_backup_policy(*policy, config.backup_policy)) {
      error = "invalid " + loader.build_env_name("BACKUP_POLICY") + " value '" + *policy + "'";
      return config;
    }
  }

  if (auto toolchain = loader.find("TOOLCHAIN")) {
    if (!parse_toolchain_selection(*toolchain, config.toolchain)) {
      error = "invalid " + loader.build_env_name("TOOLCHAIN") + " value '" + *toolchain + "'";
      return config;
    }
  }

  return config;
}

bool runtime_config::validate(std::string& error) const {
  error.clear();
  if (backup_retention == 0) {
    error = "backup retention must keep at least one backup";
    return false;
  }
  if (build_target.empty()) {
    error = "build target cannot be empty";
    return false;
  }
  return true;
}

} // namespace gr4ft::core
