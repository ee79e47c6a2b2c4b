#include "target.hpp"

#include <redlog.hpp>

namespace gr4ftx::commands {

using gr4ft::engine::error_code;
using gr4ft::engine::error_result;

gr4ft::engine::patch_request resolved_target::request() const {
  gr4ft::engine::patch_request out;
  out.file = file;
  out.fragments = recipe.fragments;
  out.versions = versions;
  return out;
}

gr4ft::engine::backup_manager resolved_target::backups() const {
  std::filesystem::path directory = config.backup_dir.empty()
                                        ? gr4ft::host::default_backup_directory(project_root)
                                        : std::filesystem::path(config.backup_dir);
  return gr4ft::engine::backup_manager(directory, config.backup_retention);
}

gr4ft::engine::result<resolved_target> resolve_target(const target_options& options) {
  auto log = redlog::get_logger("gr4ftx.target");

  std::string error;
  auto config = gr4ft::core::runtime_config::from_environment(error);
  if (!error.empty()) {
    return error_result<resolved_target>(error_code::invalid_argument, error);
  }

  if (!options.toolchain.empty() && !gr4ft::core::parse_toolchain_selection(options.toolchain, config.toolchain)) {
    return error_result<resolved_target>(
        error_code::invalid_argument, "invalid toolchain '" + options.toolchain + "' (expected auto, modern or legacy)"
    );
  }
  if (!options.version_set.empty()) {
    config.version_set = options.version_set;
  }
  if (!options.recipe.empty()) {
    config.recipe_path = options.recipe;
  }
  if (!options.backup_dir.empty()) {
    config.backup_dir = options.backup_dir;
  }
  if (options.retention) {
    config.backup_retention = *options.retention;
  }
  if (options.best_effort_backup) {
    config.backup_policy = gr4ft::engine::backup_policy::best_effort;
  }
  config.dry_run = config.dry_run || options.dry_run;
  if (!options.build_target.empty()) {
    config.build_target = options.build_target;
  }

  if (!config.validate(error)) {
    return error_result<resolved_target>(error_code::invalid_argument, error);
  }

  resolved_target out;
  if (!options.project.empty()) {
    out.project_root = std::filesystem::path(options.project);
  }
  if (!options.file.empty()) {
    out.file = options.file;
  } else {
    if (!out.project_root) {
      out.project_root = std::filesystem::current_path();
    }
    out.file = gr4ft::host::gradle_template_path(*out.project_root);
  }

  if (config.recipe_path.empty()) {
    out.recipe = gr4ft::presets::solana_android_recipe();
  } else {
    auto loaded = gr4ft::scripting::load_recipe_file(config.recipe_path);
    if (!loaded.ok()) {
      return error_result<resolved_target>(loaded.status_info);
    }
    out.recipe = std::move(loaded.value);
  }

  auto versions = gr4ft::host::resolve_version_set(out.recipe, config, out.project_root);
  if (!versions.ok()) {
    return error_result<resolved_target>(versions.status_info);
  }
  out.versions = std::move(versions.value);
  out.config = std::move(config);

  log.dbg(
      "resolved target", redlog::field("file", out.file.string()), redlog::field("recipe", out.recipe.name),
      redlog::field("versions", out.versions.name), redlog::field("target", out.config.build_target)
  );
  return gr4ft::engine::ok_result(out);
}

} // namespace gr4ftx::commands
