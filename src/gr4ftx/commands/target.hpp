#pragma once

#include <gr4ft/gr4ft.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace gr4ftx::commands {

// command line overrides; empty means "not given"
struct target_options {
  std::string project;
  std::string file;
  std::string toolchain;
  std::string version_set;
  std::string recipe;
  std::string backup_dir;
  std::optional<size_t> retention;
  bool best_effort_backup = false;
  bool dry_run = false;
  std::string build_target;
};

struct resolved_target {
  std::filesystem::path file;
  std::optional<std::filesystem::path> project_root;
  gr4ft::core::runtime_config config;
  gr4ft::engine::recipe recipe;
  gr4ft::engine::version_set versions;

  gr4ft::engine::patch_request request() const;
  gr4ft::engine::backup_manager backups() const;
};

// environment first, then flags; loads the recipe and picks its version set
gr4ft::engine::result<resolved_target> resolve_target(const target_options& options);

} // namespace gr4ftx::commands
