#pragma once

#include "backup_manager.hpp"
#include "fragment.hpp"
#include "types.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gr4ft::engine {

enum class failure_kind {
  none,
  file_missing,
  anchor_not_found,
  pattern_not_found,
  structural_corruption,
  backup_failed,
  io_failure,
  invalid_recipe,
  verification_failed,
  internal_error
};

const char* failure_kind_name(failure_kind kind);
failure_kind failure_kind_from(error_code code);

// true for conditions the user resolves (enable the template, edit or clean the file by hand)
bool requires_user_action(failure_kind kind);

enum class run_state { start, validated, sanitizing, injecting, backed_up, committed, aborted };

const char* run_state_name(run_state state);

enum class fragment_action { none, removed, injected, replaced };

const char* fragment_action_name(fragment_action action);

struct fragment_outcome {
  std::string name;
  fragment_state initial_state = fragment_state::absent;
  fragment_action action = fragment_action::none;
  std::string detail;
};

struct patch_result {
  bool success = false;
  bool changed = false;
  // set when the caller's go/no-go said not to look at the file
  bool skipped = false;
  std::string message;
  failure_kind failure = failure_kind::none;
  run_state final_state = run_state::start;
  std::vector<fragment_outcome> fragments;
  std::optional<backup_record> backup;
  std::vector<std::string> warnings;
};

struct patch_request {
  std::filesystem::path file;
  std::vector<fragment_spec> fragments;
  version_set versions;
  // go/no-go decided by the caller's environment detection
  bool enabled = true;
};

struct patch_options {
  // applies to additive-only runs; removal always requires a snapshot
  backup_policy additive_backup_policy = backup_policy::strict;
  bool dry_run = false;
  // refresh hook for external indexes, invoked after a successful write
  std::function<void(const std::filesystem::path&)> after_commit;
};

// runs one self-contained patch transaction over a file:
// validate, sanitize stale fragments, inject missing ones, check structure, commit atomically.
class orchestrator {
public:
  explicit orchestrator(backup_manager backups, patch_options options = {});

  patch_result run(const patch_request& request);

  // classification only; never writes or backs up
  result<std::vector<fragment_classification>> inspect(const patch_request& request) const;

  const backup_manager& backups() const noexcept { return backups_; }
  const patch_options& options() const noexcept { return options_; }

private:
  backup_manager backups_;
  patch_options options_;
};

} // namespace gr4ft::engine
