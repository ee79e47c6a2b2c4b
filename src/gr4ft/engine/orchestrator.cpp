#include "orchestrator.hpp"
#include "atomic_writer.hpp"
#include "brace_scanner.hpp"
#include "fragment_locator.hpp"
#include "injector.hpp"
#include "patch_document.hpp"
#include "report.hpp"
#include "sanitizer.hpp"
#include "utils/file_utils.hpp"
#include "validator.hpp"
#include <redlog.hpp>

namespace gr4ft::engine {

const char* failure_kind_name(failure_kind kind) {
  switch (kind) {
  case failure_kind::none:
    return "none";
  case failure_kind::file_missing:
    return "file_missing";
  case failure_kind::anchor_not_found:
    return "anchor_not_found";
  case failure_kind::pattern_not_found:
    return "pattern_not_found";
  case failure_kind::structural_corruption:
    return "structural_corruption";
  case failure_kind::backup_failed:
    return "backup_failed";
  case failure_kind::io_failure:
    return "io_failure";
  case failure_kind::invalid_recipe:
    return "invalid_recipe";
  case failure_kind::verification_failed:
    return "verification_failed";
  case failure_kind::internal_error:
    return "internal_error";
  }
  return "unknown";
}

failure_kind failure_kind_from(error_code code) {
  switch (code) {
  case error_code::ok:
    return failure_kind::none;
  case error_code::file_missing:
    return failure_kind::file_missing;
  case error_code::anchor_not_found:
    return failure_kind::anchor_not_found;
  case error_code::pattern_not_found:
    return failure_kind::pattern_not_found;
  case error_code::unbalanced_structure:
  case error_code::structural_corruption:
    return failure_kind::structural_corruption;
  case error_code::backup_failed:
    return failure_kind::backup_failed;
  case error_code::io_error:
    return failure_kind::io_failure;
  case error_code::invalid_argument:
  case error_code::invalid_recipe:
    return failure_kind::invalid_recipe;
  case error_code::verification_failed:
    return failure_kind::verification_failed;
  case error_code::internal_error:
    return failure_kind::internal_error;
  }
  return failure_kind::internal_error;
}

bool requires_user_action(failure_kind kind) {
  return kind == failure_kind::file_missing || kind == failure_kind::anchor_not_found ||
         kind == failure_kind::pattern_not_found;
}

const char* run_state_name(run_state state) {
  switch (state) {
  case run_state::start:
    return "start";
  case run_state::validated:
    return "validated";
  case run_state::sanitizing:
    return "sanitizing";
  case run_state::injecting:
    return "injecting";
  case run_state::backed_up:
    return "backed_up";
  case run_state::committed:
    return "committed";
  case run_state::aborted:
    return "aborted";
  }
  return "unknown";
}

const char* fragment_action_name(fragment_action action) {
  switch (action) {
  case fragment_action::none:
    return "none";
  case fragment_action::removed:
    return "removed";
  case fragment_action::injected:
    return "injected";
  case fragment_action::replaced:
    return "replaced";
  }
  return "unknown";
}

orchestrator::orchestrator(backup_manager backups, patch_options options)
    : backups_(std::move(backups)), options_(std::move(options)) {}

result<std::vector<fragment_classification>> orchestrator::inspect(const patch_request& request) const {
  using classifications = std::vector<fragment_classification>;

  auto compiled = compile_recipe(request.fragments);
  if (!compiled.ok()) {
    return error_result<classifications>(compiled.status_info);
  }
  if (!utils::file_exists(request.file)) {
    return error_result<classifications>(error_code::file_missing, "file not found: " + request.file.string());
  }
  auto bytes = utils::read_file_string(request.file);
  if (!bytes) {
    return error_result<classifications>(error_code::io_error, "cannot read " + request.file.string());
  }

  patch_document document(std::move(*bytes));
  validator check(request.versions);
  return check.classify_all(document, compiled.value);
}

patch_result orchestrator::run(const patch_request& request) {
  auto log = redlog::get_logger("gr4ft.orchestrator");

  patch_result out;
  const std::string label = request.file.filename().string();

  auto enter = [&](run_state state) {
    out.final_state = state;
    log.trc("state", redlog::field("file", label), redlog::field("state", run_state_name(state)));
  };

  auto abort_run = [&](const status& st) -> patch_result {
    out.success = false;
    out.changed = false;
    out.failure = failure_kind_from(st.code);
    out.final_state = run_state::aborted;
    out.message = format_summary(out, label, st.message);
    log.err(
        "patch run aborted", redlog::field("file", request.file.string()),
        redlog::field("failure", failure_kind_name(out.failure)), redlog::field("error", st.message)
    );
    return out;
  };

  if (!request.enabled) {
    out.success = true;
    out.skipped = true;
    out.message = format_summary(out, label, {});
    log.dbg("patch run skipped by caller", redlog::field("file", request.file.string()));
    return out;
  }

  log.dbg(
      "starting patch run", redlog::field("file", request.file.string()),
      redlog::field("fragments", request.fragments.size()), redlog::field("versions", request.versions.name),
      redlog::field("dry_run", options_.dry_run)
  );

  auto compiled = compile_recipe(request.fragments);
  if (!compiled.ok()) {
    return abort_run(compiled.status_info);
  }
  const auto& fragments = compiled.value;

  if (!utils::file_exists(request.file)) {
    return abort_run(make_status(error_code::file_missing, "file not found: " + request.file.string()));
  }
  auto bytes = utils::read_file_string(request.file);
  if (!bytes) {
    return abort_run(make_status(error_code::io_error, "cannot read " + request.file.string()));
  }
  patch_document document(std::move(*bytes));

  validator check(request.versions);
  auto initial = check.classify_all(document, fragments);
  if (!initial.ok()) {
    return abort_run(initial.status_info);
  }
  enter(run_state::validated);

  for (const auto& entry : initial.value) {
    out.fragments.push_back(fragment_outcome{entry.name, entry.state, fragment_action::none, entry.detail});
  }

  if (all_correct(initial.value)) {
    out.success = true;
    enter(run_state::committed);
    out.message = format_summary(out, label, {});
    log.inf("file already up to date", redlog::field("file", request.file.string()));
    return out;
  }

  brace_scanner scanner;
  auto input_balance = scanner.check_balance(document.text());
  if (!input_balance.ok()) {
    return abort_run(make_status(
        error_code::structural_corruption, "file is not brace-balanced before patching: " + input_balance.message
    ));
  }

  bool snapshot_attempted = false;
  auto take_backup = [&](bool strict) -> status {
    if (snapshot_attempted || options_.dry_run) {
      return ok_status();
    }
    snapshot_attempted = true;
    auto snapshot = backups_.snapshot(request.file);
    if (!snapshot.ok()) {
      if (strict) {
        return snapshot.status_info;
      }
      out.warnings.push_back("backup skipped: " + snapshot.status_info.message);
      log.wrn("continuing without backup", redlog::field("error", snapshot.status_info.message));
      return ok_status();
    }
    out.backup = snapshot.value;
    enter(run_state::backed_up);
    return ok_status();
  };

  std::vector<size_t> stale;
  for (size_t i = 0; i < initial.value.size(); ++i) {
    if (initial.value[i].state == fragment_state::stale_present) {
      stale.push_back(i);
    }
  }

  if (!stale.empty()) {
    enter(run_state::sanitizing);
    auto backed_up = take_backup(true);
    if (!backed_up.ok()) {
      return abort_run(backed_up);
    }

    sanitizer cleaner;
    for (size_t index : stale) {
      auto removed = cleaner.remove(document, fragments[index]);
      if (!removed.ok()) {
        return abort_run(removed.status_info);
      }
      if (removed.value > 0) {
        out.fragments[index].action = fragment_action::removed;
      }
    }
  }

  auto order = injection_order(fragments);
  if (!order.ok()) {
    return abort_run(order.status_info);
  }

  // presence is rechecked against the current text; removing an outer fragment can take nested ones with it
  std::vector<size_t> missing;
  for (size_t index : order.value) {
    if (find_markers(document, fragments[index]).empty()) {
      missing.push_back(index);
    }
  }

  if (!missing.empty()) {
    enter(run_state::injecting);
    auto backed_up = take_backup(options_.additive_backup_policy == backup_policy::strict);
    if (!backed_up.ok()) {
      return abort_run(backed_up);
    }

    injector inserter(request.versions);
    for (size_t index : missing) {
      auto inserted = inserter.insert(document, fragments[index]);
      if (!inserted.ok()) {
        return abort_run(inserted.status_info);
      }
      if (inserted.value) {
        auto& outcome = out.fragments[index];
        outcome.action =
            outcome.initial_state == fragment_state::absent ? fragment_action::injected : fragment_action::replaced;
      }
    }
  }

  if (!document.changed()) {
    out.success = true;
    enter(run_state::committed);
    out.message = format_summary(out, label, {});
    return out;
  }

  auto output_balance = scanner.check_balance(document.text());
  if (!output_balance.ok()) {
    return abort_run(make_status(
        error_code::structural_corruption,
        "patched content failed the structural check (" + output_balance.message + "); nothing was written"
    ));
  }

  auto final_check = check.classify_all(document, fragments);
  if (!final_check.ok()) {
    return abort_run(final_check.status_info);
  }
  for (const auto& entry : final_check.value) {
    if (entry.state != fragment_state::correct_present) {
      return abort_run(make_status(
          error_code::verification_failed, "fragment '" + entry.name + "' is " + fragment_state_name(entry.state) +
                                               " after patching; nothing was written"
      ));
    }
  }

  out.changed = true;
  if (options_.dry_run) {
    out.success = true;
    out.message = format_summary(out, label, {}, true);
    log.inf("dry run complete", redlog::field("file", request.file.string()));
    return out;
  }

  atomic_writer writer;
  auto committed = writer.commit(request.file, document.serialize());
  if (!committed.ok()) {
    return abort_run(committed);
  }

  out.success = true;
  enter(run_state::committed);

  if (options_.after_commit) {
    try {
      options_.after_commit(request.file);
    } catch (const std::exception& e) {
      out.warnings.push_back(std::string("post-commit refresh failed: ") + e.what());
      log.wrn("post-commit refresh failed", redlog::field("error", e.what()));
    }
  }

  out.message = format_summary(out, label, {});
  log.inf(
      "patched file", redlog::field("file", request.file.string()),
      redlog::field("backup", out.backup ? out.backup->path.string() : std::string("none"))
  );
  return out;
}

} // namespace gr4ft::engine
