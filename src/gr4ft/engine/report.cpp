#include "report.hpp"
#include <sstream>

namespace gr4ft::engine {

namespace {

void append_fragment_list(std::ostringstream& oss, const patch_result& result) {
  bool first = true;
  for (const auto& fragment : result.fragments) {
    oss << (first ? " " : ", ") << fragment.name << " " << fragment_state_name(fragment.initial_state);
    if (fragment.action != fragment_action::none) {
      oss << " -> " << fragment_action_name(fragment.action);
    }
    first = false;
  }
}

} // namespace

std::string failure_guidance(failure_kind kind) {
  switch (kind) {
  case failure_kind::none:
    return {};
  case failure_kind::file_missing:
    return "setup required: create or enable the file, then run again";
  case failure_kind::anchor_not_found:
    return "manual edit required: the expected block is missing";
  case failure_kind::pattern_not_found:
    return "manual cleanup required: remove the outdated fragment by hand";
  case failure_kind::structural_corruption:
    return "internal error: the original file is untouched";
  case failure_kind::backup_failed:
    return "check that the backup directory is writable";
  case failure_kind::io_failure:
    return "check file permissions and free space";
  case failure_kind::invalid_recipe:
    return "fix the fragment definitions or version set";
  case failure_kind::verification_failed:
    return "internal error: a fragment does not satisfy its own validation rule";
  case failure_kind::internal_error:
    return "internal error";
  }
  return {};
}

std::string format_summary(
    const patch_result& result, const std::string& file_label, const std::string& error_message, bool dry_run
) {
  std::ostringstream oss;
  oss << file_label << ": ";

  if (result.skipped) {
    oss << "skipped, not applicable to the current target";
    return oss.str();
  }

  if (!result.success) {
    oss << "aborted (" << failure_kind_name(result.failure) << ")";
    if (!error_message.empty()) {
      oss << ": " << error_message;
    }
    std::string guidance = failure_guidance(result.failure);
    if (!guidance.empty()) {
      oss << ". " << guidance;
    }
    if (!result.fragments.empty()) {
      oss << ". checked";
      append_fragment_list(oss, result);
    }
    if (result.backup) {
      oss << ". backup kept at " << result.backup->path.string();
    }
    oss << ". file left unchanged";
    return oss.str();
  }

  oss << "checked " << result.fragments.size() << (result.fragments.size() == 1 ? " fragment" : " fragments");
  if (!result.changed) {
    oss << ", all up to date; no changes";
  } else {
    oss << ":";
    append_fragment_list(oss, result);
    if (result.backup) {
      oss << "; backup " << result.backup->path.string();
    }
    oss << (dry_run ? "; dry run, nothing written" : "; file updated");
  }

  for (const auto& warning : result.warnings) {
    oss << "; warning: " << warning;
  }
  return oss.str();
}

std::string format_classifications(const std::vector<fragment_classification>& classifications) {
  std::ostringstream oss;
  for (const auto& entry : classifications) {
    oss << "  " << entry.name << ": " << fragment_state_name(entry.state);
    if (!entry.detail.empty()) {
      oss << " (" << entry.detail << ")";
    }
    oss << "\n";
  }
  return oss.str();
}

} // namespace gr4ft::engine
