#include "result.hpp"
#include "types.hpp"

namespace gr4ft::engine {

const char* error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::invalid_recipe:
    return "invalid_recipe";
  case error_code::file_missing:
    return "file_missing";
  case error_code::anchor_not_found:
    return "anchor_not_found";
  case error_code::pattern_not_found:
    return "pattern_not_found";
  case error_code::unbalanced_structure:
    return "unbalanced_structure";
  case error_code::structural_corruption:
    return "structural_corruption";
  case error_code::backup_failed:
    return "backup_failed";
  case error_code::io_error:
    return "io_error";
  case error_code::verification_failed:
    return "verification_failed";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

const char* fragment_state_name(fragment_state state) {
  switch (state) {
  case fragment_state::absent:
    return "absent";
  case fragment_state::correct_present:
    return "correct";
  case fragment_state::stale_present:
    return "stale";
  }
  return "unknown";
}

} // namespace gr4ft::engine
