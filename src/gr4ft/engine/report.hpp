#pragma once

#include "orchestrator.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace gr4ft::engine {

// one aggregated, presentation-ready message per run
std::string format_summary(
    const patch_result& result, const std::string& file_label, const std::string& error_message,
    bool dry_run = false
);

// what the user has to do about a failure, empty for none
std::string failure_guidance(failure_kind kind);

std::string format_classifications(const std::vector<fragment_classification>& classifications);

} // namespace gr4ft::engine
