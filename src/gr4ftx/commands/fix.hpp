#pragma once

#include "target.hpp"
#include <gr4ft/host/patch_hook.hpp>

namespace gr4ftx::commands {

/**
 * @brief Run one patch transaction over the target file
 *
 * @param options Target and configuration overrides
 * @param trigger manual for `fix`, prebuild for `prebuild`
 * @return 0 for success or skip, 1 for failure
 */
int fix(const target_options& options, gr4ft::host::hook_trigger trigger = gr4ft::host::hook_trigger::manual);

} // namespace gr4ftx::commands
