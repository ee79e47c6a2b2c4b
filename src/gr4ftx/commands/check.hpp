#pragma once

#include "target.hpp"

namespace gr4ftx::commands {

/**
 * @brief Classify every fragment of the target file without writing
 *
 * @return 0 when every fragment is correct, 1 otherwise
 */
int check(const target_options& options);

} // namespace gr4ftx::commands
