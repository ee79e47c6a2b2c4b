#pragma once

#include "target.hpp"

namespace gr4ftx::commands {

// lists backups of the target file, newest first
int backups(const target_options& options);

} // namespace gr4ftx::commands
