#include "backups.hpp"

#include <iostream>
#include <redlog.hpp>

namespace gr4ftx::commands {

int backups(const target_options& options) {
  auto log = redlog::get_logger("gr4ftx.commands.backups");

  auto target = resolve_target(options);
  if (!target.ok()) {
    std::cerr << "error: " << target.status_info.message << std::endl;
    return 1;
  }

  auto manager = target.value.backups();
  auto records = manager.list(target.value.file);
  if (!records.ok()) {
    std::cerr << "error: " << records.status_info.message << std::endl;
    return 1;
  }

  log.dbg(
      "listing backups", redlog::field("directory", manager.directory().string()),
      redlog::field("count", records.value.size())
  );

  if (records.value.empty()) {
    std::cout << "no backups for " << target.value.file.string() << " in " << manager.directory().string() << std::endl;
    return 0;
  }

  for (const auto& record : records.value) {
    std::cout << record.stamp << "  " << record.path.string() << "\n";
  }
  std::cout.flush();
  return 0;
}

} // namespace gr4ftx::commands
