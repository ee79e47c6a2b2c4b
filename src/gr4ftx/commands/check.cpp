#include "check.hpp"

#include <iostream>
#include <redlog.hpp>

namespace gr4ftx::commands {

int check(const target_options& options) {
  auto log = redlog::get_logger("gr4ftx.commands.check");

  auto target = resolve_target(options);
  if (!target.ok()) {
    std::cerr << "error: " << target.status_info.message << std::endl;
    return 1;
  }

  gr4ft::engine::orchestrator orchestrator(target.value.backups());
  auto classified = orchestrator.inspect(target.value.request());
  if (!classified.ok()) {
    if (classified.status_info.code == gr4ft::engine::error_code::file_missing) {
      std::cerr << target.value.file.string() << " not found\n" << gr4ft::host::setup_instructions() << std::endl;
    } else {
      std::cerr << "error: " << classified.status_info.message << std::endl;
    }
    return 1;
  }

  std::cout << target.value.file.string() << " (" << target.value.versions.name << ")\n"
            << gr4ft::engine::format_classifications(classified.value) << std::endl;

  bool up_to_date = gr4ft::engine::all_correct(classified.value);

  log.inf(
      "check complete", redlog::field("file", target.value.file.string()), redlog::field("up_to_date", up_to_date)
  );
  return up_to_date ? 0 : 1;
}

} // namespace gr4ftx::commands
