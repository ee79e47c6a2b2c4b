#include "fix.hpp"

#include <iostream>
#include <redlog.hpp>

namespace gr4ftx::commands {

int fix(const target_options& options, gr4ft::host::hook_trigger trigger) {
  auto log = redlog::get_logger("gr4ftx.commands.fix");

  auto target = resolve_target(options);
  if (!target.ok()) {
    std::cerr << "error: " << target.status_info.message << std::endl;
    return 1;
  }
  const auto& config = target.value.config;

  gr4ft::engine::patch_options patch_options;
  patch_options.additive_backup_policy = config.backup_policy;
  patch_options.dry_run = config.dry_run;
  patch_options.after_commit = [&log](const std::filesystem::path& file) {
    log.dbg("committed", redlog::field("file", file.string()));
  };

  gr4ft::engine::orchestrator orchestrator(target.value.backups(), patch_options);

  gr4ft::host::hook_context context;
  context.trigger = trigger;
  context.build_target = config.build_target;

  auto result = gr4ft::host::run_hook(orchestrator, context, target.value.request());
  for (const auto& warning : result.warnings) {
    std::cerr << "warning: " << warning << std::endl;
  }

  if (!result.success) {
    std::cerr << result.message << std::endl;
    return 1;
  }

  std::cout << result.message << std::endl;
  return 0;
}

} // namespace gr4ftx::commands
