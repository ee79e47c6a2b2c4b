#include "patch_hook.hpp"

#include "unity_project.hpp"
#include <redlog.hpp>

namespace gr4ft::host {

const char* hook_trigger_name(hook_trigger trigger) {
  switch (trigger) {
  case hook_trigger::editor_load:
    return "editor_load";
  case hook_trigger::manual:
    return "manual";
  case hook_trigger::prebuild:
    return "prebuild";
  }
  return "unknown";
}

bool should_patch(const hook_context& context) {
  auto log = redlog::get_logger("gr4ft.hook");

  if (!is_android_target(context.build_target)) {
    log.dbg(
        "build target does not use the gradle template", redlog::field("trigger", hook_trigger_name(context.trigger)),
        redlog::field("target", context.build_target)
    );
    return false;
  }

  if (context.trigger == hook_trigger::editor_load && context.gate && !context.gate->try_enter()) {
    log.dbg("editor load hook already ran this session");
    return false;
  }

  return true;
}

engine::patch_result run_hook(engine::orchestrator& orchestrator, const hook_context& context, engine::patch_request request) {
  auto log = redlog::get_logger("gr4ft.hook");

  request.enabled = request.enabled && should_patch(context);
  log.dbg(
      "running patch hook", redlog::field("trigger", hook_trigger_name(context.trigger)),
      redlog::field("enabled", request.enabled), redlog::field("file", request.file.string())
  );

  auto result = orchestrator.run(request);
  if (!result.success && result.failure == engine::failure_kind::file_missing) {
    result.message = request.file.filename().string() + " not found\n" + setup_instructions();
  }
  return result;
}

} // namespace gr4ft::host
