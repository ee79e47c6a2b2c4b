#pragma once

#include "engine/orchestrator.hpp"
#include <string>

namespace gr4ft::host {

enum class hook_trigger { editor_load, manual, prebuild };

const char* hook_trigger_name(hook_trigger trigger);

// once-per-session latch for the editor load trigger
class session_gate {
public:
  // true the first time only
  bool try_enter() noexcept {
    if (entered_) {
      return false;
    }
    entered_ = true;
    return true;
  }

  bool entered() const noexcept { return entered_; }
  void reset() noexcept { entered_ = false; }

private:
  bool entered_ = false;
};

struct hook_context {
  hook_trigger trigger = hook_trigger::manual;
  std::string build_target;
  // consulted for editor_load only; null disables the latch
  session_gate* gate = nullptr;
};

// go/no-go for a patch run; consumes the session gate on editor load
bool should_patch(const hook_context& context);

// runs the request through the orchestrator when the hook applies,
// with setup instructions in place of a bare missing-file message
engine::patch_result run_hook(engine::orchestrator& orchestrator, const hook_context& context, engine::patch_request request);

} // namespace gr4ft::host
