#pragma once

// engine
#include "engine/result.hpp"
#include "engine/types.hpp"
#include "engine/patch_document.hpp"
#include "engine/brace_scanner.hpp"
#include "engine/fragment.hpp"
#include "engine/validator.hpp"
#include "engine/orchestrator.hpp"
#include "engine/report.hpp"

// configuration and host integration
#include "core/config.hpp"
#include "host/unity_project.hpp"
#include "host/patch_hook.hpp"

// recipes
#include "presets/android_dependencies.hpp"
#include "scripting/recipe_loader.hpp"
