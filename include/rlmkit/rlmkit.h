#pragma once

// Main header file for rlmkit
// Include this to get access to the sandbox, registry and tool layer

#define RLMKIT_VERSION_MAJOR 0
#define RLMKIT_VERSION_MINOR 1
#define RLMKIT_VERSION_PATCH 0

#include "api_export.h"

// Core data (no Python dependency)
#include "core/errors.h"
#include "core/capability.h"
#include "core/execution_config.h"
#include "core/analysis_context.h"
#include "core/text_util.h"
#include "core/worker_pool.h"

// Embedded interpreter and sandbox
#include "scripting/python_engine.h"
#include "scripting/execution_result.h"
#include "scripting/delegate_client.h"
#include "scripting/sandbox_session.h"

// Agent-facing tool layer
#include "tools/session_registry.h"
#include "tools/result_formatter.h"
#include "tools/code_execution_tool.h"

#include <string>

namespace rlmkit {

RLMKIT_API std::string GetVersionString();

} // namespace rlmkit
