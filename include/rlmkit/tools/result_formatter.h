#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/scripting/execution_result.h"
#include <cstddef>
#include <string>

namespace rlmkit::tools {

// Returned when a call produced no output, no errors and no changed variables
inline constexpr const char* kNoOutputMessage = "Code executed successfully (no output)";

/**
 * Render a result for the calling model, in this order:
 *   Output:, Errors: (only if non-blank), Variables: (changed ones only,
 *   without `context`, _-prefixed names and modules), Execution time:
 * Sections are separated by a blank line. Each variable preview is cut to
 * max_var_display characters followed by "...".
 */
RLMKIT_API std::string FormatExecutionResult(const scripting::ExecutionResult& result,
                                             size_t max_var_display = 200);

} // namespace rlmkit::tools
