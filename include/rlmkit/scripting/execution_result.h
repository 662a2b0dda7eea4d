#pragma once

#include <map>
#include <string>

namespace rlmkit::scripting {

// Plain-text view of one variable; no Python objects escape the session
struct VariableSnapshot {
    std::string type_name;
    std::string preview;      // repr(), bounded by variable_preview_chars
    bool changed = false;     // newly bound or rebound by the call that produced it
};

/**
 * Outcome of one SandboxSession::Run call. Built once, never modified.
 */
struct ExecutionResult {
    std::string captured_output;   // stdout, plus echoed trailing expression
    std::string captured_errors;   // stderr, plus the fault that stopped evaluation
    std::map<std::string, VariableSnapshot> variables;  // store at call end
    double elapsed_seconds = 0.0;
    bool succeeded = true;
};

} // namespace rlmkit::scripting
