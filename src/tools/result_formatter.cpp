#include "rlmkit/tools/result_formatter.h"
#include "rlmkit/core/text_util.h"
#include "rlmkit/scripting/sandbox_session.h"
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace rlmkit::tools {

namespace {

bool IsHiddenVariable(const std::string& name, const scripting::VariableSnapshot& snapshot) {
    return name.empty() || name[0] == '_' ||
           name == scripting::SandboxSession::kContextVariable ||
           snapshot.type_name == "module";
}

std::string JoinSections(const std::vector<std::string>& parts) {
    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            text += "\n\n";
        }
        text += parts[i];
    }
    return text;
}

} // anonymous namespace

std::string FormatExecutionResult(const scripting::ExecutionResult& result, size_t max_var_display) {
    std::vector<std::string> parts;

    if (!core::IsBlank(result.captured_output)) {
        parts.push_back("Output:\n" + result.captured_output);
    }

    if (!core::IsBlank(result.captured_errors)) {
        parts.push_back("Errors:\n" + result.captured_errors);
    }

    std::string variables;
    for (const auto& [name, snapshot] : result.variables) {
        if (!snapshot.changed || IsHiddenVariable(name, snapshot)) {
            continue;
        }
        if (!variables.empty()) {
            variables += "\n";
        }
        variables += "  " + name + " = " + core::TruncateText(snapshot.preview, max_var_display, "...");
    }
    if (!variables.empty()) {
        parts.push_back("Variables:\n" + variables);
    }

    if (parts.empty()) {
        return kNoOutputMessage;
    }

    parts.push_back(fmt::format("Execution time: {:.3f}s", result.elapsed_seconds));
    return JoinSections(parts);
}

} // namespace rlmkit::tools
