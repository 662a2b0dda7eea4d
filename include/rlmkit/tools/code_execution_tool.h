#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/core/analysis_context.h"
#include "rlmkit/core/worker_pool.h"
#include "rlmkit/tools/session_registry.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace rlmkit::tools {

/**
 * CodeExecutionTool - the single "execute_code" tool an agent calls.
 *
 * ExecuteCode never throws: timeouts, construction failures and unexpected
 * errors all come back as text, because the caller is a language model.
 *
 * On timeout the reply is sent at the deadline and the evaluation is asked to
 * stop (best effort). Whatever it changed before stopping stays in the
 * session and is visible to the next call.
 */
class RLMKIT_API CodeExecutionTool {
public:
    static constexpr const char* kToolName = "execute_code";

    // worker_threads == 0 picks hardware concurrency
    explicit CodeExecutionTool(SessionRegistry& registry, size_t worker_threads = 0);
    ~CodeExecutionTool();

    CodeExecutionTool(const CodeExecutionTool&) = delete;
    CodeExecutionTool& operator=(const CodeExecutionTool&) = delete;

    std::string ExecuteCode(const core::RunDependencies& deps, const std::string& code);

    // Tool description in the common {name, description, parameters} layout.
    // The usage guide mentions llm_query only when a delegate is configured.
    static nlohmann::json GetToolDefinition(bool include_delegate_query);

    static std::string FormatTimeoutMessage(double timeout_seconds);

private:
    SessionRegistry& registry_;
    core::WorkerPool pool_;
};

} // namespace rlmkit::tools
