#include "rlmkit/tools/code_execution_tool.h"
#include "rlmkit/tools/result_formatter.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace rlmkit::tools {

namespace {

const char* kUsageGuide = R"(Run Python code in a sandboxed, stateful interpreter.

## Environment
- The data to analyze is already loaded in the variable `context`
  (a string for text, a dict or list for JSON data)
- Variables, functions and imports persist between calls in the same run
- Whitelisted standard library modules can be imported (re, json, collections, ...)
- Print what you want to see; a bare expression on the last line is echoed

## When to Use
- Exploring the structure and size of the context
- Searching, filtering and extracting information from large inputs
- Calculations and data transformations

## Best Practices
1. Start small: `print(type(context))`, `print(len(context))`
2. Work in steps and keep intermediate results in variables
3. Print slices instead of whole values; long output is truncated
4. Catch exceptions you expect with try/except
)";

const char* kDelegateGuide = R"(
## Delegate Model
- `llm_query(prompt)` sends a prompt to a secondary model and returns its reply as a string
- Explore the context first; use `llm_query` on specific sections that need
  semantic judgement, not in the first call
)";

const char* kExample = R"(
## Example
```python
print(f"Context type: {type(context).__name__}, size: {len(context)}")
if isinstance(context, dict):
    for key, value in context.items():
        print(key, type(value).__name__)
```
)";

} // anonymous namespace

CodeExecutionTool::CodeExecutionTool(SessionRegistry& registry, size_t worker_threads)
    : registry_(registry), pool_(worker_threads, "rlmkit-eval") {
    spdlog::debug("{} tool ready with {} worker thread(s)", kToolName, pool_.GetThreadCount());
}

CodeExecutionTool::~CodeExecutionTool() {
    // Waits for evaluations that outlived their deadline
    pool_.Shutdown();
}

std::string CodeExecutionTool::ExecuteCode(const core::RunDependencies& deps, const std::string& code) {
    const double timeout_seconds = deps.config.evaluation_timeout_seconds;

    try {
        auto session = registry_.GetOrCreate(
            SessionKey::Of(deps),
            [&deps]() { return deps.context; },
            [&deps]() { return deps.config; });

        auto token = std::make_shared<scripting::CancellationToken>();
        auto future = pool_.Submit([session, token, code]() {
            return session->Run(code, token.get());
        });

        if (future.wait_for(std::chrono::duration<double>(timeout_seconds)) == std::future_status::timeout) {
            spdlog::warn("Session {} exceeded {}s; requesting cancellation", session->GetId(), timeout_seconds);
            token->Cancel();
            return FormatTimeoutMessage(timeout_seconds);
        }

        return FormatExecutionResult(future.get());
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", kToolName, e.what());
        return std::string("Error executing code: ") + e.what();
    }
}

nlohmann::json CodeExecutionTool::GetToolDefinition(bool include_delegate_query) {
    std::string description = kUsageGuide;
    if (include_delegate_query) {
        description += kDelegateGuide;
    }
    description += kExample;

    return {
        {"name", kToolName},
        {"description", description},
        {"parameters", {
            {"type", "object"},
            {"properties", {
                {"code", {
                    {"type", "string"},
                    {"description", "Python code to execute"}
                }}
            }},
            {"required", nlohmann::json::array({"code"})}
        }}
    };
}

std::string CodeExecutionTool::FormatTimeoutMessage(double timeout_seconds) {
    // Whole numbers keep a ".0" (60 -> "60.0")
    std::string seconds = fmt::format("{}", timeout_seconds);
    if (seconds.find_first_of(".eEn") == std::string::npos) {
        seconds += ".0";
    }
    return fmt::format("Error: Code execution timed out after {} seconds.", seconds);
}

} // namespace rlmkit::tools
