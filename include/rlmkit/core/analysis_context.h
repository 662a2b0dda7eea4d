// analysis_context.h - The data a run analyses, plus the per-run dependency bundle
#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/core/execution_config.h"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace rlmkit::core {

enum class ContextKind {
    Text,       // plain text, materialized verbatim
    Record,     // JSON object
    Sequence    // JSON array
};

/**
 * AnalysisContext - the (possibly huge) input a run answers questions about.
 *
 * Owned by whoever builds the run; sessions only read it once, when they
 * write it to their scratch directory. A context can never be null:
 * FromJson rejects null and scalar values with ConfigError.
 */
class RLMKIT_API AnalysisContext {
public:
    static AnalysisContext FromText(std::string text);
    static AnalysisContext FromJson(nlohmann::json value);

    // ".json" files become structured payloads, anything else is text
    static AnalysisContext LoadFromFile(const std::string& path);

    ContextKind GetKind() const { return kind_; }
    bool IsText() const { return kind_ == ContextKind::Text; }

    // Valid only for Text contexts
    const std::string& GetText() const;

    // Valid only for Record / Sequence contexts
    const nlohmann::json& GetStructured() const;

    // Size in characters (text) or top-level elements (structured), for logs
    size_t Size() const;

private:
    AnalysisContext(ContextKind kind, std::string text, nlohmann::json structured);

    ContextKind kind_;
    std::string text_;
    nlohmann::json structured_;
};

RLMKIT_API const char* ContextKindToString(ContextKind kind);

/**
 * RunDependencies - everything one analysis run hands to the tool layer.
 *
 * Sessions are keyed by the address of this object, not by its contents,
 * so keep one instance alive for the whole run (see AnalysisRun).
 */
struct RLMKIT_API RunDependencies {
    RunDependencies(AnalysisContext context_in, ExecutionConfig config_in = ExecutionConfig())
        : context(std::move(context_in)), config(std::move(config_in)) {}

    RunDependencies(const RunDependencies&) = delete;
    RunDependencies& operator=(const RunDependencies&) = delete;

    AnalysisContext context;
    ExecutionConfig config;
};

} // namespace rlmkit::core
