// execution_config.h - Sandbox execution settings and their JSON loader
#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/core/capability.h"
#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace rlmkit::core {

/**
 * @brief Settings shared by a sandbox session and the tool that drives it.
 *
 * Built once per run and copied into the session, which never modifies it.
 * Call Validate() (or use LoadExecutionConfig) before handing it to a session;
 * SandboxSession validates again on construction.
 *
 * JSON layout accepted by LoadExecutionConfig / ParseExecutionConfig:
 *   {
 *     "execution": {"timeout_seconds": 60, "truncate_output_chars": 50000,
 *                   "variable_preview_chars": 1000, "scratch_root": ""},
 *     "delegate":  {"model": "openai:gpt-5-mini", "base_url": "...",
 *                   "api_key_env": "OPENAI_API_KEY", "timeout_seconds": 120},
 *     "sandbox":   {"capabilities": ["core", "io-read"], "allowed_modules": ["re"]},
 *     "logging":   {"level": "info"}
 *   }
 */
struct RLMKIT_API ExecutionConfig {
    // ===== Evaluation =====
    double evaluation_timeout_seconds = 60.0;
    size_t output_truncation_limit = 50000;   // characters, not bytes
    size_t variable_preview_chars = 1000;     // per-variable repr kept in snapshots
    std::string scratch_root;                 // empty = system temp directory

    // ===== Delegate model (llm_query) =====
    std::optional<std::string> delegate_model_id;
    std::string delegate_base_url = "https://api.openai.com/v1";
    std::string delegate_api_key_env = "OPENAI_API_KEY";
    int delegate_timeout_seconds = 120;

    // ===== Namespace =====
    CapabilitySet capabilities = DefaultCapabilities();
    std::set<std::string> allowed_modules = DefaultAllowedModules();

    // ===== Logging =====
    std::string log_level = "info";

    bool HasDelegate() const { return delegate_model_id.has_value(); }

    // Configured tags plus DelegateQuery when a delegate model is set
    CapabilitySet EffectiveCapabilities() const;

    // Throws ConfigError describing the first invalid field
    void Validate() const;

    static std::set<std::string> DefaultAllowedModules();
};

// Parse a JSON document; missing keys keep their defaults. Throws ConfigError.
RLMKIT_API ExecutionConfig ParseExecutionConfig(const std::string& json_text);

// Read and parse a config file. Throws ConfigError if it cannot be read.
RLMKIT_API ExecutionConfig LoadExecutionConfig(const std::string& path);

} // namespace rlmkit::core
