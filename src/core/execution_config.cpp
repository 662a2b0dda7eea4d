// execution_config.cpp - Sandbox execution settings implementation
#include "rlmkit/core/execution_config.h"
#include "rlmkit/core/errors.h"

#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rlmkit::core {

using json = nlohmann::json;

std::set<std::string> ExecutionConfig::DefaultAllowedModules() {
    return {
        // Text processing
        "re", "string", "textwrap", "difflib", "unicodedata",
        // Data structures
        "json", "csv", "collections", "itertools", "functools", "operator",
        "heapq", "bisect", "copy", "dataclasses", "typing", "enum",
        // Math
        "math", "statistics", "random", "decimal", "fractions",
        // Misc
        "datetime", "time", "io", "hashlib", "base64"
    };
}

CapabilitySet ExecutionConfig::EffectiveCapabilities() const {
    CapabilitySet effective = capabilities;
    if (HasDelegate()) {
        effective.insert(Capability::DelegateQuery);
    }
    return effective;
}

void ExecutionConfig::Validate() const {
    if (!(evaluation_timeout_seconds > 0.0)) {
        throw ConfigError("evaluation timeout must be positive (got " +
                          std::to_string(evaluation_timeout_seconds) + ")");
    }
    if (output_truncation_limit == 0) {
        throw ConfigError("output truncation limit must be positive");
    }
    if (variable_preview_chars == 0) {
        throw ConfigError("variable preview limit must be positive");
    }
    if (delegate_model_id && delegate_model_id->empty()) {
        throw ConfigError("delegate model id must not be empty when set");
    }
    if (HasDelegate() && delegate_timeout_seconds <= 0) {
        throw ConfigError("delegate timeout must be positive");
    }
    if (capabilities.count(Capability::DelegateQuery) && !HasDelegate()) {
        throw ConfigError("delegate-query capability requires a delegate model id");
    }
    if (!capabilities.count(Capability::Core)) {
        throw ConfigError("the core capability cannot be disabled");
    }
    // The context is loaded by ordinary sandboxed code, so it needs these
    if (!capabilities.count(Capability::IoRead)) {
        throw ConfigError("io-read capability is required to load the context");
    }
}

ExecutionConfig ParseExecutionConfig(const std::string& json_text) {
    ExecutionConfig config;

    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    try {
        // Execution settings
        if (root.contains("execution")) {
            const auto& execution = root["execution"];
            if (execution.contains("timeout_seconds")) {
                config.evaluation_timeout_seconds = execution["timeout_seconds"].get<double>();
            }
            if (execution.contains("truncate_output_chars")) {
                config.output_truncation_limit = execution["truncate_output_chars"].get<size_t>();
            }
            if (execution.contains("variable_preview_chars")) {
                config.variable_preview_chars = execution["variable_preview_chars"].get<size_t>();
            }
            if (execution.contains("scratch_root")) {
                config.scratch_root = execution["scratch_root"].get<std::string>();
            }
        }

        // Delegate model
        if (root.contains("delegate")) {
            const auto& delegate = root["delegate"];
            if (delegate.contains("model") && !delegate["model"].is_null()) {
                config.delegate_model_id = delegate["model"].get<std::string>();
            }
            if (delegate.contains("base_url")) {
                config.delegate_base_url = delegate["base_url"].get<std::string>();
            }
            if (delegate.contains("api_key_env")) {
                config.delegate_api_key_env = delegate["api_key_env"].get<std::string>();
            }
            if (delegate.contains("timeout_seconds")) {
                config.delegate_timeout_seconds = delegate["timeout_seconds"].get<int>();
            }
        }

        // Sandbox namespace
        if (root.contains("sandbox")) {
            const auto& sandbox = root["sandbox"];
            if (sandbox.contains("capabilities")) {
                config.capabilities.clear();
                for (const auto& item : sandbox["capabilities"]) {
                    std::string name = item.get<std::string>();
                    auto capability = CapabilityFromString(name);
                    if (!capability) {
                        throw ConfigError("unknown capability: " + name);
                    }
                    config.capabilities.insert(*capability);
                }
            }
            if (sandbox.contains("allowed_modules")) {
                config.allowed_modules.clear();
                for (const auto& item : sandbox["allowed_modules"]) {
                    config.allowed_modules.insert(item.get<std::string>());
                }
            }
        }

        // Logging
        if (root.contains("logging")) {
            const auto& logging = root["logging"];
            if (logging.contains("level")) {
                config.log_level = logging["level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    config.Validate();
    return config;
}

ExecutionConfig LoadExecutionConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    ExecutionConfig config = ParseExecutionConfig(text);

    spdlog::info("Config loaded from: {}", path);
    spdlog::debug("  Timeout: {}s, truncation: {} chars, delegate: {}",
        config.evaluation_timeout_seconds, config.output_truncation_limit,
        config.delegate_model_id.value_or("<none>"));
    return config;
}

} // namespace rlmkit::core
