#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/core/execution_config.h"
#include <memory>
#include <string>

namespace rlmkit::scripting {

/**
 * DelegateClient - synchronous access to the secondary model behind llm_query.
 *
 * Complete() blocks until the reply arrives and throws DelegateError on any
 * failure; the sandbox turns that into an in-band "Error: ..." string.
 * Implementations must be callable from several threads at once.
 */
class RLMKIT_API DelegateClient {
public:
    virtual ~DelegateClient() = default;

    virtual std::string Complete(const std::string& prompt) = 0;

    virtual std::string GetModelId() const = 0;
};

/**
 * OpenAIDelegateClient - OpenAI-compatible /chat/completions over HTTP(S).
 *
 * Model ids may carry a provider prefix ("openai:gpt-5-mini"); the prefix is
 * stripped before the request. The bearer token is read from the environment
 * variable named by ExecutionConfig::delegate_api_key_env on every call.
 */
class RLMKIT_API OpenAIDelegateClient : public DelegateClient {
public:
    OpenAIDelegateClient(std::string model_id, std::string base_url,
                         std::string api_key_env, int timeout_seconds);

    std::string Complete(const std::string& prompt) override;
    std::string GetModelId() const override { return model_id_; }

    // "openai:gpt-5-mini" -> "gpt-5-mini"; ids without a prefix are unchanged
    static std::string StripProviderPrefix(const std::string& model_id);

private:
    std::string model_id_;
    std::string base_url_;
    std::string api_key_env_;
    int timeout_seconds_;
};

// Client for config.delegate_model_id, or nullptr when no delegate is configured
RLMKIT_API std::shared_ptr<DelegateClient> CreateDelegateClient(const core::ExecutionConfig& config);

} // namespace rlmkit::scripting
