#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/core/analysis_context.h"
#include "rlmkit/scripting/delegate_client.h"
#include "rlmkit/scripting/sandbox_session.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rlmkit::tools {

/**
 * SessionKey - identity of one logical run.
 *
 * Derived from the address of the run's RunDependencies, never from its
 * contents: two equal bundles at different addresses are different runs.
 */
class RLMKIT_API SessionKey {
public:
    static SessionKey Of(const core::RunDependencies& deps);
    static SessionKey FromValue(uintptr_t value) { return SessionKey(value); }

    uintptr_t GetValue() const { return value_; }
    std::string ToString() const;

    bool operator==(const SessionKey& other) const { return value_ == other.value_; }
    bool operator!=(const SessionKey& other) const { return value_ != other.value_; }

    struct Hash {
        size_t operator()(const SessionKey& key) const { return std::hash<uintptr_t>()(key.value_); }
    };

private:
    explicit SessionKey(uintptr_t value) : value_(value) {}
    uintptr_t value_;
};

/**
 * SessionRegistry - maps SessionKeys to live sandbox sessions.
 *
 * Owned by whoever coordinates runs and passed by reference to the tool
 * layer. There is no expiry, eviction or reference counting: a session lives
 * until Teardown(key) / TeardownAll() or until the registry is destroyed.
 *
 * GetOrCreate is safe to call concurrently. For a given key exactly one
 * session is built (first caller wins, later callers wait for it); building
 * sessions for different keys proceeds in parallel.
 */
class RLMKIT_API SessionRegistry {
public:
    using ContextFactory = std::function<core::AnalysisContext()>;
    using ConfigFactory = std::function<core::ExecutionConfig()>;
    using DelegateFactory = std::function<std::shared_ptr<scripting::DelegateClient>(const core::ExecutionConfig&)>;

    // delegate_factory defaults to CreateDelegateClient (HTTP client)
    explicit SessionRegistry(DelegateFactory delegate_factory = nullptr);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Factories run only when the key has no session yet. Exceptions from the
    // factories or from session construction propagate; the key stays free.
    std::shared_ptr<scripting::SandboxSession> GetOrCreate(const SessionKey& key,
                                                           const ContextFactory& context_factory,
                                                           const ConfigFactory& config_factory);

    std::shared_ptr<scripting::SandboxSession> Find(const SessionKey& key) const;
    bool Contains(const SessionKey& key) const;
    size_t Size() const;

    // Returns false if the key had no session
    bool Teardown(const SessionKey& key);
    void TeardownAll();

private:
    struct Slot {
        std::mutex create_mutex;
        std::shared_ptr<scripting::SandboxSession> session;
    };

    DelegateFactory delegate_factory_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionKey, std::shared_ptr<Slot>, SessionKey::Hash> slots_;
};

/**
 * AnalysisRun - scope of one logical run.
 *
 * Owns the run's dependency bundle (so its address, and therefore its
 * SessionKey, is stable) and tears the run's session down when it goes out
 * of scope, on every exit path. Moving transfers both; the moved-from
 * object no longer owns a run.
 */
class RLMKIT_API AnalysisRun {
public:
    AnalysisRun(SessionRegistry& registry, core::AnalysisContext context,
                core::ExecutionConfig config = core::ExecutionConfig());
    ~AnalysisRun();

    AnalysisRun(const AnalysisRun&) = delete;
    AnalysisRun& operator=(const AnalysisRun&) = delete;
    AnalysisRun(AnalysisRun&& other) noexcept = default;

    const core::RunDependencies& GetDependencies() const { return *deps_; }
    SessionKey GetKey() const { return SessionKey::Of(*deps_); }

private:
    SessionRegistry& registry_;
    std::unique_ptr<core::RunDependencies> deps_;
};

} // namespace rlmkit::tools
