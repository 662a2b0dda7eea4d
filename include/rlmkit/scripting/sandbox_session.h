#pragma once

#include "rlmkit/api_export.h"
#include "rlmkit/core/analysis_context.h"
#include "rlmkit/core/execution_config.h"
#include "rlmkit/scripting/delegate_client.h"
#include "rlmkit/scripting/execution_result.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace rlmkit::scripting {

/**
 * CancellationToken - best-effort stop request for one Run() call.
 *
 * While the run is evaluating, the token knows the evaluating thread;
 * Cancel() then raises TimeoutError inside that thread at the next bytecode
 * boundary. Blocking C calls (time.sleep, socket reads) finish first.
 * Cancelling before the run starts makes it fail immediately; cancelling
 * after it finished has no effect.
 */
class RLMKIT_API CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel();
    bool IsCancelled() const { return cancelled_.load(); }

private:
    friend class SandboxSession;

    // Both called with the GIL held
    void Bind(unsigned long thread_id);
    void Unbind();

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    unsigned long thread_id_ = 0;
    bool bound_ = false;
};

/**
 * SandboxSession - restricted, stateful Python namespace for one analysis run.
 *
 * Owns:
 * - a restricted namespace built from the configured capability tags
 * - a variable store that persists across Run() calls
 * - a private scratch directory (holds the materialized context)
 * - a mutex; Run() calls on one session are strictly serialized
 *
 * The constructor materializes the context and loads it as `context` through
 * the ordinary evaluation path; any failure there throws ConfigError.
 * Requires a live PythonEngine. The GIL must NOT be held by the calling thread
 * when constructing, running or destroying a session.
 */
class RLMKIT_API SandboxSession {
public:
    SandboxSession(const core::AnalysisContext& context,
                   const core::ExecutionConfig& config,
                   std::shared_ptr<DelegateClient> delegate = nullptr);
    ~SandboxSession();

    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;

    // Evaluate code. Faults inside the code are reported in the result;
    // only a closed session throws (SessionClosedError).
    ExecutionResult Run(const std::string& code, CancellationToken* cancel = nullptr);

    // Remove the scratch directory and refuse further runs. Idempotent.
    // Waits for an in-flight Run() only up to `grace`.
    void Teardown(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    bool IsClosed() const { return closed_.load(); }
    const std::filesystem::path& GetScratchDirectory() const { return scratch_dir_; }
    const core::ExecutionConfig& GetConfig() const { return config_; }
    uint64_t GetId() const { return id_; }
    uint64_t GetRunCount() const { return run_count_.load(); }

    // Name under which the context is stored
    static constexpr const char* kContextVariable = "context";

    // Appended to output / errors cut at output_truncation_limit
    static constexpr const char* kTruncationMarker = "\n... (output truncated)";

private:
    struct Impl;

    // Evaluation path shared by Run() and context loading; run_mutex_ held
    ExecutionResult ExecuteLocked(const std::string& code, CancellationToken* cancel);

    void CreateScratchDirectory();
    void MaterializeContext(const core::AnalysisContext& context);
    void RemoveScratchDirectory();

    uint64_t id_;
    const core::ExecutionConfig config_;
    std::filesystem::path scratch_dir_;
    std::unique_ptr<Impl> impl_;

    std::timed_mutex run_mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> run_count_{0};

    static std::atomic<uint64_t> next_id_;
};

} // namespace rlmkit::scripting
