#pragma once

#include "rlmkit/api_export.h"
#include <string>

// Python.h is kept out of this header; the thread state is stored opaquely
struct _ts;

namespace rlmkit::scripting {

/**
 * PythonEngine - owns the process-wide embedded interpreter.
 *
 * Create exactly one before any SandboxSession and destroy it after the last
 * session is gone. After Initialize() the GIL is released so worker threads
 * can evaluate; call AcquireGIL() on the owning thread before touching Python
 * directly from it.
 */
class RLMKIT_API PythonEngine {
public:
    PythonEngine();
    ~PythonEngine();

    PythonEngine(const PythonEngine&) = delete;
    PythonEngine& operator=(const PythonEngine&) = delete;

    bool Initialize();
    void Shutdown();

    bool IsInitialized() const { return initialized_; }

    // Python's sys.version, for startup logs
    std::string GetPythonVersion() const;

    // GIL management for multi-threaded use
    // After initialization, call ReleaseGIL() to allow background threads to use Python
    void ReleaseGIL();
    void AcquireGIL();

    // True once some PythonEngine has initialized the interpreter in this process
    static bool IsInterpreterReady();

private:
    // Routes sys.stdout / sys.stderr through a per-thread capture target
    void InstallStreamRouter();

    bool initialized_ = false;
    bool initialized_by_us_ = false;  // True if we called py::initialize_interpreter()
    _ts* main_thread_state_ = nullptr;  // Saved when releasing GIL
};

} // namespace rlmkit::scripting
