#include "rlmkit/scripting/python_engine.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <atomic>

namespace py = pybind11;

// Private module holding interpreter-wide sandbox plumbing (stream routers)
PYBIND11_EMBEDDED_MODULE(_rlmkit_runtime, m) {
    m.doc() = "rlmkit sandbox runtime support";
}

namespace rlmkit::scripting {

namespace {

std::atomic<bool> g_interpreter_ready{false};

// Each router forwards writes to a per-thread target when one is pushed,
// otherwise to the stream it replaced. This keeps capture private to the
// thread running a session even when several sessions interleave on the GIL.
const char* kStreamRouterCode = R"PY(
import sys
import threading

class StreamRouter:
    def __init__(self, fallback):
        self._fallback = fallback
        self._local = threading.local()

    def push_target(self, target):
        previous = getattr(self._local, "target", None)
        self._local.target = target
        return previous

    def pop_target(self, previous):
        self._local.target = previous

    def _current(self):
        target = getattr(self._local, "target", None)
        return target if target is not None else self._fallback

    def write(self, text):
        return self._current().write(text)

    def writelines(self, lines):
        for line in lines:
            self.write(line)

    def flush(self):
        current = self._current()
        if current is not None and hasattr(current, "flush"):
            current.flush()

    def isatty(self):
        return False

    def __getattr__(self, name):
        return getattr(self._current(), name)

stdout_router = StreamRouter(sys.stdout)
stderr_router = StreamRouter(sys.stderr)
sys.stdout = stdout_router
sys.stderr = stderr_router
)PY";

} // anonymous namespace

PythonEngine::PythonEngine() : initialized_(false), main_thread_state_(nullptr) {
    Initialize();
}

PythonEngine::~PythonEngine() {
    Shutdown();
}

bool PythonEngine::Initialize() {
    if (initialized_) {
        return true;
    }

    try {
        // Check if Python is already initialized (by another PythonEngine instance)
        if (Py_IsInitialized()) {
            spdlog::info("Python interpreter already initialized (reusing existing)");
            initialized_ = true;
            initialized_by_us_ = false;  // We didn't initialize it, so don't finalize
            {
                py::gil_scoped_acquire acquire;
                InstallStreamRouter();
            }
            g_interpreter_ready.store(true);
            return true;
        }

        py::initialize_interpreter();
        initialized_ = true;
        initialized_by_us_ = true;  // We initialized it, so we'll finalize it

        InstallStreamRouter();
        spdlog::info("Python interpreter initialized ({})", GetPythonVersion());

        // Release the GIL so worker threads can evaluate sandboxed code
        ReleaseGIL();
        g_interpreter_ready.store(true);
        spdlog::debug("GIL released for multi-threaded use");

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize Python: {}", e.what());
        return false;
    }
}

void PythonEngine::Shutdown() {
    if (initialized_ && initialized_by_us_) {
        // Reacquire the GIL before finalizing
        AcquireGIL();
        g_interpreter_ready.store(false);
        py::finalize_interpreter();
        initialized_ = false;
        main_thread_state_ = nullptr;
        spdlog::info("Python interpreter finalized");
    } else if (initialized_) {
        // We're using a shared interpreter, just mark as not initialized
        initialized_ = false;
    }
}

bool PythonEngine::IsInterpreterReady() {
    return g_interpreter_ready.load() && Py_IsInitialized();
}

std::string PythonEngine::GetPythonVersion() const {
    if (!initialized_) {
        return "";
    }
    // Py_GetVersion is safe without the GIL
    std::string version = Py_GetVersion();
    size_t space = version.find(' ');
    return space == std::string::npos ? version : version.substr(0, space);
}

void PythonEngine::ReleaseGIL() {
    if (main_thread_state_ == nullptr) {
        // Save the current thread state and release the GIL
        main_thread_state_ = PyEval_SaveThread();
    }
}

void PythonEngine::AcquireGIL() {
    if (main_thread_state_ != nullptr) {
        // Restore the thread state and reacquire the GIL
        PyEval_RestoreThread(main_thread_state_);
        main_thread_state_ = nullptr;
    }
}

void PythonEngine::InstallStreamRouter() {
    py::module_ runtime = py::module_::import("_rlmkit_runtime");
    if (py::hasattr(runtime, "stdout_router")) {
        return;
    }
    py::exec(kStreamRouterCode, runtime.attr("__dict__"));
    spdlog::debug("Per-thread stdout/stderr routing installed");
}

} // namespace rlmkit::scripting
