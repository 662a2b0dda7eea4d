#include "rlmkit/scripting/sandbox_session.h"
#include "rlmkit/core/errors.h"
#include "rlmkit/core/text_util.h"
#include "rlmkit/scripting/python_engine.h"
#include "capability_table.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <random>

namespace py = pybind11;
namespace fs = std::filesystem;

namespace rlmkit::scripting {

std::atomic<uint64_t> SandboxSession::next_id_{1};

namespace {

// Filename reported in tracebacks and SyntaxErrors
constexpr const char* kSourceName = "<sandbox>";
constexpr const char* kModuleName = "__sandbox__";
constexpr const char* kDelegateQueryName = "llm_query";

// ============================================================================
// Working directory
// ============================================================================

// The working directory is process-wide. Nested/overlapping scopes keep the
// directory of the most recent entry; the original one comes back when the
// last scope exits. Sandboxed open() resolves relative paths itself, so an
// overlapping session never reads another session's files.
std::mutex g_cwd_mutex;
int g_cwd_depth = 0;
fs::path g_original_cwd;

class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const fs::path& dir) {
        std::lock_guard<std::mutex> lock(g_cwd_mutex);
        std::error_code ec;
        if (g_cwd_depth++ == 0) {
            g_original_cwd = fs::current_path(ec);
            if (ec) {
                spdlog::warn("Cannot read current directory: {}", ec.message());
            }
        }
        fs::current_path(dir, ec);
        if (ec) {
            spdlog::warn("Cannot enter scratch directory {}: {}", dir.string(), ec.message());
        }
    }

    ~ScopedWorkingDirectory() {
        std::lock_guard<std::mutex> lock(g_cwd_mutex);
        if (--g_cwd_depth == 0 && !g_original_cwd.empty()) {
            std::error_code ec;
            fs::current_path(g_original_cwd, ec);
            if (ec) {
                spdlog::warn("Cannot restore working directory {}: {}",
                             g_original_cwd.string(), ec.message());
            }
        }
    }

    ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
    ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;
};

// ============================================================================
// Stream capture
// ============================================================================

// Points this thread's stdout/stderr routers at private buffers. GIL held.
class StreamCapture {
public:
    StreamCapture(const py::object& out, const py::object& err) {
        py::module_ runtime = py::module_::import("_rlmkit_runtime");
        stdout_router_ = runtime.attr("stdout_router");
        stderr_router_ = runtime.attr("stderr_router");
        previous_out_ = stdout_router_.attr("push_target")(out);
        previous_err_ = stderr_router_.attr("push_target")(err);
    }

    ~StreamCapture() {
        try {
            stdout_router_.attr("pop_target")(previous_out_);
            stderr_router_.attr("pop_target")(previous_err_);
        } catch (const py::error_already_set& e) {
            spdlog::error("Failed to restore stream routing: {}", e.what());
        }
    }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

private:
    py::object stdout_router_;
    py::object stderr_router_;
    py::object previous_out_;
    py::object previous_err_;
};

// ============================================================================
// Helpers (GIL held)
// ============================================================================

py::object EvalCodeObject(const py::object& code, const py::dict& globals) {
    PyObject* result = PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr());
    if (result == nullptr) {
        throw py::error_already_set();
    }
    return py::reinterpret_steal<py::object>(result);
}

// Dunder names are interpreter plumbing, never user variables
bool IsReservedName(const std::string& name) {
    return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

bool IsPrintCall(const py::module_& ast, const py::handle& expr_node) {
    py::object value = expr_node.attr("value");
    if (!py::isinstance(value, ast.attr("Call"))) {
        return false;
    }
    py::object func = value.attr("func");
    return py::isinstance(func, ast.attr("Name")) &&
           func.attr("id").cast<std::string>() == "print";
}

// Python's own "TypeName: message" rendering (SyntaxErrors also show the line)
std::string FormatPythonError(const py::object& type, const py::object& value) {
    py::module_ traceback = py::module_::import("traceback");
    py::list lines = traceback.attr("format_exception_only")(type, value);
    std::string text;
    for (py::handle line : lines) {
        text += detail::ToUtf8(line);
    }
    return text;
}

// llm_query(prompt) -> str. Never raises for delegate failures.
py::object MakeDelegateQuery(std::shared_ptr<DelegateClient> delegate) {
    return py::cpp_function(
        [delegate](const py::object& prompt) -> py::str {
            std::string text = detail::ToUtf8(py::str(prompt));
            std::string reply;
            std::string failure;
            {
                py::gil_scoped_release release;
                try {
                    reply = delegate->Complete(text);
                } catch (const std::exception& e) {
                    spdlog::warn("Delegate query to {} failed: {}", delegate->GetModelId(), e.what());
                    failure = std::string("Error: delegate query failed: ") + e.what();
                }
            }
            if (!failure.empty()) {
                return detail::FromUtf8(failure);
            }
            if (reply.empty()) {
                return detail::FromUtf8("Error: delegate model returned an empty response");
            }
            return detail::FromUtf8(reply);
        },
        py::arg("prompt"),
        "Send a prompt to the delegate model and return its reply as text.");
}

} // anonymous namespace

// ============================================================================
// CancellationToken
// ============================================================================

void CancellationToken::Cancel() {
    cancelled_.store(true);
    if (!PythonEngine::IsInterpreterReady()) {
        return;
    }
    // GIL before mutex_, the same order Bind/Unbind see
    py::gil_scoped_acquire acquire;
    std::lock_guard<std::mutex> lock(mutex_);
    if (bound_) {
        PyThreadState_SetAsyncExc(thread_id_, PyExc_TimeoutError);
        spdlog::debug("TimeoutError scheduled in evaluating thread {}", thread_id_);
    }
}

void CancellationToken::Bind(unsigned long thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    thread_id_ = thread_id;
    bound_ = true;
}

void CancellationToken::Unbind() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bound_ && cancelled_.load()) {
        // Drop an exception that was scheduled but never delivered
        PyThreadState_SetAsyncExc(thread_id_, nullptr);
    }
    bound_ = false;
}

// ============================================================================
// SandboxSession::Impl
// ============================================================================

/**
 * Python state of a session. `globals` is the single dict code runs in: the
 * restricted namespace (builtins, module name, llm_query, imported modules)
 * plus the variable store. Names in namespace_names are the namespace part;
 * every other non-dunder binding is a user variable.
 *
 * Members are plain py::object so an Impl can be created without the GIL;
 * every method needs the GIL.
 */
struct SandboxSession::Impl {
    py::object globals;
    py::object builtins;
    py::object delegate_query;
    std::set<std::string> namespace_names;

    py::dict Globals() const { return py::reinterpret_borrow<py::dict>(globals); }

    void Build(const CapabilitySet& capabilities,
               const std::set<std::string>& allowed_modules,
               const fs::path& scratch_dir,
               std::shared_ptr<DelegateClient> delegate) {
        builtins = detail::BuildRestrictedBuiltins(capabilities, allowed_modules, scratch_dir);
        globals = py::dict();
        namespace_names = {"__builtins__", "__name__"};
        if (delegate && capabilities.count(Capability::DelegateQuery)) {
            delegate_query = MakeDelegateQuery(std::move(delegate));
            namespace_names.insert(kDelegateQueryName);
        }
        RestoreNamespace();
    }

    // Undo user rebinding of the namespace entries before each call
    void RestoreNamespace() {
        py::dict g = Globals();
        g["__builtins__"] = builtins;
        g["__name__"] = kModuleName;
        if (delegate_query) {
            g[kDelegateQueryName] = delegate_query;
        }
    }

    // Top-level imports bind into the namespace part, then the rest runs;
    // a trailing bare expression (other than print(...)) is echoed.
    void Evaluate(const std::string& code, const py::object& stdout_target) {
        py::module_ ast = py::module_::import("ast");
        py::object compile = py::module_::import("builtins").attr("compile");
        py::object import_node = ast.attr("Import");
        py::object import_from_node = ast.attr("ImportFrom");

        py::list body = ast.attr("parse")(code, kSourceName, "exec").attr("body");
        py::list imports;
        py::list rest;
        for (py::handle node : body) {
            if (py::isinstance(node, import_node) || py::isinstance(node, import_from_node)) {
                imports.append(node);
            } else {
                rest.append(node);
            }
        }

        auto exec_nodes = [&](const py::list& nodes) {
            py::object module = ast.attr("Module")(nodes, py::list());
            EvalCodeObject(compile(module, kSourceName, "exec"), Globals());
        };

        if (!imports.empty()) {
            std::set<std::string> before = BoundNames();
            for (py::handle node : imports) {
                for (py::handle alias : node.attr("names")) {
                    std::string name = alias.attr("name").cast<std::string>();
                    py::object as_name = alias.attr("asname");
                    if (!as_name.is_none()) {
                        namespace_names.insert(as_name.cast<std::string>());
                    } else if (name != "*") {
                        namespace_names.insert(name.substr(0, name.find('.')));
                    }
                }
            }
            exec_nodes(imports);
            // Star imports bind names the statements do not spell out
            for (const auto& name : BoundNames()) {
                if (!before.count(name)) {
                    namespace_names.insert(name);
                }
            }
        }

        if (rest.empty()) {
            return;
        }

        py::handle last = rest[rest.size() - 1];
        if (!py::isinstance(last, ast.attr("Expr")) || IsPrintCall(ast, last)) {
            exec_nodes(rest);
            return;
        }

        py::object expression;
        try {
            expression = compile(ast.attr("Expression")(last.attr("value")), kSourceName, "eval");
        } catch (const py::error_already_set& e) {
            // Let the statement form report whatever is wrong with it
            spdlog::debug("Trailing expression not compilable on its own: {}", e.what());
            exec_nodes(rest);
            return;
        }

        py::list leading;
        for (size_t i = 0; i + 1 < rest.size(); ++i) {
            leading.append(rest[i]);
        }
        if (!leading.empty()) {
            exec_nodes(leading);
        }
        py::object value = EvalCodeObject(expression, Globals());
        if (!value.is_none()) {
            stdout_target.attr("write")(py::repr(value));
            stdout_target.attr("write")("\n");
        }
    }

    std::set<std::string> BoundNames() const {
        std::set<std::string> names;
        for (auto item : Globals()) {
            if (py::isinstance<py::str>(item.first)) {
                names.insert(detail::ToUtf8(item.first));
            }
        }
        return names;
    }

    std::map<std::string, VariableSnapshot> Snapshot(const py::dict& before, size_t preview_limit) const {
        std::map<std::string, VariableSnapshot> variables;
        for (auto item : Globals()) {
            if (!py::isinstance<py::str>(item.first)) {
                continue;
            }
            std::string name = detail::ToUtf8(item.first);
            if (IsReservedName(name) || namespace_names.count(name)) {
                continue;
            }

            VariableSnapshot snapshot;
            snapshot.type_name = detail::ToUtf8(py::type::handle_of(item.second).attr("__name__"));
            snapshot.preview = core::TruncateText(detail::BoundedRepr(item.second, preview_limit),
                                                  preview_limit, "...");
            if (before.contains(item.first)) {
                py::object prior = before[item.first];
                snapshot.changed = !prior.is(item.second);
            } else {
                snapshot.changed = true;
            }
            variables.emplace(std::move(name), std::move(snapshot));
        }
        return variables;
    }
};

// ============================================================================
// SandboxSession
// ============================================================================

SandboxSession::SandboxSession(const core::AnalysisContext& context,
                               const core::ExecutionConfig& config,
                               std::shared_ptr<DelegateClient> delegate)
    : id_(next_id_.fetch_add(1)),
      config_(config),
      impl_(std::make_unique<Impl>()) {
    config_.Validate();

    if (!PythonEngine::IsInterpreterReady()) {
        throw ConfigError("Python interpreter is not initialized; create a PythonEngine first");
    }

    CapabilitySet capabilities = config_.EffectiveCapabilities();
    if (!context.IsText() &&
        (!capabilities.count(Capability::DynamicImport) || !config_.allowed_modules.count("json"))) {
        throw ConfigError("Structured contexts require the dynamic-import capability "
                          "with 'json' in allowed_modules");
    }

    if (config_.HasDelegate() && !delegate) {
        delegate = CreateDelegateClient(config_);
    }

    CreateScratchDirectory();

    try {
        {
            py::gil_scoped_acquire acquire;
            try {
                impl_->Build(capabilities, config_.allowed_modules, scratch_dir_, delegate);
            } catch (const py::error_already_set& e) {
                throw ConfigError(std::string("Failed to build sandbox namespace: ") + e.what());
            }
        }
        MaterializeContext(context);
    } catch (...) {
        {
            py::gil_scoped_acquire acquire;
            impl_.reset();
        }
        RemoveScratchDirectory();
        throw;
    }

    spdlog::info("Sandbox session {} created (context: {}, size {}, scratch: {})",
                 id_, core::ContextKindToString(context.GetKind()), context.Size(),
                 scratch_dir_.string());
}

SandboxSession::~SandboxSession() {
    Teardown();

    if (PythonEngine::IsInterpreterReady()) {
        py::gil_scoped_acquire acquire;
        impl_.reset();
    } else {
        // Interpreter already finalized; its objects cannot be released any more
        spdlog::warn("Sandbox session {} outlived the Python interpreter", id_);
        Impl* leaked = impl_.release();
        (void)leaked;
    }
}

ExecutionResult SandboxSession::Run(const std::string& code, CancellationToken* cancel) {
    if (closed_.load()) {
        throw SessionClosedError(fmt::format("Sandbox session {} is closed", id_));
    }

    std::unique_lock<std::timed_mutex> lock(run_mutex_);
    if (closed_.load()) {
        throw SessionClosedError(fmt::format("Sandbox session {} is closed", id_));
    }

    uint64_t run_number = ++run_count_;
    if (core::IsBlank(code)) {
        spdlog::debug("Session {} run #{}: empty code, nothing to do", id_, run_number);
        return ExecutionResult();
    }

    ExecutionResult result = ExecuteLocked(code, cancel);
    spdlog::debug("Session {} run #{} {} in {:.3f}s", id_, run_number,
                  result.succeeded ? "succeeded" : "failed", result.elapsed_seconds);
    return result;
}

ExecutionResult SandboxSession::ExecuteLocked(const std::string& code, CancellationToken* cancel) {
    auto start_time = std::chrono::steady_clock::now();

    ExecutionResult result;
    std::string output;
    std::string errors;
    bool failed = false;

    {
        ScopedWorkingDirectory cwd(scratch_dir_);
        py::gil_scoped_acquire acquire;

        impl_->RestoreNamespace();
        py::module_ io = py::module_::import("io");
        py::object out_buffer = io.attr("StringIO")();
        py::object err_buffer = io.attr("StringIO")();
        py::dict before = impl_->Globals().attr("copy")();

        py::object error_type;
        py::object error_value;
        {
            StreamCapture capture(out_buffer, err_buffer);

            if (cancel) {
                cancel->Bind(PyThread_get_thread_ident());
            }
            try {
                if (cancel && cancel->IsCancelled()) {
                    PyErr_SetString(PyExc_TimeoutError, "evaluation cancelled before it started");
                    throw py::error_already_set();
                }
                impl_->Evaluate(code, out_buffer);
            } catch (py::error_already_set& e) {
                failed = true;
                error_type = e.type();
                error_value = e.value();
            } catch (...) {
                if (cancel) {
                    cancel->Unbind();
                }
                throw;
            }
            if (cancel) {
                cancel->Unbind();
            }

            // Bindings made before a fault are kept
            result.variables = impl_->Snapshot(before, config_.variable_preview_chars);
        }

        // Captured text may hold lone surrogates (print(chr(0xD800)))
        output = detail::ToUtf8(out_buffer.attr("getvalue")());
        errors = detail::ToUtf8(err_buffer.attr("getvalue")());
        if (failed) {
            errors += FormatPythonError(error_type, error_value);
        }
    }

    result.succeeded = !failed;
    result.captured_output = core::TruncateText(output, config_.output_truncation_limit, kTruncationMarker);
    result.captured_errors = core::TruncateText(errors, config_.output_truncation_limit, kTruncationMarker);

    auto end_time = std::chrono::steady_clock::now();
    result.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();
    return result;
}

void SandboxSession::Teardown(std::chrono::milliseconds grace) {
    if (closed_.exchange(true)) {
        return;
    }

    std::unique_lock<std::timed_mutex> lock(run_mutex_, std::defer_lock);
    if (!lock.try_lock_for(grace)) {
        spdlog::warn("Session {} still evaluating after {} ms; removing scratch directory anyway",
                     id_, grace.count());
    }

    RemoveScratchDirectory();
    spdlog::info("Sandbox session {} torn down after {} run(s)", id_, run_count_.load());
}

// ===== Scratch directory =====

void SandboxSession::CreateScratchDirectory() {
    std::error_code ec;
    fs::path root = config_.scratch_root.empty() ? fs::temp_directory_path(ec)
                                                 : fs::path(config_.scratch_root);
    if (ec) {
        throw ConfigError("Cannot determine temporary directory: " + ec.message());
    }
    fs::create_directories(root, ec);
    if (ec) {
        throw ConfigError("Cannot create scratch root " + root.string() + ": " + ec.message());
    }

    std::random_device device;
    std::mt19937_64 generator(device());
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = root / fmt::format("rlmkit_session_{}_{:016x}", id_, generator());
        if (fs::create_directory(candidate, ec)) {
            scratch_dir_ = fs::absolute(candidate, ec);
            if (ec) {
                scratch_dir_ = candidate;
            }
            spdlog::debug("Scratch directory {}", scratch_dir_.string());
            return;
        }
        if (ec) {
            throw ConfigError("Cannot create scratch directory under " + root.string() + ": " + ec.message());
        }
    }
    throw ConfigError("Cannot create a unique scratch directory under " + root.string());
}

void SandboxSession::MaterializeContext(const core::AnalysisContext& context) {
    fs::path file;
    std::string payload;
    if (context.IsText()) {
        file = scratch_dir_ / "context.txt";
        payload = context.GetText();
    } else {
        file = scratch_dir_ / "context.json";
        payload = context.GetStructured().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ConfigError("Cannot write context file " + file.string());
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        if (!out) {
            throw ConfigError("Failed writing context file " + file.string());
        }
    }

    // JSON string literals are valid Python string literals
    std::string path_literal = nlohmann::json(file.string()).dump();
    std::string loader;
    if (context.IsText()) {
        loader = fmt::format(
            "with open({}, 'r', encoding='utf-8', errors='replace', newline='') as _context_file:\n"
            "    {} = _context_file.read()\n"
            "del _context_file\n",
            path_literal, kContextVariable);
    } else {
        loader = fmt::format(
            "import json\n"
            "with open({}, 'r', encoding='utf-8') as _context_file:\n"
            "    {} = json.load(_context_file)\n"
            "del _context_file\n",
            path_literal, kContextVariable);
    }

    ExecutionResult loaded = ExecuteLocked(loader, nullptr);
    if (!loaded.succeeded) {
        throw ConfigError("Failed to load context into sandbox: " + loaded.captured_errors);
    }
}

void SandboxSession::RemoveScratchDirectory() {
    if (scratch_dir_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(scratch_dir_, ec);
    if (ec) {
        spdlog::warn("Failed to remove scratch directory {}: {}", scratch_dir_.string(), ec.message());
    } else {
        spdlog::debug("Removed scratch directory {}", scratch_dir_.string());
    }
}

} // namespace rlmkit::scripting
