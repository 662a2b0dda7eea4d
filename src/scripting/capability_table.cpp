#include "capability_table.h"
#include <spdlog/spdlog.h>

namespace rlmkit::scripting::detail {

namespace {

// Factories for the callables that need Python closures. Loaded once into
// _rlmkit_runtime; every session gets its own instances.
const char* kSandboxHelpersCode = R"PY(
import builtins as _builtins
import os as _os
import reprlib as _reprlib

class DeniedCapability:
    __slots__ = ("_name",)

    def __init__(self, name):
        object.__setattr__(self, "_name", name)

    def __call__(self, *args, **kwargs):
        raise PermissionError(f"'{self._name}' is not available in the sandbox")

    def __getattr__(self, attr):
        raise PermissionError(f"'{self._name}' is not available in the sandbox")

    def __repr__(self):
        return f"<denied: {self._name}>"

def make_import_guard(allowed):
    allowed = frozenset(allowed)
    real_import = _builtins.__import__

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level != 0:
            raise ImportError("Relative imports are not allowed in the sandbox")
        root = name.partition(".")[0]
        if root not in allowed:
            raise ImportError(f"Module '{name}' is not allowed in the sandbox")
        return real_import(name, globals, locals, fromlist, level)

    return guarded_import

def make_open(base_dir, allow_read, allow_write):
    real_open = _builtins.open

    def sandbox_open(file, mode="r", *args, **kwargs):
        if isinstance(file, int):
            raise PermissionError("Opening file descriptors is not allowed in the sandbox")
        path = _os.fsdecode(_os.fspath(file))
        if not _os.path.isabs(path):
            path = _os.path.join(base_dir, path)
        writing = any(flag in mode for flag in "wax+")
        if writing and not allow_write:
            raise PermissionError("Writing files is not allowed in the sandbox")
        if not writing and not allow_read:
            raise PermissionError("Reading files is not allowed in the sandbox")
        return real_open(path, mode, *args, **kwargs)

    return sandbox_open

def bounded_repr(value, limit):
    try:
        if isinstance(value, (str, bytes, bytearray)) and len(value) > limit:
            return repr(value[:limit]) + "..."
        if isinstance(value, (list, tuple, dict, set, frozenset)):
            short = _reprlib.Repr()
            short.maxlevel = 3
            short.maxlist = short.maxtuple = short.maxdict = 100
            short.maxset = short.maxfrozenset = 100
            short.maxstring = limit
            short.maxother = limit
            return short.repr(value)
        return repr(value)
    except Exception as exc:
        return f"<{type(value).__name__}: repr failed: {exc!r}>"
)PY";

py::module_ LoadSandboxHelpers() {
    py::module_ runtime = py::module_::import("_rlmkit_runtime");
    if (!py::hasattr(runtime, "make_import_guard")) {
        py::exec(kSandboxHelpersCode, runtime.attr("__dict__"));
        spdlog::debug("Sandbox helper factories loaded");
    }
    return runtime;
}

void CopyNames(const py::dict& source, py::dict& target, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (source.contains(name.c_str())) {
            target[name.c_str()] = source[name.c_str()];
        }
    }
}

} // anonymous namespace

py::dict BuildRestrictedBuiltins(const CapabilitySet& capabilities,
                                 const std::set<std::string>& allowed_modules,
                                 const std::filesystem::path& scratch_dir) {
    py::module_ runtime = LoadSandboxHelpers();
    py::dict source = py::module_::import("builtins").attr("__dict__");
    py::dict restricted;

    for (Capability capability : capabilities) {
        switch (capability) {
            case Capability::DynamicImport: {
                py::list modules;
                for (const auto& module : allowed_modules) {
                    modules.append(module);
                }
                restricted["__import__"] = runtime.attr("make_import_guard")(modules);
                break;
            }
            case Capability::DelegateQuery:
                // llm_query is bound in the namespace by the session
                break;
            default:
                CopyNames(source, restricted, CapabilityNames(capability));
                break;
        }
    }

    // The raw open() copied above is always replaced by the scratch-aware wrapper
    bool can_read = capabilities.count(Capability::IoRead) > 0;
    bool can_write = capabilities.count(Capability::IoWrite) > 0;
    if (can_read || can_write) {
        restricted["open"] = runtime.attr("make_open")(scratch_dir.string(), can_read, can_write);
    }

    py::object denied = runtime.attr("DeniedCapability");
    for (const auto& name : DeniedBuiltinNames()) {
        restricted[name.c_str()] = denied(name);
    }

    return restricted;
}

std::string BoundedRepr(const py::handle& value, size_t limit) {
    py::module_ runtime = LoadSandboxHelpers();
    return ToUtf8(runtime.attr("bounded_repr")(value, limit));
}

std::string ToUtf8(const py::handle& text) {
    PyObject* encoded = PyUnicode_AsEncodedString(text.ptr(), "utf-8", "backslashreplace");
    if (encoded == nullptr) {
        throw py::error_already_set();
    }
    return py::reinterpret_steal<py::bytes>(encoded).cast<std::string>();
}

py::str FromUtf8(const std::string& text) {
    PyObject* decoded = PyUnicode_DecodeUTF8(text.data(), static_cast<Py_ssize_t>(text.size()), "replace");
    if (decoded == nullptr) {
        throw py::error_already_set();
    }
    return py::reinterpret_steal<py::str>(decoded);
}

} // namespace rlmkit::scripting::detail
