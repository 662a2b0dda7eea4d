#include "rlmkit/core/capability.h"

namespace rlmkit {

namespace {

struct CapabilityName {
    Capability capability;
    const char* name;
};

const CapabilityName kCapabilityNames[] = {
    {Capability::Core, "core"},
    {Capability::IoRead, "io-read"},
    {Capability::IoWrite, "io-write"},
    {Capability::Iteration, "iteration"},
    {Capability::Introspection, "introspection"},
    {Capability::Numeric, "numeric"},
    {Capability::DynamicImport, "dynamic-import"},
    {Capability::DelegateQuery, "delegate-query"},
};

} // anonymous namespace

CapabilitySet DefaultCapabilities() {
    return {
        Capability::Core,
        Capability::IoRead,
        Capability::IoWrite,
        Capability::Iteration,
        Capability::Introspection,
        Capability::Numeric,
        Capability::DynamicImport
    };
}

std::string CapabilityToString(Capability capability) {
    for (const auto& entry : kCapabilityNames) {
        if (entry.capability == capability) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<Capability> CapabilityFromString(const std::string& name) {
    for (const auto& entry : kCapabilityNames) {
        if (name == entry.name) {
            return entry.capability;
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& CapabilityNames(Capability capability) {
    static const std::vector<std::string> core{
        // Value types
        "str", "int", "float", "bool", "complex", "list", "dict", "set",
        "frozenset", "tuple", "bytes", "bytearray", "memoryview", "slice",
        "object",
        // String / char
        "repr", "ascii", "format", "chr", "ord", "hex", "bin", "oct",
        "hash", "id", "len",
        // Output
        "print",
        // OOP (class statements need __build_class__)
        "__build_class__", "super", "property", "staticmethod", "classmethod",
        // Exceptions (for try/except blocks)
        "BaseException", "Exception", "ValueError", "TypeError", "KeyError",
        "IndexError", "AttributeError", "RuntimeError", "StopIteration",
        "AssertionError", "NotImplementedError", "ZeroDivisionError",
        "ArithmeticError", "LookupError", "NameError", "ImportError",
        "UnicodeDecodeError", "UnicodeEncodeError", "TimeoutError",
        "PermissionError", "KeyboardInterrupt",
        "None", "True", "False", "Ellipsis", "NotImplemented"
    };
    static const std::vector<std::string> io_read{
        "open", "FileNotFoundError", "IsADirectoryError", "OSError", "IOError"
    };
    static const std::vector<std::string> io_write{
        "open", "FileExistsError", "OSError", "IOError"
    };
    static const std::vector<std::string> iteration{
        "range", "enumerate", "zip", "map", "filter", "sorted", "reversed",
        "iter", "next", "any", "all"
    };
    static const std::vector<std::string> introspection{
        "type", "isinstance", "issubclass", "callable", "hasattr", "getattr",
        "setattr", "delattr", "dir", "vars"
    };
    static const std::vector<std::string> numeric{
        "min", "max", "sum", "abs", "round", "pow", "divmod"
    };
    static const std::vector<std::string> dynamic_import{"__import__"};
    static const std::vector<std::string> delegate_query{"llm_query"};

    switch (capability) {
        case Capability::Core: return core;
        case Capability::IoRead: return io_read;
        case Capability::IoWrite: return io_write;
        case Capability::Iteration: return iteration;
        case Capability::Introspection: return introspection;
        case Capability::Numeric: return numeric;
        case Capability::DynamicImport: return dynamic_import;
        case Capability::DelegateQuery: return delegate_query;
    }
    return core;
}

const std::vector<std::string>& DeniedBuiltinNames() {
    static const std::vector<std::string> denied{
        "eval", "exec", "compile", "globals", "locals", "input",
        "breakpoint", "exit", "quit", "help", "__loader__", "__spec__",
        "__builtins__"
    };
    return denied;
}

} // namespace rlmkit
