// capability_table.h - Builds restricted builtins from capability tags (internal)
#pragma once

#include "rlmkit/core/capability.h"
#include <pybind11/pybind11.h>
#include <filesystem>
#include <set>
#include <string>

namespace rlmkit::scripting::detail {

namespace py = pybind11;

/**
 * Build the `__builtins__` mapping for one sandbox namespace.
 *
 * Only names contributed by an enabled tag are copied from the real builtins
 * module, which itself is never modified. Denied names (eval, exec, compile,
 * ...) are bound to a placeholder that raises PermissionError when used.
 * With DynamicImport enabled, `__import__` only admits top-level packages in
 * allowed_modules. `open` resolves relative paths against scratch_dir and
 * refuses write modes unless IoWrite is enabled.
 *
 * GIL must be held.
 */
py::dict BuildRestrictedBuiltins(const CapabilitySet& capabilities,
                                 const std::set<std::string>& allowed_modules,
                                 const std::filesystem::path& scratch_dir);

// repr(value) capped at roughly `limit` characters; never raises. GIL must be held.
std::string BoundedRepr(const py::handle& value, size_t limit);

// ===== Text conversion (GIL must be held) =====

// str -> UTF-8. Lone surrogates become backslash escapes instead of failing.
std::string ToUtf8(const py::handle& text);

// UTF-8 -> str. Invalid byte sequences become U+FFFD.
py::str FromUtf8(const std::string& text);

} // namespace rlmkit::scripting::detail
