#pragma once

#include "rlmkit/api_export.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rlmkit {

/**
 * Capability - closed set of tags that make up a sandbox namespace.
 *
 * Every name visible to evaluated code comes from exactly one tag, so the
 * boundary can be audited by listing the enabled tags. Core is the baseline
 * (value types, print, exception types) that the other tiers build on.
 */
enum class Capability {
    Core,
    IoRead,
    IoWrite,
    Iteration,
    Introspection,
    Numeric,
    DynamicImport,
    DelegateQuery
};

using CapabilitySet = std::set<Capability>;

// Every tag except DelegateQuery, which is driven by the delegate model id
RLMKIT_API CapabilitySet DefaultCapabilities();

// "core", "io-read", "io-write", "iteration", "introspection", "numeric",
// "dynamic-import", "delegate-query"
RLMKIT_API std::string CapabilityToString(Capability capability);
RLMKIT_API std::optional<Capability> CapabilityFromString(const std::string& name);

// Builtin names contributed by a tag (delegate-query contributes llm_query,
// which lives in the namespace rather than in the builtins mapping)
RLMKIT_API const std::vector<std::string>& CapabilityNames(Capability capability);

// Names that are always bound to an unusable placeholder
RLMKIT_API const std::vector<std::string>& DeniedBuiltinNames();

} // namespace rlmkit
