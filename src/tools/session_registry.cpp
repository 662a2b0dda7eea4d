#include "rlmkit/tools/session_registry.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace rlmkit::tools {

// ============================================================================
// SessionKey
// ============================================================================

SessionKey SessionKey::Of(const core::RunDependencies& deps) {
    return SessionKey(reinterpret_cast<uintptr_t>(&deps));
}

std::string SessionKey::ToString() const {
    return fmt::format("run-{:x}", value_);
}

// ============================================================================
// SessionRegistry
// ============================================================================

SessionRegistry::SessionRegistry(DelegateFactory delegate_factory)
    : delegate_factory_(std::move(delegate_factory)) {
    if (!delegate_factory_) {
        delegate_factory_ = [](const core::ExecutionConfig& config) {
            return scripting::CreateDelegateClient(config);
        };
    }
}

SessionRegistry::~SessionRegistry() {
    TeardownAll();
}

std::shared_ptr<scripting::SandboxSession> SessionRegistry::GetOrCreate(
    const SessionKey& key,
    const ContextFactory& context_factory,
    const ConfigFactory& config_factory) {

    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[key];
        if (!entry) {
            entry = std::make_shared<Slot>();
        }
        slot = entry;
    }

    // Only callers for this key wait here; other keys build in parallel
    std::lock_guard<std::mutex> create_lock(slot->create_mutex);
    if (slot->session) {
        return slot->session;
    }

    try {
        core::ExecutionConfig config = config_factory();
        core::AnalysisContext context = context_factory();
        std::shared_ptr<scripting::DelegateClient> delegate;
        if (config.HasDelegate()) {
            delegate = delegate_factory_(config);
        }
        slot->session = std::make_shared<scripting::SandboxSession>(context, config, std::move(delegate));
    } catch (const std::exception& e) {
        spdlog::error("Failed to create sandbox session for {}: {}", key.ToString(), e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
        throw;
    }

    spdlog::info("Registered session {} for {}", slot->session->GetId(), key.ToString());
    return slot->session;
}

std::shared_ptr<scripting::SandboxSession> SessionRegistry::Find(const SessionKey& key) const {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            return nullptr;
        }
        slot = it->second;
    }
    std::lock_guard<std::mutex> create_lock(slot->create_mutex);
    return slot->session;
}

bool SessionRegistry::Contains(const SessionKey& key) const {
    return Find(key) != nullptr;
}

size_t SessionRegistry::Size() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : slots_) {
            slots.push_back(entry.second);
        }
    }
    size_t count = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> create_lock(slot->create_mutex);
        if (slot->session) {
            ++count;
        }
    }
    return count;
}

bool SessionRegistry::Teardown(const SessionKey& key) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
        slots_.erase(it);
    }

    std::shared_ptr<scripting::SandboxSession> session;
    {
        std::lock_guard<std::mutex> create_lock(slot->create_mutex);
        session = std::move(slot->session);
    }
    if (!session) {
        return false;
    }

    session->Teardown();
    spdlog::info("Unregistered session {} for {}", session->GetId(), key.ToString());
    return true;
}

void SessionRegistry::TeardownAll() {
    std::vector<SessionKey> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : slots_) {
            keys.push_back(entry.first);
        }
    }
    size_t removed = 0;
    for (const auto& key : keys) {
        if (Teardown(key)) {
            ++removed;
        }
    }
    if (removed > 0) {
        spdlog::info("Tore down {} sandbox session(s)", removed);
    }
}

// ============================================================================
// AnalysisRun
// ============================================================================

AnalysisRun::AnalysisRun(SessionRegistry& registry, core::AnalysisContext context,
                         core::ExecutionConfig config)
    : registry_(registry),
      deps_(std::make_unique<core::RunDependencies>(std::move(context), std::move(config))) {
    spdlog::debug("Analysis run {} started", GetKey().ToString());
}

AnalysisRun::~AnalysisRun() {
    if (!deps_) {
        return;
    }
    registry_.Teardown(GetKey());
    spdlog::debug("Analysis run {} finished", GetKey().ToString());
}

} // namespace rlmkit::tools
