// test_session_registry.cpp - Session lookup, creation races and run scopes

#include <catch2/catch_test_macros.hpp>
#include <rlmkit/core/errors.h>
#include <rlmkit/tools/session_registry.h>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace rlmkit;
using rlmkit::core::AnalysisContext;
using rlmkit::core::ExecutionConfig;
using rlmkit::core::RunDependencies;
using rlmkit::tools::AnalysisRun;
using rlmkit::tools::SessionKey;
using rlmkit::tools::SessionRegistry;

namespace {

class EchoDelegate : public scripting::DelegateClient {
public:
    std::string Complete(const std::string& prompt) override { return "echo: " + prompt; }
    std::string GetModelId() const override { return "test:echo"; }
};

} // anonymous namespace

TEST_CASE("SessionKey - Identity, not contents", "[registry]") {
    RunDependencies first(AnalysisContext::FromText("same"));
    RunDependencies second(AnalysisContext::FromText("same"));

    REQUIRE(SessionKey::Of(first) == SessionKey::Of(first));
    REQUIRE(SessionKey::Of(first) != SessionKey::Of(second));
    REQUIRE(SessionKey::Of(first).ToString().rfind("run-", 0) == 0);
}

TEST_CASE("SessionRegistry - GetOrCreate is idempotent", "[registry]") {
    SessionRegistry registry;
    RunDependencies deps(AnalysisContext::FromText("data"));
    auto key = SessionKey::Of(deps);

    int context_calls = 0;
    auto context_factory = [&]() { ++context_calls; return deps.context; };
    auto config_factory = [&]() { return deps.config; };

    auto first = registry.GetOrCreate(key, context_factory, config_factory);
    auto second = registry.GetOrCreate(key, context_factory, config_factory);

    REQUIRE(first == second);
    REQUIRE(context_calls == 1);
    REQUIRE(registry.Size() == 1);
    REQUIRE(registry.Contains(key));
    REQUIRE(registry.Find(key) == first);

    SECTION("Teardown removes the session") {
        auto scratch = first->GetScratchDirectory();
        REQUIRE(registry.Teardown(key));
        REQUIRE_FALSE(registry.Contains(key));
        REQUIRE(first->IsClosed());
        REQUIRE_FALSE(std::filesystem::exists(scratch));
        REQUIRE_FALSE(registry.Teardown(key));
    }

    SECTION("Distinct keys get distinct sessions") {
        RunDependencies other(AnalysisContext::FromText("data"));
        auto third = registry.GetOrCreate(SessionKey::Of(other),
                                          [&]() { return other.context; },
                                          [&]() { return other.config; });
        REQUIRE(third != first);
        REQUIRE(registry.Size() == 2);

        registry.TeardownAll();
        REQUIRE(registry.Size() == 0);
        REQUIRE(third->IsClosed());
    }
}

TEST_CASE("SessionRegistry - Concurrent first calls build one session", "[registry][concurrency]") {
    SessionRegistry registry;
    RunDependencies deps(AnalysisContext::FromText("shared"));
    auto key = SessionKey::Of(deps);

    std::atomic<int> builds{0};
    std::vector<std::shared_ptr<scripting::SandboxSession>> sessions(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < sessions.size(); ++i) {
        threads.emplace_back([&, i]() {
            sessions[i] = registry.GetOrCreate(
                key,
                [&]() { ++builds; return deps.context; },
                [&]() { return deps.config; });
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(builds.load() == 1);
    for (const auto& session : sessions) {
        REQUIRE(session == sessions.front());
    }
}

TEST_CASE("SessionRegistry - Failed creation leaves the key free", "[registry]") {
    SessionRegistry registry;
    RunDependencies deps(AnalysisContext::FromText("data"));
    auto key = SessionKey::Of(deps);

    auto bad_config = []() {
        ExecutionConfig config;
        config.evaluation_timeout_seconds = -1.0;
        return config;
    };
    REQUIRE_THROWS_AS(registry.GetOrCreate(key, [&]() { return deps.context; }, bad_config), ConfigError);
    REQUIRE_FALSE(registry.Contains(key));
    REQUIRE(registry.Size() == 0);

    auto session = registry.GetOrCreate(key, [&]() { return deps.context; }, [&]() { return deps.config; });
    REQUIRE(session != nullptr);
}

TEST_CASE("SessionRegistry - Delegate factory is used for delegate configs", "[registry][delegate]") {
    int factory_calls = 0;
    std::string requested_model;
    SessionRegistry registry([&](const ExecutionConfig& config) -> std::shared_ptr<scripting::DelegateClient> {
        ++factory_calls;
        requested_model = config.delegate_model_id.value_or("");
        return std::make_shared<EchoDelegate>();
    });

    SECTION("Plain configs never ask for a client") {
        RunDependencies plain(AnalysisContext::FromText("data"));
        auto session = registry.GetOrCreate(SessionKey::Of(plain),
                                            [&]() { return plain.context; },
                                            [&]() { return plain.config; });
        REQUIRE(factory_calls == 0);
        REQUIRE_FALSE(session->Run("llm_query('x')").succeeded);
    }

    SECTION("Delegate configs get one client and a working llm_query") {
        ExecutionConfig config;
        config.delegate_model_id = "test:model";
        RunDependencies deps(AnalysisContext::FromText("data"), config);
        auto key = SessionKey::Of(deps);

        auto session = registry.GetOrCreate(key, [&]() { return deps.context; }, [&]() { return deps.config; });
        registry.GetOrCreate(key, [&]() { return deps.context; }, [&]() { return deps.config; });
        REQUIRE(factory_calls == 1);
        REQUIRE(requested_model == "test:model");

        auto result = session->Run("print(llm_query('x'))");
        REQUIRE(result.succeeded);
        REQUIRE(result.captured_output == "echo: x\n");
    }
}

TEST_CASE("AnalysisRun - Tears its session down on scope exit", "[registry]") {
    SessionRegistry registry;
    std::filesystem::path scratch;
    SessionKey key = SessionKey::FromValue(0);

    {
        AnalysisRun run(registry, AnalysisContext::FromText("scoped"));
        key = run.GetKey();
        auto session = registry.GetOrCreate(key,
                                            [&]() { return run.GetDependencies().context; },
                                            [&]() { return run.GetDependencies().config; });
        scratch = session->GetScratchDirectory();
        REQUIRE(registry.Contains(key));
    }

    REQUIRE_FALSE(registry.Contains(key));
    REQUIRE_FALSE(std::filesystem::exists(scratch));
}
