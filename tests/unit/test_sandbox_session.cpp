// test_sandbox_session.cpp - Evaluation, state persistence and sandbox boundary tests

#include <catch2/catch_test_macros.hpp>
#include <rlmkit/core/errors.h>
#include <rlmkit/scripting/sandbox_session.h>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

using namespace rlmkit;
using rlmkit::core::AnalysisContext;
using rlmkit::core::ExecutionConfig;
using rlmkit::scripting::CancellationToken;
using rlmkit::scripting::ExecutionResult;
using rlmkit::scripting::SandboxSession;

namespace {

bool Contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

} // anonymous namespace

// ========== Evaluation ==========

TEST_CASE("SandboxSession - Variables persist across runs", "[session]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    auto first = session.Run("x = 41");
    REQUIRE(first.succeeded);
    REQUIRE(first.captured_output.empty());

    auto second = session.Run("print(x + 1)");
    REQUIRE(second.succeeded);
    REQUIRE(second.captured_output == "42\n");

    SECTION("Functions see globals bound by later runs") {
        REQUIRE(session.Run("def scale(n):\n    return n * factor").succeeded);
        REQUIRE(session.Run("factor = 3").succeeded);
        REQUIRE(session.Run("scale(2)").captured_output == "6\n");
    }

    SECTION("Classes can be defined and used") {
        auto result = session.Run("class Point:\n    def __init__(self, x):\n        self.x = x\n"
                                  "print(Point(7).x)");
        REQUIRE(result.succeeded);
        REQUIRE(result.captured_output == "7\n");
    }

    REQUIRE(session.GetRunCount() >= 2);
}

TEST_CASE("SandboxSession - Trailing expression echo", "[session]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    SECTION("Bare expression is echoed with repr") {
        auto result = session.Run("1 + 1");
        REQUIRE(result.succeeded);
        REQUIRE(result.captured_output == "2\n");
    }

    SECTION("Strings echo as their repr") {
        REQUIRE(session.Run("'a' + 'b'").captured_output == "'ab'\n");
    }

    SECTION("Echo follows earlier output") {
        auto result = session.Run("print('first')\nvalue = 10\nvalue * 2");
        REQUIRE(result.captured_output == "first\n20\n");
    }

    SECTION("print() as the last statement is not echoed again") {
        REQUIRE(session.Run("print('once')").captured_output == "once\n");
    }

    SECTION("Assignments and None produce no echo") {
        REQUIRE(session.Run("y = 5").captured_output.empty());
        REQUIRE(session.Run("None").captured_output.empty());
    }

    SECTION("Control-flow blocks are not echoed") {
        REQUIRE(session.Run("for i in range(2):\n    i").captured_output.empty());
    }
}

TEST_CASE("SandboxSession - Text context with imports", "[session]") {
    SandboxSession session(AnalysisContext::FromText("alpha\nbeta\nMAGIC=42\n"), ExecutionConfig());

    auto result = session.Run("import re\nm = re.search(r'MAGIC=(\\d+)', context)\nprint(m.group(1))");
    REQUIRE(result.succeeded);
    REQUIRE(result.captured_output == "42\n");

    SECTION("Imported modules stay available") {
        REQUIRE(session.Run("print(re.sub('a', 'o', 'banana'))").captured_output == "bonono\n");
    }

    SECTION("Modules are not reported as variables") {
        REQUIRE(result.variables.count("re") == 0);
        REQUIRE(result.variables.count("m") == 1);
    }
}

TEST_CASE("SandboxSession - Structured context", "[session]") {
    nlohmann::json data = {{"users", {{{"name", "ada"}}, {{"name", "linus"}}}}};
    SandboxSession session(AnalysisContext::FromJson(data), ExecutionConfig());

    auto result = session.Run("print(len(context['users']), context['users'][1]['name'])");
    REQUIRE(result.succeeded);
    REQUIRE(result.captured_output == "2 linus\n");

    REQUIRE(std::filesystem::exists(session.GetScratchDirectory() / "context.json"));
}

TEST_CASE("SandboxSession - Structured context needs json import", "[session]") {
    ExecutionConfig config;
    config.allowed_modules = {"re"};

    REQUIRE_THROWS_AS(SandboxSession(AnalysisContext::FromJson({1, 2}), config), ConfigError);
}

TEST_CASE("SandboxSession - Output truncation", "[session]") {
    ExecutionConfig config;
    config.output_truncation_limit = 100;
    SandboxSession session(AnalysisContext::FromText("data"), config);

    auto result = session.Run("print('a' * 500)");
    REQUIRE(result.succeeded);
    REQUIRE(result.captured_output == std::string(100, 'a') + SandboxSession::kTruncationMarker);

    SECTION("Output at the limit is untouched") {
        auto exact = session.Run("print('b' * 99)");
        REQUIRE(exact.captured_output == std::string(99, 'b') + "\n");
    }
}

// ========== Faults ==========

TEST_CASE("SandboxSession - Faults are reported, not thrown", "[session][errors]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    SECTION("Runtime error") {
        auto result = session.Run("1 / 0");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(result.captured_errors == "ZeroDivisionError: division by zero\n");
    }

    SECTION("Syntax error") {
        auto result = session.Run("x = (");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "SyntaxError"));
        REQUIRE(Contains(result.captured_errors, "<sandbox>"));
    }

    SECTION("Bindings made before the fault are kept") {
        auto result = session.Run("kept = 1\nraise ValueError('boom')");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "ValueError: boom"));
        REQUIRE(session.Run("print(kept)").captured_output == "1\n");
    }

    SECTION("Output printed before the fault is kept") {
        auto result = session.Run("print('partial')\nundefined_name");
        REQUIRE(result.captured_output == "partial\n");
        REQUIRE(Contains(result.captured_errors, "NameError"));
    }

    SECTION("Empty code is a successful no-op") {
        auto result = session.Run("   \n");
        REQUIRE(result.succeeded);
        REQUIRE(result.captured_output.empty());
        REQUIRE(result.captured_errors.empty());
    }
}

TEST_CASE("SandboxSession - Lone surrogates are escaped, not thrown", "[session][errors]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    SECTION("Printed output") {
        ExecutionResult result;
        REQUIRE_NOTHROW(result = session.Run("print(chr(0xD800))"));
        REQUIRE(result.succeeded);
        REQUIRE(result.captured_output == "\\ud800\n");
    }

    SECTION("Exception message") {
        ExecutionResult result;
        REQUIRE_NOTHROW(result = session.Run("raise ValueError('\\ud800')"));
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(result.captured_errors == "ValueError: \\ud800\n");
    }

    SECTION("Variable name and value") {
        ExecutionResult result;
        REQUIRE_NOTHROW(result = session.Run("vars()['\\ud800'] = 1\nodd = chr(0xDC00)"));
        REQUIRE(result.succeeded);
        REQUIRE(result.variables.count("\\ud800") == 1);
        REQUIRE(result.variables.at("odd").preview == "'\\udc00'");
    }

    SECTION("The session keeps working") {
        session.Run("print(chr(0xD800))");
        REQUIRE(session.Run("print('ok')").captured_output == "ok\n");
    }
}

// ========== Sandbox boundary ==========

TEST_CASE("SandboxSession - Denied capabilities", "[session][sandbox]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    SECTION("eval, exec and compile raise PermissionError") {
        for (const char* code : {"eval('1 + 1')", "exec('x = 1')", "compile('1', 'f', 'eval')"}) {
            auto result = session.Run(code);
            REQUIRE_FALSE(result.succeeded);
            REQUIRE(Contains(result.captured_errors, "PermissionError"));
        }
    }

    SECTION("The session keeps working after a denied call") {
        REQUIRE_FALSE(session.Run("globals()").succeeded);
        REQUIRE(session.Run("print('still alive')").captured_output == "still alive\n");
    }

    SECTION("Modules outside the whitelist cannot be imported") {
        for (const char* code : {"import os", "import subprocess", "from sys import modules", "import os.path"}) {
            auto result = session.Run(code);
            REQUIRE_FALSE(result.succeeded);
            REQUIRE(Contains(result.captured_errors, "ImportError"));
        }
    }

    SECTION("Builtins module is not importable") {
        auto result = session.Run("import builtins");
        REQUIRE_FALSE(result.succeeded);
    }

    SECTION("The builtins table only holds restricted names") {
        auto result = session.Run("print(type(__builtins__).__name__, 'open' in __builtins__, "
                                  "'SystemExit' in __builtins__)");
        REQUIRE(result.succeeded);
        REQUIRE(result.captured_output == "dict True False\n");
    }

    SECTION("Denied names reached through __builtins__ still raise") {
        auto result = session.Run("__builtins__['eval']('1')");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "PermissionError"));
    }

    SECTION("Rebinding __builtins__ is undone on the next call") {
        REQUIRE(session.Run("__builtins__ = None").succeeded);
        REQUIRE(session.Run("print(len('abc'))").captured_output == "3\n");
        REQUIRE_FALSE(session.Run("__builtins__['exec']('x = 1')").succeeded);
    }

    SECTION("llm_query is unbound without a delegate") {
        auto result = session.Run("llm_query('hello')");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "NameError"));
    }
}

TEST_CASE("SandboxSession - Disabled capability tiers", "[session][sandbox]") {
    ExecutionConfig config;
    config.capabilities.erase(Capability::Numeric);
    config.capabilities.erase(Capability::IoWrite);
    config.capabilities.erase(Capability::DynamicImport);
    SandboxSession session(AnalysisContext::FromText("data"), config);

    SECTION("Numeric names are missing") {
        auto result = session.Run("sum([1, 2])");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "NameError"));
    }

    SECTION("Writing files is refused") {
        auto result = session.Run("open('out.txt', 'w')");
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "PermissionError"));
    }

    SECTION("Reading files still works") {
        REQUIRE(session.Run("print(open('context.txt').read())").captured_output == "data\n");
    }

    SECTION("Imports fail without dynamic-import") {
        REQUIRE_FALSE(session.Run("import re").succeeded);
    }
}

TEST_CASE("SandboxSession - Scratch directory", "[session][sandbox]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());
    auto scratch = session.GetScratchDirectory();

    REQUIRE(std::filesystem::is_directory(scratch));
    REQUIRE(std::filesystem::exists(scratch / "context.txt"));

    auto write = session.Run("with open('notes.txt', 'w') as f:\n    f.write('hi')");
    REQUIRE(write.succeeded);
    REQUIRE(std::filesystem::exists(scratch / "notes.txt"));
    REQUIRE(session.Run("print(open('notes.txt').read())").captured_output == "hi\n");
}

TEST_CASE("SandboxSession - Sessions are isolated", "[session][sandbox]") {
    SandboxSession first(AnalysisContext::FromText("one"), ExecutionConfig());
    SandboxSession second(AnalysisContext::FromText("two"), ExecutionConfig());

    REQUIRE(first.Run("secret = 1").succeeded);

    auto result = second.Run("print(secret)");
    REQUIRE_FALSE(result.succeeded);
    REQUIRE(Contains(result.captured_errors, "NameError"));

    REQUIRE(first.Run("print(context)").captured_output == "one\n");
    REQUIRE(second.Run("print(context)").captured_output == "two\n");
    REQUIRE(first.GetScratchDirectory() != second.GetScratchDirectory());
}

TEST_CASE("SandboxSession - Concurrent sessions capture their own output", "[session][concurrency]") {
    SandboxSession first(AnalysisContext::FromText("one"), ExecutionConfig());
    SandboxSession second(AnalysisContext::FromText("two"), ExecutionConfig());

    const char* code = "for i in range(200):\n    print(context)";
    auto a = std::async(std::launch::async, [&]() { return first.Run(code); });
    auto b = std::async(std::launch::async, [&]() { return second.Run(code); });

    auto result_a = a.get();
    auto result_b = b.get();

    std::string expected_a;
    std::string expected_b;
    for (int i = 0; i < 200; ++i) {
        expected_a += "one\n";
        expected_b += "two\n";
    }
    REQUIRE(result_a.captured_output == expected_a);
    REQUIRE(result_b.captured_output == expected_b);
}

// ========== Variable snapshots ==========

TEST_CASE("SandboxSession - Variable snapshots", "[session]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    auto first = session.Run("items = [1, 2, 3]");
    REQUIRE(first.variables.at("items").changed);
    REQUIRE(first.variables.at("items").type_name == "list");
    REQUIRE(first.variables.at("items").preview == "[1, 2, 3]");
    REQUIRE_FALSE(first.variables.at("context").changed);

    auto second = session.Run("other = 'x'");
    REQUIRE_FALSE(second.variables.at("items").changed);
    REQUIRE(second.variables.at("other").changed);

    SECTION("Rebinding marks a variable changed") {
        REQUIRE(session.Run("items = [4]").variables.at("items").changed);
    }

    SECTION("del removes a variable") {
        auto removed = session.Run("del items");
        REQUIRE(removed.succeeded);
        REQUIRE(removed.variables.count("items") == 0);
        REQUIRE_FALSE(session.Run("items").succeeded);
    }
}

TEST_CASE("SandboxSession - Variable previews are bounded", "[session]") {
    ExecutionConfig config;
    config.variable_preview_chars = 50;
    SandboxSession session(AnalysisContext::FromText("data"), config);

    auto result = session.Run("big = 'z' * 10000");
    REQUIRE(result.variables.at("big").preview.size() <= 60);
}

// ========== Cancellation and teardown ==========

TEST_CASE("SandboxSession - Cancellation", "[session][cancel]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());

    SECTION("A token cancelled up front stops the run") {
        CancellationToken token;
        token.Cancel();
        auto result = session.Run("ran = True", &token);
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "TimeoutError"));
    }

    SECTION("A running loop is interrupted") {
        CancellationToken token;
        auto pending = std::async(std::launch::async, [&]() {
            return session.Run("count = 0\nwhile True:\n    count += 1", &token);
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.Cancel();

        REQUIRE(pending.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        auto result = pending.get();
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(Contains(result.captured_errors, "TimeoutError"));

        // State from the interrupted run is kept
        REQUIRE(session.Run("print(count > 0)").captured_output == "True\n");
    }
}

TEST_CASE("SandboxSession - Teardown", "[session]") {
    SandboxSession session(AnalysisContext::FromText("data"), ExecutionConfig());
    auto scratch = session.GetScratchDirectory();

    session.Teardown();
    REQUIRE(session.IsClosed());
    REQUIRE_FALSE(std::filesystem::exists(scratch));
    REQUIRE_THROWS_AS(session.Run("1"), SessionClosedError);

    REQUIRE_NOTHROW(session.Teardown());
}
