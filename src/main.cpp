// main.cpp - Entry point for rlmkit-repl
// Runs code blocks from stdin against one analysis run, the way an agent would

#include <rlmkit/rlmkit.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <iostream>
#include <string>

namespace {

struct ReplOptions {
    std::string config_path;
    std::string context_path;
    bool verbose = false;
    bool print_tool_definition = false;
    bool show_help = false;
};

// Lines equal to this end one code block
constexpr const char* kBlockSeparator = "---";

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " --context=PATH [options]\n"
              << "\nOptions:\n"
              << "  --context=PATH       Context file (.json files are parsed, anything else is text)\n"
              << "  --config=PATH        Execution config (JSON)\n"
              << "  --tool-definition    Print the execute_code tool definition and exit\n"
              << "  --verbose            Debug logging\n"
              << "  --help               Show this help message\n"
              << "\nCode is read from stdin; a line containing only '" << kBlockSeparator
              << "' ends a block.\n"
              << "Each block runs in the same session, so variables persist.\n"
              << std::endl;
}

ReplOptions ParseArgs(int argc, char** argv) {
    ReplOptions options;
    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--context=", 10) == 0) {
            options.context_path = argv[i] + 10;
        } else if (std::strncmp(argv[i], "--config=", 9) == 0) {
            options.config_path = argv[i] + 9;
        } else if (std::strcmp(argv[i], "--tool-definition") == 0) {
            options.print_tool_definition = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            options.show_help = true;
        } else {
            spdlog::warn("Ignoring unknown argument: {}", argv[i]);
        }
    }
    return options;
}

void RunBlock(rlmkit::tools::CodeExecutionTool& tool,
              const rlmkit::core::RunDependencies& deps,
              const std::string& code) {
    if (code.empty()) {
        return;
    }
    std::cout << tool.ExecuteCode(deps, code) << "\n" << kBlockSeparator << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    ReplOptions options = ParseArgs(argc, argv);
    if (options.show_help) {
        PrintUsage(argv[0]);
        return 0;
    }

    rlmkit::core::ExecutionConfig config;
    try {
        if (!options.config_path.empty()) {
            config = rlmkit::core::LoadExecutionConfig(options.config_path);
        }
    } catch (const rlmkit::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }

    if (options.print_tool_definition) {
        std::cout << rlmkit::tools::CodeExecutionTool::GetToolDefinition(config.HasDelegate()).dump(2)
                  << std::endl;
        return 0;
    }

    if (options.context_path.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    spdlog::info("rlmkit-repl {}", rlmkit::GetVersionString());

    rlmkit::scripting::PythonEngine engine;
    if (!engine.IsInitialized()) {
        spdlog::error("Python interpreter could not be started");
        return 1;
    }
    spdlog::info("Python {}", engine.GetPythonVersion());

    int exit_code = 0;
    {
        rlmkit::tools::SessionRegistry registry;
        rlmkit::tools::CodeExecutionTool tool(registry);

        try {
            rlmkit::tools::AnalysisRun run(registry,
                                           rlmkit::core::AnalysisContext::LoadFromFile(options.context_path),
                                           config);

            std::string block;
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line == kBlockSeparator) {
                    RunBlock(tool, run.GetDependencies(), block);
                    block.clear();
                    continue;
                }
                block += line;
                block += '\n';
            }
            RunBlock(tool, run.GetDependencies(), block);
        } catch (const rlmkit::RlmkitError& e) {
            spdlog::error("{}", e.what());
            exit_code = 1;
        }
    }

    spdlog::info("rlmkit-repl finished");
    return exit_code;
}
