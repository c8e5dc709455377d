#include "dotmatrix/common/Log.hpp"
#include "dotmatrix/common/Logger.hpp"
#include "dotmatrix/common/Paths.hpp"
#include "dotmatrix/conformance/SingleStepTest.hpp"

#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dotmatrix::tools {
namespace {

struct ToolOptions {
    std::optional<std::filesystem::path> dataDir;
    std::vector<std::string> opcodes;
    bool stopOnFail = false;
};

struct FileSummary {
    size_t passed = 0;
    size_t failed = 0;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [--dir <path>] [--stop-on-fail] <opcode>...\n";
    out << "\nRuns SingleStepTests sm83 vectors, one file per opcode (e.g. 00, 3e, \"cb 46\").\n";
    out << "\nOptions:\n";
    out << "  --dir, -d         Vector directory (default: $DOTMATRIX_TEST_DATA or <exe dir>/test_data/single_step_tests/v1)\n";
    out << "  --stop-on-fail    Stop at the first failing case\n";
    out << "  --help, -h        Show this help\n";
}

std::expected<ToolOptions, std::string> parseArgs(int argc, char** argv) {
    ToolOptions options;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argc > 0 ? argv[0] : "dotmatrix_sst");
            std::exit(0);
        }
        if (arg == "--dir" || arg == "-d") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.dataDir = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--stop-on-fail") {
            options.stopOnFail = true;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        options.opcodes.emplace_back(arg);
    }

    if (options.opcodes.empty()) {
        return std::unexpected("No opcodes given");
    }
    return options;
}

std::expected<FileSummary, std::string> runOpcode(const std::filesystem::path& dir, std::string_view opcode,
                                                  bool stopOnFail) {
    const auto path = conformance::testFilePath(dir, opcode);
    auto cases = conformance::loadTestFile(path);
    if (!cases.has_value()) {
        return std::unexpected(cases.error());
    }

    FileSummary summary;
    bool reportedFailure = false;
    for (const auto& testCase : *cases) {
        const auto result = conformance::runTestCase(testCase);
        if (result.passed) {
            ++summary.passed;
            continue;
        }

        ++summary.failed;
        // The full dump of the first failure is easier to reason about than every mismatch.
        if (!reportedFailure) {
            std::cerr << conformance::describeFailure(testCase, result) << '\n';
            reportedFailure = true;
        }
        if (stopOnFail) {
            break;
        }
    }
    return summary;
}

std::expected<bool, std::string> run(const ToolOptions& options) {
    const auto dir = options.dataDir.value_or(common::testDataDir());
    common::Logger::log(std::format("Running conformance vectors from {}", dir.string()));

    bool allPassed = true;
    for (const auto& opcode : options.opcodes) {
        auto summary = runOpcode(dir, opcode, options.stopOnFail);
        if (!summary.has_value()) {
            return std::unexpected(summary.error());
        }

        const bool passed = summary->failed == 0;
        common::logInfo(std::format("{}: {} passed, {} failed", opcode, summary->passed, summary->failed));
        allPassed = allPassed && passed;
        if (!passed && options.stopOnFail) {
            break;
        }
    }
    return allPassed;
}

}  // namespace
}  // namespace dotmatrix::tools

int main(int argc, char** argv) {
    auto options = dotmatrix::tools::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        dotmatrix::tools::printUsage(std::cerr, argc > 0 ? argv[0] : "dotmatrix_sst");
        return 1;
    }

    dotmatrix::common::Logger::init();
    int exitCode = 0;
    try {
        auto result = dotmatrix::tools::run(*options);
        if (!result.has_value()) {
            std::cerr << "Error: " << result.error() << '\n';
            exitCode = 1;
        } else if (!*result) {
            exitCode = 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        exitCode = 1;
    }
    dotmatrix::common::Logger::shutdown();
    return exitCode;
}
