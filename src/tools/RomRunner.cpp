#include "dotmatrix/common/Log.hpp"
#include "dotmatrix/common/Logger.hpp"
#include "dotmatrix/core/Cartridge.hpp"
#include "dotmatrix/core/DotMatrix.hpp"
#include "dotmatrix/core/EmulatorConfig.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dotmatrix::tools {
namespace {

// JR -2 read as a little endian word: the ROM parks on an infinite self loop when it is done.
constexpr uint16_t kSelfLoopWord = 0xFE18;

struct ToolOptions {
    std::filesystem::path romPath;
    std::optional<std::filesystem::path> configPath;
    std::optional<core::HardwareModel> model;
    std::optional<uint64_t> maxInstructions;
    bool trace = false;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName
        << " <rom.gb> [--model <name>] [--config <file>] [--max-instructions <n>] [--trace]\n";
    out << "\nRuns a ROM until it parks in a JR -2 self loop or the instruction limit is reached.\n";
    out << "\nOptions:\n";
    out << "  --model, -m         dmg | mgb | sgb | sgb2 | cgb | agb | ags (default: from config, else dmg)\n";
    out << "  --config, -c        Emulator config JSON (default: user config when present)\n";
    out << "  --max-instructions  Stop after n instructions (0 = no limit)\n";
    out << "  --trace             Log every executed instruction\n";
    out << "  --help, -h          Show this help\n";
}

std::expected<ToolOptions, std::string> parseArgs(int argc, char** argv) {
    ToolOptions options;
    bool hasRom = false;

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
            printUsage(std::cout, argc > 0 ? argv[0] : "dotmatrix_run");
            std::exit(0);
        }
        if (arg == "--model" || arg == "-m") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.model = core::parseHardwareModel(*value);
            if (!options.model.has_value()) {
                return std::unexpected(std::format("Unknown hardware model '{}'", *value));
            }
            continue;
        }
        if (arg == "--config" || arg == "-c") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.configPath = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--max-instructions") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            try {
                size_t consumed = 0;
                options.maxInstructions = std::stoull(*value, &consumed);
                if (consumed != value->size()) {
                    return std::unexpected(std::format("Invalid --max-instructions value '{}'", *value));
                }
            } catch (const std::exception&) {
                return std::unexpected(std::format("Invalid --max-instructions value '{}'", *value));
            }
            continue;
        }
        if (arg == "--trace") {
            options.trace = true;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        if (hasRom) {
            return std::unexpected("Only one ROM may be given");
        }
        options.romPath = std::filesystem::path(arg);
        hasRom = true;
    }

    if (!hasRom) {
        return std::unexpected("No ROM given");
    }
    return options;
}

std::string traceLine(uint64_t index, const core::DotMatrix& console) {
    const auto& cpu = console.cpu();
    const uint16_t pc = cpu.pc();
    const auto opcode = opcodes::decode(console.bus().read(pc));

    return std::format("{:8} {:04X}  {}  {}", index, pc, opcodes::mnemonic(opcode), cpu.describe());
}

std::expected<void, std::string> run(const ToolOptions& options) {
    auto config = options.configPath.has_value() ? core::loadEmulatorConfig(*options.configPath)
                                                 : core::loadUserEmulatorConfig();
    if (!config.has_value()) {
        return std::unexpected(config.error());
    }
    if (options.model.has_value()) {
        config->model = *options.model;
    }
    if (options.maxInstructions.has_value()) {
        config->maxInstructions = *options.maxInstructions;
    }
    config->trace = config->trace || options.trace;

    auto cartridge = core::loadCartridgeFile(options.romPath);
    if (!cartridge.has_value()) {
        return std::unexpected(cartridge.error());
    }

    core::DotMatrix console(config->model);
    console.load(std::move(*cartridge));
    common::logInfo(std::format("Running '{}' on {}", console.cartridge()->title(), core::modelName(config->model)));

    uint64_t executed = 0;
    while (true) {
        if (console.bus().read16(console.cpu().pc()) == kSelfLoopWord) {
            common::logInfo(std::format("Reached self loop after {} instructions", executed));
            break;
        }
        if (config->maxInstructions != 0 && executed >= config->maxInstructions) {
            common::logInfo(std::format("Instruction limit reached ({})", executed));
            break;
        }
        if (config->trace) {
            common::Logger::log(traceLine(executed, console));
        }
        console.execInstruction();
        ++executed;
    }

    std::cout << console.cpu() << '\n';
    return {};
}

}  // namespace
}  // namespace dotmatrix::tools

int main(int argc, char** argv) {
    auto options = dotmatrix::tools::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        dotmatrix::tools::printUsage(std::cerr, argc > 0 ? argv[0] : "dotmatrix_run");
        return 1;
    }

    dotmatrix::common::Logger::init();
    dotmatrix::common::Logger::log("Starting dotmatrix_run");
    int exitCode = 0;
    try {
        auto result = dotmatrix::tools::run(*options);
        if (!result.has_value()) {
            std::cerr << "Error: " << result.error() << '\n';
            exitCode = 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        exitCode = 1;
    }
    dotmatrix::common::Logger::shutdown();
    return exitCode;
}
