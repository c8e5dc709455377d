#pragma once

#include "dotmatrix/core/DotMatrix.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dotmatrix::conformance {

using RamEntry = std::pair<uint16_t, uint8_t>;

/// CPU and memory snapshot as stored in the SingleStepTests sm83 vectors.
struct CpuState {
    uint16_t pc = 0;
    uint16_t sp = 0;
    uint8_t a = 0;
    uint8_t b = 0;
    uint8_t c = 0;
    uint8_t d = 0;
    uint8_t e = 0;
    uint8_t f = 0;
    uint8_t h = 0;
    uint8_t l = 0;
    std::optional<bool> ime;
    std::optional<uint8_t> ie;  ///< Usually only present in the initial state
    std::vector<RamEntry> ram;
};

/// One entry of a vector's cycle list. Address and value are null on cycles without bus activity.
struct BusCycle {
    std::optional<uint16_t> address;
    std::optional<uint8_t> value;
    std::string activity;  ///< e.g. "r-m", "-w-"
};

struct TestCase {
    std::string name;  ///< Opcode then case number, e.g. "00 0000"
    CpuState initial;
    CpuState expected;
    std::vector<BusCycle> cycles;
};

struct CaseResult {
    bool passed = false;
    CpuState actual;
    std::string error;  ///< Set when the emulator raised instead of finishing the instruction
};

/// Parses the contents of one vector file (a JSON array of cases).
std::expected<std::vector<TestCase>, std::string> parseTestCases(std::string_view text);

std::expected<std::vector<TestCase>, std::string> loadTestFile(const std::filesystem::path& path);

/// "<dir>/<opcode>.json" with the opcode lower-cased, e.g. "00" or "cb 46".
std::filesystem::path testFilePath(const std::filesystem::path& dir, std::string_view opcode);

/// A flat-bus console with the registers and RAM of the given state.
core::DotMatrix makeConsole(const CpuState& state);

/// Registers of the console plus the current value of every listed address.
CpuState captureState(const core::DotMatrix& console, std::span<const RamEntry> addresses);

/// Registers and the listed RAM are compared. IME and IE are not.
bool statesMatch(const CpuState& expected, const CpuState& actual);

/// Stages the initial state, runs one instruction and compares against the expected state.
CaseResult runTestCase(const TestCase& testCase);

/// Multi-line dump: CPU registers in the Sm83 dump layout followed by the RAM entries.
std::string formatState(const CpuState& state);

/// Failure report showing the initial, expected and actual states of a case.
std::string describeFailure(const TestCase& testCase, const CaseResult& result);

}  // namespace dotmatrix::conformance
