#include "dotmatrix/conformance/SingleStepTest.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace dotmatrix::conformance {
namespace {

using json = nlohmann::json;

template <typename T>
T parseUnsigned(const json& value, const char* key) {
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::format("'{}' must be an unsigned integer", key));
    }
    const auto raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::format("'{}' is out of range: {}", key, raw));
    }
    return static_cast<T>(raw);
}

template <typename T>
T requireUnsigned(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        throw std::runtime_error(std::format("missing '{}'", key));
    }
    return parseUnsigned<T>(*it, key);
}

CpuState parseState(const json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("state must be an object");
    }

    CpuState state;
    state.pc = requireUnsigned<uint16_t>(value, "pc");
    state.sp = requireUnsigned<uint16_t>(value, "sp");
    state.a = requireUnsigned<uint8_t>(value, "a");
    state.b = requireUnsigned<uint8_t>(value, "b");
    state.c = requireUnsigned<uint8_t>(value, "c");
    state.d = requireUnsigned<uint8_t>(value, "d");
    state.e = requireUnsigned<uint8_t>(value, "e");
    state.f = requireUnsigned<uint8_t>(value, "f");
    state.h = requireUnsigned<uint8_t>(value, "h");
    state.l = requireUnsigned<uint8_t>(value, "l");

    if (const auto it = value.find("ime"); it != value.end() && !it->is_null()) {
        state.ime = it->is_boolean() ? it->get<bool>() : parseUnsigned<uint8_t>(*it, "ime") != 0;
    }
    if (const auto it = value.find("ie"); it != value.end() && !it->is_null()) {
        state.ie = parseUnsigned<uint8_t>(*it, "ie");
    }

    if (const auto it = value.find("ram"); it != value.end()) {
        if (!it->is_array()) {
            throw std::runtime_error("'ram' must be an array");
        }
        for (const auto& entry : *it) {
            if (!entry.is_array() || entry.size() != 2) {
                throw std::runtime_error("'ram' entries must be [address, value] pairs");
            }
            state.ram.emplace_back(parseUnsigned<uint16_t>(entry[0], "ram address"),
                                   parseUnsigned<uint8_t>(entry[1], "ram value"));
        }
    }

    return state;
}

BusCycle parseCycle(const json& value) {
    BusCycle cycle;
    if (value.is_null()) {
        return cycle;
    }
    if (!value.is_array() || value.size() != 3) {
        throw std::runtime_error("cycles must be [address, value, activity] triples");
    }
    if (!value[0].is_null()) {
        cycle.address = parseUnsigned<uint16_t>(value[0], "cycle address");
    }
    if (!value[1].is_null()) {
        cycle.value = parseUnsigned<uint8_t>(value[1], "cycle value");
    }
    if (value[2].is_string()) {
        cycle.activity = value[2].get<std::string>();
    }
    return cycle;
}

TestCase parseCase(const json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("test case must be an object");
    }

    TestCase testCase;
    const auto nameIt = value.find("name");
    if (nameIt == value.end() || !nameIt->is_string()) {
        throw std::runtime_error("test case is missing 'name'");
    }
    testCase.name = nameIt->get<std::string>();

    const auto initialIt = value.find("initial");
    const auto finalIt = value.find("final");
    if (initialIt == value.end() || finalIt == value.end()) {
        throw std::runtime_error(std::format("{}: missing 'initial' or 'final'", testCase.name));
    }

    try {
        testCase.initial = parseState(*initialIt);
        testCase.expected = parseState(*finalIt);
        if (const auto cyclesIt = value.find("cycles"); cyclesIt != value.end() && cyclesIt->is_array()) {
            for (const auto& cycle : *cyclesIt) {
                testCase.cycles.push_back(parseCycle(cycle));
            }
        }
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("{}: {}", testCase.name, e.what()));
    }

    return testCase;
}

}  // namespace

std::expected<std::vector<TestCase>, std::string> parseTestCases(std::string_view text) {
    try {
        const json root = json::parse(text);
        if (!root.is_array()) {
            return std::unexpected("Test vector file must contain a JSON array");
        }

        std::vector<TestCase> cases;
        cases.reserve(root.size());
        for (const auto& item : root) {
            cases.push_back(parseCase(item));
        }
        return cases;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("Malformed test vectors: {}", e.what()));
    } catch (const std::runtime_error& e) {
        return std::unexpected(std::format("Invalid test vectors: {}", e.what()));
    }
}

std::expected<std::vector<TestCase>, std::string> loadTestFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Could not load '{}'", path.string()));
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    auto cases = parseTestCases(contents.str());
    if (!cases.has_value()) {
        return std::unexpected(std::format("{}: {}", path.string(), cases.error()));
    }
    return cases;
}

std::filesystem::path testFilePath(const std::filesystem::path& dir, std::string_view opcode) {
    std::string name(opcode);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return dir / std::format("{}.json", name);
}

core::DotMatrix makeConsole(const CpuState& state) {
    auto console = core::DotMatrix::withFlatBus();
    auto& cpu = console.cpu();
    auto& registers = cpu.registers();

    registers.setA(state.a);
    registers.setB(state.b);
    registers.setC(state.c);
    registers.setD(state.d);
    registers.setE(state.e);
    registers.setF(state.f);
    registers.setH(state.h);
    registers.setL(state.l);

    cpu.setPc(state.pc);
    cpu.setSp(state.sp);
    cpu.setIme(state.ime.value_or(false));

    for (const auto& [address, value] : state.ram) {
        console.bus().write(address, value);
    }

    return console;
}

CpuState captureState(const core::DotMatrix& console, std::span<const RamEntry> addresses) {
    const auto& cpu = console.cpu();
    const auto& registers = cpu.registers();

    CpuState state;
    state.pc = cpu.pc();
    state.sp = cpu.sp();
    state.a = registers.a();
    state.b = registers.b();
    state.c = registers.c();
    state.d = registers.d();
    state.e = registers.e();
    state.f = registers.f();
    state.h = registers.h();
    state.l = registers.l();
    state.ime = cpu.ime();

    state.ram.reserve(addresses.size());
    for (const auto& [address, value] : addresses) {
        (void)value;
        state.ram.emplace_back(address, console.bus().read(address));
    }
    return state;
}

bool statesMatch(const CpuState& expected, const CpuState& actual) {
    return expected.pc == actual.pc && expected.sp == actual.sp && expected.a == actual.a && expected.b == actual.b &&
           expected.c == actual.c && expected.d == actual.d && expected.e == actual.e && expected.f == actual.f &&
           expected.h == actual.h && expected.l == actual.l && expected.ram == actual.ram;
}

CaseResult runTestCase(const TestCase& testCase) {
    CaseResult result;
    auto console = makeConsole(testCase.initial);

    try {
        console.execInstruction();
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    result.actual = captureState(console, testCase.expected.ram);
    result.passed = result.error.empty() && statesMatch(testCase.expected, result.actual);
    return result;
}

std::string formatState(const CpuState& state) {
    std::string out = std::format(
        "State {{\n\tCPU {{ A:{:02X} c:{} h:{} n:{} z:{} BC:{:04X} DE:{:04X} HL:{:04X} SP:{:04X} PC:{:04X} }}\n\tRAM {{ ",
        state.a, (state.f >> 4) & 1, (state.f >> 5) & 1, (state.f >> 6) & 1, (state.f >> 7) & 1,
        (state.b << 8) | state.c, (state.d << 8) | state.e, (state.h << 8) | state.l, state.sp, state.pc);
    for (const auto& [address, value] : state.ram) {
        std::format_to(std::back_inserter(out), "{:04X}:{:02X} ", address, value);
    }
    out += "}\n}";
    return out;
}

std::string describeFailure(const TestCase& testCase, const CaseResult& result) {
    std::string out = std::format("Opcode {}\n", testCase.name);
    if (!result.error.empty()) {
        std::format_to(std::back_inserter(out), "  error: {}\n", result.error);
    }
    std::format_to(std::back_inserter(out), "  initial: {}\n  expected: {}\n  result: {}", formatState(testCase.initial),
                   formatState(testCase.expected), formatState(result.actual));
    return out;
}

}  // namespace dotmatrix::conformance
