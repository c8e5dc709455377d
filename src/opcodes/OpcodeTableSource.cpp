#include "dotmatrix/opcodes/OpcodeTableSource.hpp"

#include "dotmatrix/opcodes/MCode.hpp"

#include <cctype>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dotmatrix::opcodes {
namespace {

std::vector<std::string> splitTokens(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(ch);
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool isIdentifier(std::string_view text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) != 0) {
        return false;
    }
    for (const char ch : text) {
        if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}


std::optional<std::string> reg8(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kReg8 = {
        {"A", "Reg8::A"},       {"F", "Reg8::F"},        {"B", "Reg8::B"},        {"C", "Reg8::C"},
        {"D", "Reg8::D"},       {"E", "Reg8::E"},        {"H", "Reg8::H"},        {"L", "Reg8::L"},
        {"Z", "Reg8::Z"},       {"W", "Reg8::W"},        {"SPL", "Reg8::SpLow"},  {"SPH", "Reg8::SpHigh"},
        {"PCL", "Reg8::PcLow"}, {"PCH", "Reg8::PcHigh"},
    };
    const auto it = kReg8.find(token);
    if (it == kReg8.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> reg16(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kReg16 = {
        {"AF", "Reg16::AF"}, {"BC", "Reg16::BC"}, {"DE", "Reg16::DE"}, {"HL", "Reg16::HL"},
        {"SP", "Reg16::SP"}, {"PC", "Reg16::PC"}, {"WZ", "Reg16::WZ"},
    };
    const auto it = kReg16.find(token);
    if (it == kReg16.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> address(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kAddress = {
        {"BC", "Address::BC"},          {"DE", "Address::DE"},          {"HL", "Address::HL"},
        {"HL+", "Address::HLIncrement"}, {"HL-", "Address::HLDecrement"}, {"WZ", "Address::WZ"},
        {"WZ+", "Address::WZIncrement"}, {"SP", "Address::SP"},          {"SP+", "Address::SPIncrement"},
        {"SP-", "Address::SPDecrement"}, {"FF00+C", "Address::HighC"},   {"FF00+Z", "Address::HighZ"},
    };
    const auto it = kAddress.find(token);
    if (it == kAddress.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> condition(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kCondition = {
        {"NZ", "Condition::NotZero"},
        {"Z", "Condition::Zero"},
        {"NC", "Condition::NotCarry"},
        {"C", "Condition::Carry"},
    };
    const auto it = kCondition.find(token);
    if (it == kCondition.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> aluOp(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kAluOps = {
        {"ADD", "AluOp::Add"}, {"ADC", "AluOp::Adc"}, {"SUB", "AluOp::Sub"}, {"SBC", "AluOp::Sbc"},
        {"AND", "AluOp::And"}, {"XOR", "AluOp::Xor"}, {"OR", "AluOp::Or"},   {"CP", "AluOp::Cp"},
    };
    const auto it = kAluOps.find(token);
    if (it == kAluOps.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> unaryOp(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kUnaryOps = {
        {"INC", "UnaryOp::Inc"}, {"DEC", "UnaryOp::Dec"}, {"RLC", "UnaryOp::Rlc"},   {"RRC", "UnaryOp::Rrc"},
        {"RL", "UnaryOp::Rl"},   {"RR", "UnaryOp::Rr"},   {"SLA", "UnaryOp::Sla"},   {"SRA", "UnaryOp::Sra"},
        {"SWAP", "UnaryOp::Swap"}, {"SRL", "UnaryOp::Srl"},
    };
    const auto it = kUnaryOps.find(token);
    if (it == kUnaryOps.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> accumulatorOp(std::string_view token) {
    static const std::unordered_map<std::string_view, std::string_view> kAccumulatorOps = {
        {"RLCA", "AccumulatorOp::Rlca"}, {"RRCA", "AccumulatorOp::Rrca"}, {"RLA", "AccumulatorOp::Rla"},
        {"RRA", "AccumulatorOp::Rra"},   {"DAA", "AccumulatorOp::Daa"},   {"CPL", "AccumulatorOp::Cpl"},
        {"SCF", "AccumulatorOp::Scf"},   {"CCF", "AccumulatorOp::Ccf"},
    };
    const auto it = kAccumulatorOps.find(token);
    if (it == kAccumulatorOps.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::optional<std::string> bitIndex(std::string_view token) {
    if (token.size() != 1 || token.front() < '0' || token.front() > '7') {
        return std::nullopt;
    }
    return std::string(token);
}

std::optional<std::string> restartVector(std::string_view token) {
    if (token.size() != 2 || std::isxdigit(static_cast<unsigned char>(token[0])) == 0 ||
        std::isxdigit(static_cast<unsigned char>(token[1])) == 0) {
        return std::nullopt;
    }
    const unsigned value = static_cast<unsigned>(std::stoul(std::string(token), nullptr, 16));
    if ((value & 0x07u) != 0 || value > 0x38u) {
        return std::nullopt;
    }
    return formatOpcodeByte(value);
}

}  // namespace

std::string formatOpcodeByte(unsigned value) {
    return std::format("0x{:02X}", value & 0xFFu);
}

std::expected<ParsedMCode, std::string> parseMCode(std::string_view text) {
    const auto tokens = splitTokens(text);
    if (tokens.empty()) {
        return std::unexpected("empty m-code");
    }

    const std::string_view kind = tokens.front();
    const size_t operandCount = tokens.size() - 1;
    auto operand = [&](size_t index) -> std::string_view { return tokens[index + 1]; };
    auto bad = [&]() { return std::unexpected(std::format("malformed m-code '{}'", text)); };

    auto simple = [&](std::string_view name, std::string_view typeName) -> std::expected<ParsedMCode, std::string> {
        if (kind != name || operandCount != 0) {
            return bad();
        }
        return ParsedMCode{std::format("{}{{}}", typeName)};
    };

    if (kind == Nop::name) {
        return simple(Nop::name, "Nop");
    }
    if (kind == Illegal::name) {
        return simple(Illegal::name, "Illegal");
    }
    if (kind == FetchPrefixed::name) {
        auto parsed = simple(FetchPrefixed::name, "FetchPrefixed");
        if (parsed.has_value()) {
            parsed->prefix = true;
        }
        return parsed;
    }
    if (kind == JumpRelative::name) {
        return simple(JumpRelative::name, "JumpRelative");
    }
    if (kind == PushPcLowAndJump::name) {
        return simple(PushPcLowAndJump::name, "PushPcLowAndJump");
    }
    if (kind == DisableInterrupts::name) {
        return simple(DisableInterrupts::name, "DisableInterrupts");
    }
    if (kind == EnableInterrupts::name) {
        return simple(EnableInterrupts::name, "EnableInterrupts");
    }
    if (kind == ReturnFromInterrupt::name) {
        return simple(ReturnFromInterrupt::name, "ReturnFromInterrupt");
    }

    if (kind == ReadImmediate::name) {
        if (operandCount < 1 || operandCount > 2) {
            return bad();
        }
        const auto dst = reg8(operand(0));
        const auto cond = operandCount == 2 ? condition(operand(1)) : std::optional<std::string>("Condition::Always");
        if (!dst || !cond) {
            return bad();
        }
        return ParsedMCode{std::format("ReadImmediate{{{}, {}}}", *dst, *cond), operandCount == 2};
    }
    if (kind == CheckCondition::name) {
        const auto cond = operandCount == 1 ? condition(operand(0)) : std::nullopt;
        if (!cond) {
            return bad();
        }
        return ParsedMCode{std::format("CheckCondition{{{}}}", *cond), true};
    }
    if (kind == ReadMemory::name) {
        const auto dst = operandCount == 2 ? reg8(operand(0)) : std::nullopt;
        const auto addr = operandCount == 2 ? address(operand(1)) : std::nullopt;
        if (!dst || !addr) {
            return bad();
        }
        return ParsedMCode{std::format("ReadMemory{{{}, {}}}", *dst, *addr)};
    }
    if (kind == WriteMemory::name) {
        const auto addr = operandCount == 2 ? address(operand(0)) : std::nullopt;
        const auto src = operandCount == 2 ? reg8(operand(1)) : std::nullopt;
        if (!addr || !src) {
            return bad();
        }
        return ParsedMCode{std::format("WriteMemory{{{}, {}}}", *addr, *src)};
    }
    if (kind == Load8::name) {
        const auto dst = operandCount == 2 ? reg8(operand(0)) : std::nullopt;
        const auto src = operandCount == 2 ? reg8(operand(1)) : std::nullopt;
        if (!dst || !src) {
            return bad();
        }
        return ParsedMCode{std::format("Load8{{{}, {}}}", *dst, *src)};
    }
    if (kind == Load16::name) {
        const auto dst = operandCount == 2 ? reg16(operand(0)) : std::nullopt;
        const auto src = operandCount == 2 ? reg16(operand(1)) : std::nullopt;
        if (!dst || !src) {
            return bad();
        }
        return ParsedMCode{std::format("Load16{{{}, {}}}", *dst, *src)};
    }
    if (kind == Increment16::name || kind == Decrement16::name || kind == AddHl::name || kind == AddSpOffset::name) {
        const auto reg = operandCount == 1 ? reg16(operand(0)) : std::nullopt;
        if (!reg) {
            return bad();
        }
        std::string_view typeName = "Increment16";
        if (kind == Decrement16::name) {
            typeName = "Decrement16";
        } else if (kind == AddHl::name) {
            typeName = "AddHl";
        } else if (kind == AddSpOffset::name) {
            if (*reg != "Reg16::SP" && *reg != "Reg16::HL") {
                return bad();
            }
            typeName = "AddSpOffset";
        }
        return ParsedMCode{std::format("{}{{{}}}", typeName, *reg)};
    }
    if (kind == PushPcLowAndRestart::name) {
        const auto vector = operandCount == 1 ? restartVector(operand(0)) : std::nullopt;
        if (!vector) {
            return bad();
        }
        return ParsedMCode{std::format("PushPcLowAndRestart{{{}}}", *vector)};
    }
    if (kind == Alu::name) {
        const auto op = operandCount == 2 ? aluOp(operand(0)) : std::nullopt;
        const auto src = operandCount == 2 ? reg8(operand(1)) : std::nullopt;
        if (!op || !src) {
            return bad();
        }
        return ParsedMCode{std::format("Alu{{{}, {}}}", *op, *src)};
    }
    if (kind == Unary::name) {
        const auto op = operandCount == 2 ? unaryOp(operand(0)) : std::nullopt;
        const auto reg = operandCount == 2 ? reg8(operand(1)) : std::nullopt;
        if (!op || !reg) {
            return bad();
        }
        return ParsedMCode{std::format("Unary{{{}, {}}}", *op, *reg)};
    }
    if (kind == UnaryMemory::name) {
        const auto op = operandCount == 2 ? unaryOp(operand(0)) : std::nullopt;
        const auto addr = operandCount == 2 ? address(operand(1)) : std::nullopt;
        if (!op || !addr) {
            return bad();
        }
        return ParsedMCode{std::format("UnaryMemory{{{}, {}}}", *op, *addr)};
    }
    if (kind == Accumulator::name) {
        const auto op = operandCount == 1 ? accumulatorOp(operand(0)) : std::nullopt;
        if (!op) {
            return bad();
        }
        return ParsedMCode{std::format("Accumulator{{{}}}", *op)};
    }
    if (kind == TestBit::name) {
        const auto bit = operandCount == 2 ? bitIndex(operand(0)) : std::nullopt;
        const auto reg = operandCount == 2 ? reg8(operand(1)) : std::nullopt;
        if (!bit || !reg) {
            return bad();
        }
        return ParsedMCode{std::format("TestBit{{{}, {}}}", *bit, *reg)};
    }
    if (kind == ChangeBit::name || kind == ChangeBit::setName) {
        const auto bit = operandCount == 2 ? bitIndex(operand(0)) : std::nullopt;
        const auto reg = operandCount == 2 ? reg8(operand(1)) : std::nullopt;
        if (!bit || !reg) {
            return bad();
        }
        const std::string set = kind == ChangeBit::setName ? "true" : "false";
        return ParsedMCode{std::format("ChangeBit{{{}, {}, {}}}", *bit, set, *reg)};
    }
    if (kind == ChangeBitMemory::name || kind == ChangeBitMemory::setName) {
        const auto bit = operandCount == 2 ? bitIndex(operand(0)) : std::nullopt;
        const auto addr = operandCount == 2 ? address(operand(1)) : std::nullopt;
        if (!bit || !addr) {
            return bad();
        }
        const std::string set = kind == ChangeBitMemory::setName ? "true" : "false";
        return ParsedMCode{std::format("ChangeBitMemory{{{}, {}, {}}}", *bit, set, *addr)};
    }

    return std::unexpected(std::format("unknown m-code '{}'", kind));
}

std::expected<std::vector<OpcodeRecord>, std::string> parseTable(const nlohmann::json& root, TableKind kind) {
    if (!root.is_array()) {
        return std::unexpected("opcode table root must be an array");
    }
    if (root.size() != kOpcodeCount) {
        return std::unexpected(std::format("Must have exactly {} opcodes, found {}", kOpcodeCount, root.size()));
    }

    std::vector<std::optional<OpcodeRecord>> slots(kOpcodeCount);
    std::unordered_set<std::string> seenIds;

    for (const auto& entry : root) {
        if (!entry.is_object()) {
            return std::unexpected("opcode entry must be an object");
        }

        const auto opcodeIt = entry.find("opcode");
        if (opcodeIt == entry.end() || !opcodeIt->is_number_integer()) {
            return std::unexpected("opcode entry is missing an integer 'opcode'");
        }
        const auto opcodeValue = opcodeIt->get<int64_t>();
        if (opcodeValue < 0 || opcodeValue > 0xFF) {
            return std::unexpected(std::format("opcode value out of range: {}", opcodeValue));
        }

        OpcodeRecord record;
        record.opcode = static_cast<uint8_t>(opcodeValue);
        const std::string where = std::format("opcode {}", formatOpcodeByte(record.opcode));

        if (slots[record.opcode].has_value()) {
            return std::unexpected(std::format("duplicate {}", where));
        }

        const auto idIt = entry.find("id");
        if (idIt == entry.end() || !idIt->is_string() || !isIdentifier(idIt->get<std::string>())) {
            return std::unexpected(std::format("{}: 'id' must be a C++ identifier", where));
        }
        record.id = idIt->get<std::string>();
        if (!seenIds.insert(record.id).second) {
            return std::unexpected(std::format("{}: duplicate id '{}'", where, record.id));
        }

        const auto mnemonicIt = entry.find("mnemonic");
        if (mnemonicIt == entry.end() || !mnemonicIt->is_array() || mnemonicIt->empty()) {
            return std::unexpected(std::format("{}: 'mnemonic' must be a non-empty array", where));
        }
        for (const auto& mnemonic : *mnemonicIt) {
            if (!mnemonic.is_string() || mnemonic.get<std::string>().empty()) {
                return std::unexpected(std::format("{}: mnemonics must be non-empty strings", where));
            }
            record.mnemonics.push_back(mnemonic.get<std::string>());
        }

        const auto lengthIt = entry.find("length");
        if (lengthIt == entry.end() || !lengthIt->is_number_integer()) {
            return std::unexpected(std::format("{}: missing integer 'length'", where));
        }
        const auto lengthValue = lengthIt->get<int64_t>();
        if (lengthValue < 1 || lengthValue > 3) {
            return std::unexpected(std::format("{}: 'length' must be 1..3", where));
        }
        record.length = static_cast<uint8_t>(lengthValue);

        const auto mcodeIt = entry.find("mcode");
        if (mcodeIt == entry.end() || !mcodeIt->is_array() || mcodeIt->empty()) {
            return std::unexpected(std::format("{}: 'mcode' must be a non-empty array", where));
        }
        for (size_t i = 0; i < mcodeIt->size(); ++i) {
            const auto& token = (*mcodeIt)[i];
            if (!token.is_string()) {
                return std::unexpected(std::format("{}: m-codes must be strings", where));
            }
            auto parsed = parseMCode(token.get<std::string>());
            if (!parsed.has_value()) {
                return std::unexpected(std::format("{}: {}", where, parsed.error()));
            }
            const bool last = i + 1 == mcodeIt->size();
            if (parsed->conditional && last) {
                return std::unexpected(std::format("{}: a conditional m-code cannot end an instruction", where));
            }
            if (parsed->prefix && (kind != TableKind::Base || mcodeIt->size() != 1)) {
                return std::unexpected(std::format("{}: PREFIX must be the only m-code of a base opcode", where));
            }
            record.mcodeExpressions.push_back(std::move(parsed->expression));
        }

        slots[record.opcode] = std::move(record);
    }

    std::vector<OpcodeRecord> records;
    records.reserve(kOpcodeCount);
    for (auto& slot : slots) {
        // 256 entries with no duplicates cover every byte.
        records.push_back(std::move(*slot));
    }
    return records;
}

}  // namespace dotmatrix::opcodes
