#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace dotmatrix::opcodes {

inline constexpr size_t kOpcodeCount = 256;

enum class TableKind : uint8_t {
    Base,
    Prefixed,
};

/// One validated entry of opcodes.json or cb_opcodes.json. The m-codes are already
/// rendered as C++ initializers for the generated MCode pool.
struct OpcodeRecord {
    uint8_t opcode = 0;
    std::string id;
    std::vector<std::string> mnemonics;
    uint8_t length = 1;
    std::vector<std::string> mcodeExpressions;
};

struct ParsedMCode {
    std::string expression;
    bool conditional = false;
    bool prefix = false;
};

/// "0x" followed by two uppercase hex digits.
std::string formatOpcodeByte(unsigned value);

/// Parse one m-code token line (e.g. "READ Z HL+") into a C++ initializer for MCode.
std::expected<ParsedMCode, std::string> parseMCode(std::string_view text);

/// Validate a whole table. The result is ordered by opcode byte and covers all 256 bytes.
std::expected<std::vector<OpcodeRecord>, std::string> parseTable(const nlohmann::json& root, TableKind kind);

}  // namespace dotmatrix::opcodes
