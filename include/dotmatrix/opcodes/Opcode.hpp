#pragma once

#include "dotmatrix/opcodes/MCode.hpp"
#include "dotmatrix/opcodes/OpcodeTable.hpp"

#include <cstdint>
#include <span>
#include <string_view>

// OpcodeTable.hpp is written into the build tree by dotmatrix_opcodegen from data/opcodes.json and
// data/cb_opcodes.json. It provides the Opcode and CbOpcode enumerations and decode().

namespace dotmatrix::opcodes {

/// Primary display mnemonic, e.g. "LD BC, n16".
std::string_view mnemonic(Opcode opcode) noexcept;
std::string_view mnemonic(CbOpcode opcode) noexcept;

/// Symbolic identifier as written in the opcode table, e.g. "LD_BC_N16".
std::string_view identifier(Opcode opcode) noexcept;
std::string_view identifier(CbOpcode opcode) noexcept;

/// Instruction length in bytes, including the opcode (and the 0xCB prefix for CbOpcode).
uint8_t length(Opcode opcode) noexcept;
uint8_t length(CbOpcode opcode) noexcept;

/// The m-codes executed for an opcode, one per m-cycle. Never empty.
std::span<const MCode> mcode(Opcode opcode) noexcept;
std::span<const MCode> mcode(CbOpcode opcode) noexcept;

[[nodiscard]] constexpr uint8_t toByte(Opcode opcode) noexcept {
    return static_cast<uint8_t>(opcode);
}

[[nodiscard]] constexpr uint8_t toByte(CbOpcode opcode) noexcept {
    return static_cast<uint8_t>(opcode);
}

}  // namespace dotmatrix::opcodes
