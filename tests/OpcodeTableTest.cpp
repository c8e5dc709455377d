#include "dotmatrix/opcodes/Opcode.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <variant>

namespace dotmatrix::opcodes {
namespace {

constexpr std::array<uint8_t, 13> kUnmodelledOpcodes = {0x10, 0x76, 0xD3, 0xDB, 0xDD, 0xE3, 0xE4,
                                                        0xEB, 0xEC, 0xED, 0xF4, 0xFC, 0xFD};

bool isIllegal(Opcode opcode) {
    const auto sequence = mcode(opcode);
    return std::any_of(sequence.begin(), sequence.end(),
                       [](const MCode& step) { return std::holds_alternative<Illegal>(step); });
}

bool touchesPc(const MCode& step) {
    return std::visit(overloaded{
                          [](const ReadImmediate&) { return true; },
                          [](const FetchPrefixed&) { return true; },
                          [](const JumpRelative&) { return true; },
                          [](const PushPcLowAndJump&) { return true; },
                          [](const PushPcLowAndRestart&) { return true; },
                          [](const ReturnFromInterrupt&) { return true; },
                          [](const Load16& op) { return op.dst == Reg16::PC; },
                          [](const Load8& op) { return op.dst == Reg8::PcLow || op.dst == Reg8::PcHigh; },
                          [](const auto&) { return false; },
                      },
                      step);
}

bool isConditional(const MCode& step) {
    if (const auto* read = std::get_if<ReadImmediate>(&step)) {
        return read->condition != Condition::Always;
    }
    return std::holds_alternative<CheckCondition>(step);
}

TEST(OpcodeTableTest, DecodeCoversEveryByte) {
    for (unsigned byte = 0; byte < 256; ++byte) {
        const auto value = static_cast<uint8_t>(byte);
        EXPECT_EQ(toByte(decode(value)), value);
        EXPECT_EQ(toByte(decodePrefixed(value)), value);
        EXPECT_FALSE(mcode(decode(value)).empty()) << "opcode " << byte;
        EXPECT_FALSE(mcode(decodePrefixed(value)).empty()) << "cb opcode " << byte;
        EXPECT_FALSE(mnemonic(decode(value)).empty());
        EXPECT_FALSE(identifier(decodePrefixed(value)).empty());
    }
}

TEST(OpcodeTableTest, MnemonicsAndLengths) {
    EXPECT_EQ(mnemonic(Opcode::LD_BC_N16), "LD BC, n16");
    EXPECT_EQ(identifier(Opcode::LD_BC_N16), "LD_BC_N16");
    EXPECT_EQ(length(Opcode::LD_BC_N16), 3);

    EXPECT_EQ(mnemonic(Opcode::LD_MHLI_A), "LD [HL+], A");
    EXPECT_EQ(length(Opcode::LD_MHLI_A), 1);

    EXPECT_EQ(mnemonic(CbOpcode::BIT_7_H), "BIT 7, H");
    EXPECT_EQ(length(CbOpcode::BIT_7_H), 2);

    EXPECT_EQ(decode(0xCB), Opcode::PREFIX);
    EXPECT_EQ(decodePrefixed(0x7C), CbOpcode::BIT_7_H);
}

TEST(OpcodeTableTest, LengthsAreInRange) {
    for (unsigned byte = 0; byte < 256; ++byte) {
        const auto base = length(decode(static_cast<uint8_t>(byte)));
        EXPECT_GE(base, 1);
        EXPECT_LE(base, 3);
        EXPECT_EQ(length(decodePrefixed(static_cast<uint8_t>(byte))), 2);
    }
}

TEST(OpcodeTableTest, OnlyUnmodelledOpcodesAreIllegal) {
    for (unsigned byte = 0; byte < 256; ++byte) {
        const auto value = static_cast<uint8_t>(byte);
        const bool expected =
            std::find(kUnmodelledOpcodes.begin(), kUnmodelledOpcodes.end(), value) != kUnmodelledOpcodes.end();
        EXPECT_EQ(isIllegal(decode(value)), expected) << "opcode " << byte;
    }
}

TEST(OpcodeTableTest, PrefixIsASingleMCode) {
    const auto sequence = mcode(Opcode::PREFIX);
    ASSERT_EQ(sequence.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<FetchPrefixed>(sequence.front()));

    for (unsigned byte = 0; byte < 256; ++byte) {
        const auto value = static_cast<uint8_t>(byte);
        if (value == 0xCB) {
            continue;
        }
        for (const auto& step : mcode(decode(value))) {
            EXPECT_FALSE(std::holds_alternative<FetchPrefixed>(step)) << "opcode " << byte;
        }
    }
}

TEST(OpcodeTableTest, ConditionsNeverEndAnInstruction) {
    for (unsigned byte = 0; byte < 256; ++byte) {
        const auto value = static_cast<uint8_t>(byte);
        EXPECT_FALSE(isConditional(mcode(decode(value)).back())) << "opcode " << byte;
        EXPECT_FALSE(isConditional(mcode(decodePrefixed(value)).back())) << "cb opcode " << byte;
    }
}

// The next opcode is fetched before the last m-code runs, so only single m-code jumps may move PC there.
TEST(OpcodeTableTest, LastMCodeLeavesPcAlone) {
    for (unsigned byte = 0; byte < 256; ++byte) {
        const auto sequence = mcode(decode(static_cast<uint8_t>(byte)));
        if (sequence.size() > 1) {
            EXPECT_FALSE(touchesPc(sequence.back())) << "opcode " << byte;
        }
        for (const auto& step : mcode(decodePrefixed(static_cast<uint8_t>(byte)))) {
            EXPECT_FALSE(touchesPc(step)) << "cb opcode " << byte;
        }
    }
}

TEST(OpcodeTableTest, SequencesFollowTheTables) {
    const auto jp = mcode(Opcode::JP_A16);
    ASSERT_EQ(jp.size(), 4u);
    EXPECT_EQ(jp[0], MCode(ReadImmediate{Reg8::Z, Condition::Always}));
    EXPECT_EQ(jp[1], MCode(ReadImmediate{Reg8::W, Condition::Always}));
    EXPECT_EQ(jp[2], MCode(Load16{Reg16::PC, Reg16::WZ}));
    EXPECT_EQ(jp[3], MCode(Nop{}));

    const auto jpHl = mcode(Opcode::JP_HL);
    ASSERT_EQ(jpHl.size(), 1u);
    EXPECT_EQ(jpHl[0], MCode(Load16{Reg16::PC, Reg16::HL}));

    EXPECT_EQ(mcode(CbOpcode::BIT_7_H).size(), 1u);
    EXPECT_EQ(mcode(CbOpcode::SET_7_MHL).size(), 3u);
}

TEST(OpcodeTableTest, MCodeNames) {
    EXPECT_EQ(mcodeName(MCode(ReadImmediate{})), "READ_IMM");
    EXPECT_EQ(mcodeName(MCode(ChangeBit{7, true, Reg8::H})), "SET");
    EXPECT_EQ(mcodeName(MCode(ChangeBit{7, false, Reg8::H})), "RES");
    EXPECT_EQ(mcodeName(MCode(ChangeBitMemory{0, true, Address::HL})), "SET_MEM");
    EXPECT_EQ(mcodeName(mcode(Opcode::PREFIX).front()), "PREFIX");
}

}  // namespace
}  // namespace dotmatrix::opcodes
