#include "dotmatrix/opcodes/OpcodeTableSource.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

namespace dotmatrix::opcodes {
namespace {

using json = nlohmann::json;

json nopEntry(unsigned opcode) {
    return json{
        {"opcode", opcode},
        {"id", std::format("OP_{:02X}", opcode)},
        {"mnemonic", json::array({"NOP"})},
        {"length", 1},
        {"mcode", json::array({"NOP"})},
    };
}

/// A well formed table where every byte is a one cycle NOP.
json nopTable() {
    json table = json::array();
    for (unsigned opcode = 0; opcode < kOpcodeCount; ++opcode) {
        table.push_back(nopEntry(opcode));
    }
    return table;
}

json loadDataFile(std::string_view name) {
    std::ifstream in(std::filesystem::path(DOTMATRIX_OPCODE_DATA_DIR) / name);
    return json::parse(in);
}

void expectRejected(const json& table, TableKind kind, std::string_view fragment) {
    const auto parsed = parseTable(table, kind);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().find(fragment), std::string::npos) << parsed.error();
}

TEST(OpcodeTableSourceTest, FormatsOpcodeBytes) {
    EXPECT_EQ(formatOpcodeByte(0x00), "0x00");
    EXPECT_EQ(formatOpcodeByte(0xCB), "0xCB");
    EXPECT_EQ(formatOpcodeByte(0x1FF), "0xFF");
}

TEST(OpcodeTableSourceTest, ShippedTablesParse) {
    const auto base = parseTable(loadDataFile("opcodes.json"), TableKind::Base);
    ASSERT_TRUE(base.has_value()) << base.error();
    const auto prefixed = parseTable(loadDataFile("cb_opcodes.json"), TableKind::Prefixed);
    ASSERT_TRUE(prefixed.has_value()) << prefixed.error();

    ASSERT_EQ(base->size(), kOpcodeCount);
    ASSERT_EQ(prefixed->size(), kOpcodeCount);
    for (unsigned byte = 0; byte < kOpcodeCount; ++byte) {
        EXPECT_EQ((*base)[byte].opcode, byte);
        EXPECT_EQ((*prefixed)[byte].opcode, byte);
    }
    EXPECT_EQ((*base)[0xCB].id, "PREFIX");
    EXPECT_EQ((*base)[0xCB].mcodeExpressions.front(), "FetchPrefixed{}");
}

TEST(OpcodeTableSourceTest, RecordsAreOrderedByByteWhateverTheInputOrder) {
    json table = json::array();
    for (unsigned opcode = kOpcodeCount; opcode-- > 0;) {
        table.push_back(nopEntry(opcode));
    }
    const auto parsed = parseTable(table, TableKind::Base);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->front().id, "OP_00");
    EXPECT_EQ(parsed->back().id, "OP_FF");
}

TEST(OpcodeTableSourceTest, RejectsWrongRecordCount) {
    json table = nopTable();
    table.erase(table.size() - 1);
    expectRejected(table, TableKind::Base, "Must have exactly 256 opcodes, found 255");
    expectRejected(json::object(), TableKind::Base, "must be an array");
}

TEST(OpcodeTableSourceTest, RejectsDuplicateAndOutOfRangeBytes) {
    json duplicate = nopTable();
    duplicate[1]["opcode"] = 0;
    expectRejected(duplicate, TableKind::Base, "duplicate opcode 0x00");

    json outOfRange = nopTable();
    outOfRange[7]["opcode"] = 256;
    expectRejected(outOfRange, TableKind::Base, "opcode value out of range: 256");

    json negative = nopTable();
    negative[7]["opcode"] = -1;
    expectRejected(negative, TableKind::Base, "out of range");
}

TEST(OpcodeTableSourceTest, RejectsBadAndDuplicateIds) {
    json notIdentifier = nopTable();
    notIdentifier[0x12]["id"] = "LD (DE), A";
    expectRejected(notIdentifier, TableKind::Base, "opcode 0x12: 'id' must be a C++ identifier");

    json leadingDigit = nopTable();
    leadingDigit[0x12]["id"] = "8BIT";
    expectRejected(leadingDigit, TableKind::Base, "must be a C++ identifier");

    json duplicate = nopTable();
    duplicate[0x40]["id"] = "OP_3F";
    expectRejected(duplicate, TableKind::Base, "opcode 0x40: duplicate id 'OP_3F'");
}

TEST(OpcodeTableSourceTest, RejectsLengthOutsideOneToThree) {
    json zero = nopTable();
    zero[0x21]["length"] = 0;
    expectRejected(zero, TableKind::Base, "opcode 0x21: 'length' must be 1..3");

    json four = nopTable();
    four[0x21]["length"] = 4;
    expectRejected(four, TableKind::Base, "'length' must be 1..3");
}

TEST(OpcodeTableSourceTest, RejectsUnknownOrMalformedMCodes) {
    json unknown = nopTable();
    unknown[0x05]["mcode"] = json::array({"NOP", "HALT_BUG"});
    expectRejected(unknown, TableKind::Base, "opcode 0x05: unknown m-code 'HALT_BUG'");

    json badOperand = nopTable();
    badOperand[0x05]["mcode"] = json::array({"READ Q HL"});
    expectRejected(badOperand, TableKind::Base, "malformed m-code 'READ Q HL'");

    json empty = nopTable();
    empty[0x05]["mcode"] = json::array();
    expectRejected(empty, TableKind::Base, "'mcode' must be a non-empty array");
}

TEST(OpcodeTableSourceTest, RejectsConditionalFinalMCode) {
    json table = nopTable();
    table[0x20]["mcode"] = json::array({"JR", "READ_IMM Z NZ"});
    expectRejected(table, TableKind::Base, "opcode 0x20: a conditional m-code cannot end an instruction");

    json check = nopTable();
    check[0xC0]["mcode"] = json::array({"NOP", "COND NZ"});
    expectRejected(check, TableKind::Base, "cannot end an instruction");
}

TEST(OpcodeTableSourceTest, RejectsMisplacedPrefix) {
    json withOthers = nopTable();
    withOthers[0xCB]["mcode"] = json::array({"NOP", "PREFIX"});
    expectRejected(withOthers, TableKind::Base, "opcode 0xCB: PREFIX must be the only m-code of a base opcode");

    json inPrefixedTable = nopTable();
    inPrefixedTable[0xCB]["mcode"] = json::array({"PREFIX"});
    expectRejected(inPrefixedTable, TableKind::Prefixed, "PREFIX must be the only m-code");

    json alone = nopTable();
    alone[0xCB]["mcode"] = json::array({"PREFIX"});
    EXPECT_TRUE(parseTable(alone, TableKind::Base).has_value());
}

TEST(OpcodeTableSourceTest, RendersMCodeInitializers) {
    const auto read = parseMCode("READ Z HL+");
    ASSERT_TRUE(read.has_value()) << read.error();
    EXPECT_EQ(read->expression, "ReadMemory{Reg8::Z, Address::HLIncrement}");
    EXPECT_FALSE(read->conditional);

    const auto branch = parseMCode("READ_IMM Z NZ");
    ASSERT_TRUE(branch.has_value()) << branch.error();
    EXPECT_EQ(branch->expression, "ReadImmediate{Reg8::Z, Condition::NotZero}");
    EXPECT_TRUE(branch->conditional);

    const auto restart = parseMCode("RST_PUSH 38");
    ASSERT_TRUE(restart.has_value()) << restart.error();
    EXPECT_EQ(restart->expression, "PushPcLowAndRestart{0x38}");

    const auto prefix = parseMCode("PREFIX");
    ASSERT_TRUE(prefix.has_value()) << prefix.error();
    EXPECT_TRUE(prefix->prefix);

    EXPECT_FALSE(parseMCode("RST_PUSH 39").has_value());
    EXPECT_FALSE(parseMCode("   ").has_value());
}

}  // namespace
}  // namespace dotmatrix::opcodes
