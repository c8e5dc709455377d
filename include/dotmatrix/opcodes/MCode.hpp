#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

namespace dotmatrix::opcodes {

/// 8-bit operands an m-code moves data between.
/// Z and W are the CPU's internal temporaries; the SP/PC halves are only used for stack traffic.
enum class Reg8 : uint8_t {
    A,
    F,
    B,
    C,
    D,
    E,
    H,
    L,
    Z,
    W,
    SpLow,
    SpHigh,
    PcLow,
    PcHigh,
};

enum class Reg16 : uint8_t {
    AF,
    BC,
    DE,
    HL,
    SP,
    PC,
    WZ,
};

/// Bus addressing modes. Increment/decrement forms adjust the register after the access.
enum class Address : uint8_t {
    BC,
    DE,
    HL,
    HLIncrement,
    HLDecrement,
    WZ,
    WZIncrement,
    SP,
    SPIncrement,
    SPDecrement,
    HighC,  ///< 0xFF00 + C
    HighZ,  ///< 0xFF00 + Z
};

enum class Condition : uint8_t {
    Always,
    NotZero,
    Zero,
    NotCarry,
    Carry,
};

/// Accumulator arithmetic: A <- A op operand (Cp only sets flags).
enum class AluOp : uint8_t {
    Add,
    Adc,
    Sub,
    Sbc,
    And,
    Xor,
    Or,
    Cp,
};

/// Single operand read-modify-write operations (INC/DEC and the 0xCB rotate/shift group).
enum class UnaryOp : uint8_t {
    Inc,
    Dec,
    Rlc,
    Rrc,
    Rl,
    Rr,
    Sla,
    Sra,
    Swap,
    Srl,
};

/// Operations hard-wired to A or the flags.
enum class AccumulatorOp : uint8_t {
    Rlca,
    Rrca,
    Rla,
    Rra,
    Daa,
    Cpl,
    Scf,
    Ccf,
};

// M-CODES
//
// Each alternative is the work performed during one m-cycle. The static `name` is the token used
// by the declarative opcode tables in data/.

/// Perform no action.
struct Nop {
    static constexpr std::string_view name = "NOP";
    bool operator==(const Nop&) const = default;
};

/// An illegal or unmodelled instruction; halts execution immediately.
struct Illegal {
    static constexpr std::string_view name = "ILLEGAL";
    bool operator==(const Illegal&) const = default;
};

/// Read the byte following 0xCB and queue the prefixed instruction's m-codes.
struct FetchPrefixed {
    static constexpr std::string_view name = "PREFIX";
    bool operator==(const FetchPrefixed&) const = default;
};

/// dst <- [PC++]. A failed condition cancels the rest of the instruction.
struct ReadImmediate {
    static constexpr std::string_view name = "READ_IMM";
    Reg8 dst = Reg8::Z;
    Condition condition = Condition::Always;
    bool operator==(const ReadImmediate&) const = default;
};

struct ReadMemory {
    static constexpr std::string_view name = "READ";
    Reg8 dst = Reg8::Z;
    Address address = Address::HL;
    bool operator==(const ReadMemory&) const = default;
};

struct WriteMemory {
    static constexpr std::string_view name = "WRITE";
    Address address = Address::HL;
    Reg8 src = Reg8::Z;
    bool operator==(const WriteMemory&) const = default;
};

struct Load8 {
    static constexpr std::string_view name = "LD8";
    Reg8 dst = Reg8::A;
    Reg8 src = Reg8::Z;
    bool operator==(const Load8&) const = default;
};

struct Load16 {
    static constexpr std::string_view name = "LD16";
    Reg16 dst = Reg16::PC;
    Reg16 src = Reg16::WZ;
    bool operator==(const Load16&) const = default;
};

/// 16-bit increment on the IDU, no flags.
struct Increment16 {
    static constexpr std::string_view name = "INC16";
    Reg16 reg = Reg16::BC;
    bool operator==(const Increment16&) const = default;
};

/// 16-bit decrement on the IDU, no flags.
struct Decrement16 {
    static constexpr std::string_view name = "DEC16";
    Reg16 reg = Reg16::BC;
    bool operator==(const Decrement16&) const = default;
};

/// HL <- HL + src. Z is preserved.
struct AddHl {
    static constexpr std::string_view name = "ADD_HL";
    Reg16 src = Reg16::BC;
    bool operator==(const AddHl&) const = default;
};

/// dst <- SP + (int8)Z, flags from the unsigned low byte addition.
struct AddSpOffset {
    static constexpr std::string_view name = "ADD_SP_OFFSET";
    Reg16 dst = Reg16::SP;
    bool operator==(const AddSpOffset&) const = default;
};

/// PC <- PC + (int8)Z
struct JumpRelative {
    static constexpr std::string_view name = "JR";
    bool operator==(const JumpRelative&) const = default;
};

/// Internal cycle that cancels the rest of the instruction when the condition fails.
struct CheckCondition {
    static constexpr std::string_view name = "COND";
    Condition condition = Condition::Always;
    bool operator==(const CheckCondition&) const = default;
};

/// [SP] <- PCL, PC <- WZ
struct PushPcLowAndJump {
    static constexpr std::string_view name = "CALL_PUSH";
    bool operator==(const PushPcLowAndJump&) const = default;
};

/// [SP] <- PCL, PC <- vector
struct PushPcLowAndRestart {
    static constexpr std::string_view name = "RST_PUSH";
    uint8_t vector = 0x00;
    bool operator==(const PushPcLowAndRestart&) const = default;
};

struct Alu {
    static constexpr std::string_view name = "ALU";
    AluOp op = AluOp::Add;
    Reg8 src = Reg8::Z;
    bool operator==(const Alu&) const = default;
};

struct Unary {
    static constexpr std::string_view name = "UNARY";
    UnaryOp op = UnaryOp::Inc;
    Reg8 reg = Reg8::A;
    bool operator==(const Unary&) const = default;
};

/// Z <- op(Z), [address] <- Z
struct UnaryMemory {
    static constexpr std::string_view name = "UNARY_MEM";
    UnaryOp op = UnaryOp::Inc;
    Address address = Address::HL;
    bool operator==(const UnaryMemory&) const = default;
};

struct Accumulator {
    static constexpr std::string_view name = "ACC";
    AccumulatorOp op = AccumulatorOp::Cpl;
    bool operator==(const Accumulator&) const = default;
};

struct TestBit {
    static constexpr std::string_view name = "BIT";
    uint8_t bit = 0;
    Reg8 reg = Reg8::A;
    bool operator==(const TestBit&) const = default;
};

/// RES (set == false) or SET (set == true) on a register.
struct ChangeBit {
    static constexpr std::string_view name = "RES";
    static constexpr std::string_view setName = "SET";
    uint8_t bit = 0;
    bool set = false;
    Reg8 reg = Reg8::A;
    bool operator==(const ChangeBit&) const = default;
};

/// Z with one bit changed, written back to [address].
struct ChangeBitMemory {
    static constexpr std::string_view name = "RES_MEM";
    static constexpr std::string_view setName = "SET_MEM";
    uint8_t bit = 0;
    bool set = false;
    Address address = Address::HL;
    bool operator==(const ChangeBitMemory&) const = default;
};

struct DisableInterrupts {
    static constexpr std::string_view name = "DI";
    bool operator==(const DisableInterrupts&) const = default;
};

struct EnableInterrupts {
    static constexpr std::string_view name = "EI";
    bool operator==(const EnableInterrupts&) const = default;
};

/// PC <- WZ, IME <- 1
struct ReturnFromInterrupt {
    static constexpr std::string_view name = "RETI";
    bool operator==(const ReturnFromInterrupt&) const = default;
};

/// Break each SM83 instruction down into the actions performed each machine cycle (m-cycle).
/// These are modelled on the timing diagrams of Gekkio's Game Boy Complete Technical Reference,
/// not on whatever microcode the SM83 may have.
using MCode = std::variant<Nop, Illegal, FetchPrefixed, ReadImmediate, ReadMemory, WriteMemory, Load8, Load16,
                           Increment16, Decrement16, AddHl, AddSpOffset, JumpRelative, CheckCondition,
                           PushPcLowAndJump, PushPcLowAndRestart, Alu, Unary, UnaryMemory, Accumulator, TestBit,
                           ChangeBit, ChangeBitMemory, DisableInterrupts, EnableInterrupts, ReturnFromInterrupt>;

/// Table token of an m-code, e.g. "READ_IMM" or "SET_MEM".
std::string_view mcodeName(const MCode& mcode);

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

}  // namespace dotmatrix::opcodes
