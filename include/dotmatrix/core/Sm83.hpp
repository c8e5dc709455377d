#pragma once

#include "dotmatrix/core/Bus.hpp"
#include "dotmatrix/core/HardwareModel.hpp"
#include "dotmatrix/core/Sm83Registers.hpp"
#include "dotmatrix/opcodes/Opcode.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace dotmatrix::core {

/// Raised when the CPU executes an opcode whose behaviour is not modelled.
class IllegalInstructionError : public std::runtime_error {
public:
    explicit IllegalInstructionError(opcodes::Opcode opcode);

    [[nodiscard]] opcodes::Opcode opcode() const noexcept { return opcode_; }

private:
    opcodes::Opcode opcode_;
};

/// Raised when an m-code is popped from an empty queue. Always a bug in the CPU or the opcode table.
class MCodeQueueUnderflow : public std::logic_error {
public:
    MCodeQueueUnderflow();
};

/// The Sharp SM83, the CPU of the Game Boy.
///
/// Instructions run as queues of m-codes, one per m-cycle. The opcode of the next instruction is
/// fetched during the last m-cycle of the current one, so the final m-code of an instruction runs
/// after that fetch and must not touch PC.
class Sm83 {
public:
    static constexpr uint16_t kAfterBootPc = 0x0100;
    static constexpr uint16_t kAfterBootSp = 0xFFFE;

    /// All registers zero, PC and SP as left by the boot ROM.
    Sm83();

    /// Post boot ROM state of the given hardware revision.
    static Sm83 forModel(HardwareModel model);

    /// Advance exactly one m-cycle, fetching the next instruction when the queue runs low.
    void execMCycle(Bus& bus);

    /// Read the opcode at PC, queue its m-codes and advance PC.
    void fetch(Bus& bus);

    /// Run the current instruction to completion without the overlapping fetch of the next one.
    /// Fetches first if nothing is queued. Used to drive single instruction conformance tests.
    void execInstruction(Bus& bus);

    [[nodiscard]] Sm83Registers& registers() noexcept { return registers_; }
    [[nodiscard]] const Sm83Registers& registers() const noexcept { return registers_; }

    [[nodiscard]] uint16_t pc() const noexcept { return pc_; }
    void setPc(uint16_t pc) noexcept { pc_ = pc; }

    [[nodiscard]] uint16_t sp() const noexcept { return sp_; }
    void setSp(uint16_t sp) noexcept { sp_ = sp; }

    [[nodiscard]] opcodes::Opcode ir() const noexcept { return ir_; }
    [[nodiscard]] opcodes::CbOpcode lastPrefixed() const noexcept { return lastPrefixed_; }

    [[nodiscard]] bool ime() const noexcept { return ime_; }
    void setIme(bool enabled) noexcept { ime_ = enabled; }

    [[nodiscard]] size_t queueLength() const noexcept { return queue_.size(); }
    [[nodiscard]] uint64_t cycleCount() const noexcept { return cycleCount_; }

    /// One line register dump, e.g.
    /// "Sm83 { A:CD c:1 h:0 n:1 z:0 BC:89AB DE:4567 HL:0123 SP:A801 PC:532D }"
    [[nodiscard]] std::string describe() const;

private:
    opcodes::MCode popMCode();
    void execMCode(const opcodes::MCode& mcode, Bus& bus);

    [[nodiscard]] uint8_t read8(opcodes::Reg8 reg) const noexcept;
    void write8(opcodes::Reg8 reg, uint8_t value) noexcept;
    [[nodiscard]] uint16_t read16(opcodes::Reg16 reg) const noexcept;
    void write16(opcodes::Reg16 reg, uint16_t value) noexcept;

    /// Effective address of an addressing mode, applying any post increment or decrement.
    uint16_t resolveAddress(opcodes::Address address) noexcept;

    [[nodiscard]] bool conditionHolds(opcodes::Condition condition) const noexcept;

    /// Drop the rest of a not-taken branch, keeping the final overlap m-code.
    void skipToLastMCode();

    void alu(opcodes::AluOp op, uint8_t operand) noexcept;
    uint8_t unary(opcodes::UnaryOp op, uint8_t value) noexcept;
    void accumulator(opcodes::AccumulatorOp op) noexcept;

    Sm83Registers registers_;
    uint16_t pc_ = kAfterBootPc;
    uint16_t sp_ = kAfterBootSp;
    opcodes::Opcode ir_ = opcodes::Opcode::NOP;
    opcodes::CbOpcode lastPrefixed_ = opcodes::CbOpcode::RLC_B;
    uint8_t z_ = 0;
    uint8_t w_ = 0;
    bool ime_ = false;
    std::deque<opcodes::MCode> queue_;
    uint64_t cycleCount_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Sm83& cpu);

}  // namespace dotmatrix::core
