#include "dotmatrix/core/Sm83.hpp"

#include "dotmatrix/common/Logger.hpp"

#include <format>
#include <iterator>
#include <ostream>

namespace dotmatrix::core {

using namespace dotmatrix::opcodes;

namespace {

std::string illegalInstructionMessage(Opcode opcode) {
    return std::format("Illegal instruction encountered: 0x{:02X} ({})", toByte(opcode), mnemonic(opcode));
}

/// M-codes that decide where the next opcode comes from. When one of these is the last m-code of
/// its instruction it runs before the overlap fetch instead of after it.
bool redirectsFetch(const MCode& mcode) {
    if (std::holds_alternative<FetchPrefixed>(mcode)) {
        return true;
    }
    if (const auto* load = std::get_if<Load16>(&mcode)) {
        return load->dst == Reg16::PC;
    }
    return false;
}

}  // namespace

IllegalInstructionError::IllegalInstructionError(Opcode opcode)
    : std::runtime_error(illegalInstructionMessage(opcode)), opcode_(opcode) {}

MCodeQueueUnderflow::MCodeQueueUnderflow()
    : std::logic_error("Attempted to pop from an empty m-code queue (a fetch always queues at least one m-code)") {}

Sm83::Sm83() = default;

Sm83 Sm83::forModel(HardwareModel model) {
    Sm83 cpu;
    cpu.registers_ = Sm83Registers::initialFor(model);
    return cpu;
}

void Sm83::execMCycle(Bus& bus) {
    const bool redirect = queue_.size() == 1 && redirectsFetch(queue_.front());

    // The next opcode is fetched during the last m-cycle of the current instruction.
    if (queue_.size() <= 1 && !redirect) {
        fetch(bus);
    }

    const MCode mcode = popMCode();
    execMCode(mcode, bus);
    ++cycleCount_;

    // JP HL: the overlap fetch reads from the new PC in the same m-cycle.
    if (redirect && queue_.empty()) {
        fetch(bus);
    }
}

void Sm83::fetch(Bus& bus) {
    ir_ = decode(bus.read(pc_));
    const auto sequence = mcode(ir_);
    queue_.insert(queue_.end(), sequence.begin(), sequence.end());
    pc_ = static_cast<uint16_t>(pc_ + 1);
}

void Sm83::execInstruction(Bus& bus) {
    if (queue_.empty()) {
        fetch(bus);
    }

    while (!queue_.empty()) {
        const MCode mcode = popMCode();
        execMCode(mcode, bus);
        ++cycleCount_;
    }
}

std::string Sm83::describe() const {
    return std::format(
        "Sm83 {{ A:{:02X} c:{:d} h:{:d} n:{:d} z:{:d} BC:{:04X} DE:{:04X} HL:{:04X} SP:{:04X} PC:{:04X} }}",
        registers_.a(), registers_.cFlag(), registers_.hFlag(), registers_.nFlag(), registers_.zFlag(),
        registers_.bc(), registers_.de(), registers_.hl(), sp_, pc_);
}

MCode Sm83::popMCode() {
    if (queue_.empty()) {
        throw MCodeQueueUnderflow();
    }
    MCode mcode = queue_.front();
    queue_.pop_front();
    return mcode;
}

void Sm83::execMCode(const MCode& mcode, Bus& bus) {
    std::visit(overloaded{
                   [](const Nop&) {},
                   [this](const Illegal&) {
                       const IllegalInstructionError error(ir_);
                       common::Logger::logError(error.what());
                       throw error;
                   },
                   [this, &bus](const FetchPrefixed&) {
                       lastPrefixed_ = decodePrefixed(bus.read(pc_));
                       pc_ = static_cast<uint16_t>(pc_ + 1);
                       const auto sequence = opcodes::mcode(lastPrefixed_);
                       queue_.insert(queue_.end(), sequence.begin(), sequence.end());
                   },
                   [this, &bus](const ReadImmediate& op) {
                       write8(op.dst, bus.read(pc_));
                       pc_ = static_cast<uint16_t>(pc_ + 1);
                       if (!conditionHolds(op.condition)) {
                           skipToLastMCode();
                       }
                   },
                   [this, &bus](const ReadMemory& op) { write8(op.dst, bus.read(resolveAddress(op.address))); },
                   [this, &bus](const WriteMemory& op) {
                       const uint8_t value = read8(op.src);
                       bus.write(resolveAddress(op.address), value);
                   },
                   [this](const Load8& op) { write8(op.dst, read8(op.src)); },
                   [this](const Load16& op) { write16(op.dst, read16(op.src)); },
                   [this](const Increment16& op) { write16(op.reg, static_cast<uint16_t>(read16(op.reg) + 1)); },
                   [this](const Decrement16& op) { write16(op.reg, static_cast<uint16_t>(read16(op.reg) - 1)); },
                   [this](const AddHl& op) {
                       const uint32_t hl = registers_.hl();
                       const uint32_t operand = read16(op.src);
                       const uint32_t result = hl + operand;
                       registers_.setNFlag(false);
                       registers_.setHFlag(((hl & 0x0FFF) + (operand & 0x0FFF)) > 0x0FFF);
                       registers_.setCFlag(result > 0xFFFF);
                       registers_.setHl(static_cast<uint16_t>(result));
                   },
                   [this](const AddSpOffset& op) {
                       const auto offset = static_cast<int8_t>(z_);
                       const uint16_t result = static_cast<uint16_t>(sp_ + offset);
                       registers_.setFlags(false, false, ((sp_ & 0x0F) + (z_ & 0x0F)) > 0x0F,
                                           ((sp_ & 0xFF) + z_) > 0xFF);
                       write16(op.dst, result);
                   },
                   [this](const JumpRelative&) {
                       pc_ = static_cast<uint16_t>(pc_ + static_cast<int8_t>(z_));
                   },
                   [this](const CheckCondition& op) {
                       if (!conditionHolds(op.condition)) {
                           skipToLastMCode();
                       }
                   },
                   [this, &bus](const PushPcLowAndJump&) {
                       bus.write(sp_, static_cast<uint8_t>(pc_ & 0xFF));
                       pc_ = read16(Reg16::WZ);
                   },
                   [this, &bus](const PushPcLowAndRestart& op) {
                       bus.write(sp_, static_cast<uint8_t>(pc_ & 0xFF));
                       pc_ = op.vector;
                   },
                   [this](const Alu& op) { alu(op.op, read8(op.src)); },
                   [this](const Unary& op) { write8(op.reg, unary(op.op, read8(op.reg))); },
                   [this, &bus](const UnaryMemory& op) {
                       z_ = unary(op.op, z_);
                       bus.write(resolveAddress(op.address), z_);
                   },
                   [this](const Accumulator& op) { accumulator(op.op); },
                   [this](const TestBit& op) {
                       const bool bitSet = ((read8(op.reg) >> op.bit) & 0x01) != 0;
                       registers_.setZFlag(!bitSet);
                       registers_.setNFlag(false);
                       registers_.setHFlag(true);
                   },
                   [this](const ChangeBit& op) {
                       const auto mask = static_cast<uint8_t>(1u << op.bit);
                       const uint8_t value = read8(op.reg);
                       write8(op.reg, op.set ? static_cast<uint8_t>(value | mask) : static_cast<uint8_t>(value & ~mask));
                   },
                   [this, &bus](const ChangeBitMemory& op) {
                       const auto mask = static_cast<uint8_t>(1u << op.bit);
                       z_ = op.set ? static_cast<uint8_t>(z_ | mask) : static_cast<uint8_t>(z_ & ~mask);
                       bus.write(resolveAddress(op.address), z_);
                   },
                   [this](const DisableInterrupts&) { ime_ = false; },
                   // No interrupt controller is modelled, so the one instruction delay of EI is not observable.
                   [this](const EnableInterrupts&) { ime_ = true; },
                   [this](const ReturnFromInterrupt&) {
                       pc_ = read16(Reg16::WZ);
                       ime_ = true;
                   },
               },
               mcode);
}

uint8_t Sm83::read8(Reg8 reg) const noexcept {
    switch (reg) {
    case Reg8::A:
        return registers_.a();
    case Reg8::F:
        return registers_.f();
    case Reg8::B:
        return registers_.b();
    case Reg8::C:
        return registers_.c();
    case Reg8::D:
        return registers_.d();
    case Reg8::E:
        return registers_.e();
    case Reg8::H:
        return registers_.h();
    case Reg8::L:
        return registers_.l();
    case Reg8::Z:
        return z_;
    case Reg8::W:
        return w_;
    case Reg8::SpLow:
        return static_cast<uint8_t>(sp_ & 0xFF);
    case Reg8::SpHigh:
        return static_cast<uint8_t>(sp_ >> 8);
    case Reg8::PcLow:
        return static_cast<uint8_t>(pc_ & 0xFF);
    case Reg8::PcHigh:
        return static_cast<uint8_t>(pc_ >> 8);
    }
    return 0xFF;
}

void Sm83::write8(Reg8 reg, uint8_t value) noexcept {
    switch (reg) {
    case Reg8::A:
        registers_.setA(value);
        break;
    case Reg8::F:
        registers_.setF(value);
        break;
    case Reg8::B:
        registers_.setB(value);
        break;
    case Reg8::C:
        registers_.setC(value);
        break;
    case Reg8::D:
        registers_.setD(value);
        break;
    case Reg8::E:
        registers_.setE(value);
        break;
    case Reg8::H:
        registers_.setH(value);
        break;
    case Reg8::L:
        registers_.setL(value);
        break;
    case Reg8::Z:
        z_ = value;
        break;
    case Reg8::W:
        w_ = value;
        break;
    case Reg8::SpLow:
        sp_ = static_cast<uint16_t>((sp_ & 0xFF00) | value);
        break;
    case Reg8::SpHigh:
        sp_ = static_cast<uint16_t>((sp_ & 0x00FF) | (value << 8));
        break;
    case Reg8::PcLow:
        pc_ = static_cast<uint16_t>((pc_ & 0xFF00) | value);
        break;
    case Reg8::PcHigh:
        pc_ = static_cast<uint16_t>((pc_ & 0x00FF) | (value << 8));
        break;
    }
}

uint16_t Sm83::read16(Reg16 reg) const noexcept {
    switch (reg) {
    case Reg16::AF:
        return registers_.af();
    case Reg16::BC:
        return registers_.bc();
    case Reg16::DE:
        return registers_.de();
    case Reg16::HL:
        return registers_.hl();
    case Reg16::SP:
        return sp_;
    case Reg16::PC:
        return pc_;
    case Reg16::WZ:
        return static_cast<uint16_t>((w_ << 8) | z_);
    }
    return 0xFFFF;
}

void Sm83::write16(Reg16 reg, uint16_t value) noexcept {
    switch (reg) {
    case Reg16::AF:
        registers_.setAf(value);
        break;
    case Reg16::BC:
        registers_.setBc(value);
        break;
    case Reg16::DE:
        registers_.setDe(value);
        break;
    case Reg16::HL:
        registers_.setHl(value);
        break;
    case Reg16::SP:
        sp_ = value;
        break;
    case Reg16::PC:
        pc_ = value;
        break;
    case Reg16::WZ:
        z_ = static_cast<uint8_t>(value & 0xFF);
        w_ = static_cast<uint8_t>(value >> 8);
        break;
    }
}

uint16_t Sm83::resolveAddress(Address address) noexcept {
    switch (address) {
    case Address::BC:
        return registers_.bc();
    case Address::DE:
        return registers_.de();
    case Address::HL:
        return registers_.hl();
    case Address::HLIncrement: {
        const uint16_t hl = registers_.hl();
        registers_.setHl(static_cast<uint16_t>(hl + 1));
        return hl;
    }
    case Address::HLDecrement: {
        const uint16_t hl = registers_.hl();
        registers_.setHl(static_cast<uint16_t>(hl - 1));
        return hl;
    }
    case Address::WZ:
        return read16(Reg16::WZ);
    case Address::WZIncrement: {
        const uint16_t wz = read16(Reg16::WZ);
        write16(Reg16::WZ, static_cast<uint16_t>(wz + 1));
        return wz;
    }
    case Address::SP:
        return sp_;
    case Address::SPIncrement: {
        const uint16_t sp = sp_;
        sp_ = static_cast<uint16_t>(sp + 1);
        return sp;
    }
    case Address::SPDecrement: {
        const uint16_t sp = sp_;
        sp_ = static_cast<uint16_t>(sp - 1);
        return sp;
    }
    case Address::HighC:
        return static_cast<uint16_t>(0xFF00 | registers_.c());
    case Address::HighZ:
        return static_cast<uint16_t>(0xFF00 | z_);
    }
    return 0;
}

bool Sm83::conditionHolds(Condition condition) const noexcept {
    switch (condition) {
    case Condition::Always:
        return true;
    case Condition::NotZero:
        return !registers_.zFlag();
    case Condition::Zero:
        return registers_.zFlag();
    case Condition::NotCarry:
        return !registers_.cFlag();
    case Condition::Carry:
        return registers_.cFlag();
    }
    return true;
}

void Sm83::skipToLastMCode() {
    if (queue_.size() > 1) {
        queue_.erase(queue_.begin(), std::prev(queue_.end()));
    }
}

void Sm83::alu(AluOp op, uint8_t operand) noexcept {
    const uint8_t a = registers_.a();
    const unsigned carryIn = registers_.cFlag() ? 1u : 0u;

    switch (op) {
    case AluOp::Add:
    case AluOp::Adc: {
        const unsigned carry = op == AluOp::Adc ? carryIn : 0u;
        const unsigned result = a + operand + carry;
        const auto value = static_cast<uint8_t>(result);
        registers_.setFlags(value == 0, false, ((a & 0x0F) + (operand & 0x0F) + carry) > 0x0F, result > 0xFF);
        registers_.setA(value);
        break;
    }
    case AluOp::Sub:
    case AluOp::Sbc:
    case AluOp::Cp: {
        const unsigned borrow = op == AluOp::Sbc ? carryIn : 0u;
        const auto value = static_cast<uint8_t>(a - operand - borrow);
        registers_.setFlags(value == 0, true, (a & 0x0F) < ((operand & 0x0F) + borrow),
                            static_cast<unsigned>(a) < operand + borrow);
        if (op != AluOp::Cp) {
            registers_.setA(value);
        }
        break;
    }
    case AluOp::And: {
        const auto value = static_cast<uint8_t>(a & operand);
        registers_.setFlags(value == 0, false, true, false);
        registers_.setA(value);
        break;
    }
    case AluOp::Xor: {
        const auto value = static_cast<uint8_t>(a ^ operand);
        registers_.setFlags(value == 0, false, false, false);
        registers_.setA(value);
        break;
    }
    case AluOp::Or: {
        const auto value = static_cast<uint8_t>(a | operand);
        registers_.setFlags(value == 0, false, false, false);
        registers_.setA(value);
        break;
    }
    }
}

uint8_t Sm83::unary(UnaryOp op, uint8_t value) noexcept {
    const bool carryIn = registers_.cFlag();
    uint8_t result = 0;
    bool carry = false;

    switch (op) {
    case UnaryOp::Inc:
        result = static_cast<uint8_t>(value + 1);
        registers_.setZFlag(result == 0);
        registers_.setNFlag(false);
        registers_.setHFlag((value & 0x0F) == 0x0F);
        return result;
    case UnaryOp::Dec:
        result = static_cast<uint8_t>(value - 1);
        registers_.setZFlag(result == 0);
        registers_.setNFlag(true);
        registers_.setHFlag((value & 0x0F) == 0x00);
        return result;
    case UnaryOp::Rlc:
        carry = (value & 0x80) != 0;
        result = static_cast<uint8_t>((value << 1) | (value >> 7));
        break;
    case UnaryOp::Rrc:
        carry = (value & 0x01) != 0;
        result = static_cast<uint8_t>((value >> 1) | (value << 7));
        break;
    case UnaryOp::Rl:
        carry = (value & 0x80) != 0;
        result = static_cast<uint8_t>((value << 1) | (carryIn ? 0x01 : 0x00));
        break;
    case UnaryOp::Rr:
        carry = (value & 0x01) != 0;
        result = static_cast<uint8_t>((value >> 1) | (carryIn ? 0x80 : 0x00));
        break;
    case UnaryOp::Sla:
        carry = (value & 0x80) != 0;
        result = static_cast<uint8_t>(value << 1);
        break;
    case UnaryOp::Sra:
        carry = (value & 0x01) != 0;
        result = static_cast<uint8_t>((value >> 1) | (value & 0x80));
        break;
    case UnaryOp::Swap:
        result = static_cast<uint8_t>((value << 4) | (value >> 4));
        break;
    case UnaryOp::Srl:
        carry = (value & 0x01) != 0;
        result = static_cast<uint8_t>(value >> 1);
        break;
    }

    registers_.setFlags(result == 0, false, false, carry);
    return result;
}

void Sm83::accumulator(AccumulatorOp op) noexcept {
    switch (op) {
    case AccumulatorOp::Rlca:
    case AccumulatorOp::Rrca:
    case AccumulatorOp::Rla:
    case AccumulatorOp::Rra: {
        const UnaryOp rotate = op == AccumulatorOp::Rlca   ? UnaryOp::Rlc
                               : op == AccumulatorOp::Rrca ? UnaryOp::Rrc
                               : op == AccumulatorOp::Rla  ? UnaryOp::Rl
                                                           : UnaryOp::Rr;
        registers_.setA(unary(rotate, registers_.a()));
        // The accumulator rotates always clear Z.
        registers_.setZFlag(false);
        break;
    }
    case AccumulatorOp::Daa: {
        uint8_t a = registers_.a();
        bool carry = registers_.cFlag();
        if (!registers_.nFlag()) {
            if (carry || a > 0x99) {
                a = static_cast<uint8_t>(a + 0x60);
                carry = true;
            }
            if (registers_.hFlag() || (a & 0x0F) > 0x09) {
                a = static_cast<uint8_t>(a + 0x06);
            }
        } else {
            if (carry) {
                a = static_cast<uint8_t>(a - 0x60);
            }
            if (registers_.hFlag()) {
                a = static_cast<uint8_t>(a - 0x06);
            }
        }
        registers_.setA(a);
        registers_.setZFlag(a == 0);
        registers_.setHFlag(false);
        registers_.setCFlag(carry);
        break;
    }
    case AccumulatorOp::Cpl:
        registers_.setA(static_cast<uint8_t>(~registers_.a()));
        registers_.setNFlag(true);
        registers_.setHFlag(true);
        break;
    case AccumulatorOp::Scf:
        registers_.setNFlag(false);
        registers_.setHFlag(false);
        registers_.setCFlag(true);
        break;
    case AccumulatorOp::Ccf:
        registers_.setNFlag(false);
        registers_.setHFlag(false);
        registers_.setCFlag(!registers_.cFlag());
        break;
    }
}

std::ostream& operator<<(std::ostream& os, const Sm83& cpu) {
    return os << cpu.describe();
}

}  // namespace dotmatrix::core
