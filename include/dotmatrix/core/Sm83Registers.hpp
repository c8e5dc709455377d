#pragma once

#include "dotmatrix/core/HardwareModel.hpp"

#include <cstdint>

namespace dotmatrix::core {

/// The general purpose 8 and 16 bit registers of the SM83, including the flags, packed into one
/// 64-bit value. Pairs and halves are views over the same bits, so writing B is visible through BC.
///
/// Layout (raw value written as 0xHH_LL_DD_EE_BB_CC_AA_FF):
///   F 0..7, A 8..15, C 16..23, B 24..31, E 32..39, D 40..47, L 48..55, H 56..63.
/// The low nibble of F is hard-wired to 0 and is masked on every read and write.
class Sm83Registers {
public:
    constexpr Sm83Registers() = default;

    [[nodiscard]] static constexpr Sm83Registers fromRaw(uint64_t raw) noexcept {
        Sm83Registers registers;
        registers.raw_ = raw & ~uint64_t{0x0F};
        return registers;
    }

    /// Register state left behind by the boot ROM of the given hardware revision
    /// (values from the Cycle-Accurate Game Boy Docs; SGB and SGB2 are unverified on hardware).
    static Sm83Registers initialFor(HardwareModel model) noexcept;

    [[nodiscard]] constexpr uint64_t raw() const noexcept { return raw_; }

    // 8-bit registers
    [[nodiscard]] constexpr uint8_t f() const noexcept { return static_cast<uint8_t>(get(kF) & 0xF0); }
    [[nodiscard]] constexpr uint8_t a() const noexcept { return static_cast<uint8_t>(get(kA)); }
    [[nodiscard]] constexpr uint8_t c() const noexcept { return static_cast<uint8_t>(get(kC)); }
    [[nodiscard]] constexpr uint8_t b() const noexcept { return static_cast<uint8_t>(get(kB)); }
    [[nodiscard]] constexpr uint8_t e() const noexcept { return static_cast<uint8_t>(get(kE)); }
    [[nodiscard]] constexpr uint8_t d() const noexcept { return static_cast<uint8_t>(get(kD)); }
    [[nodiscard]] constexpr uint8_t l() const noexcept { return static_cast<uint8_t>(get(kL)); }
    [[nodiscard]] constexpr uint8_t h() const noexcept { return static_cast<uint8_t>(get(kH)); }

    constexpr void setF(uint8_t value) noexcept { set(kF, value & 0xF0u); }
    constexpr void setA(uint8_t value) noexcept { set(kA, value); }
    constexpr void setC(uint8_t value) noexcept { set(kC, value); }
    constexpr void setB(uint8_t value) noexcept { set(kB, value); }
    constexpr void setE(uint8_t value) noexcept { set(kE, value); }
    constexpr void setD(uint8_t value) noexcept { set(kD, value); }
    constexpr void setL(uint8_t value) noexcept { set(kL, value); }
    constexpr void setH(uint8_t value) noexcept { set(kH, value); }

    // 16-bit pairs
    [[nodiscard]] constexpr uint16_t af() const noexcept { return static_cast<uint16_t>(get(kAF) & 0xFFF0); }
    [[nodiscard]] constexpr uint16_t bc() const noexcept { return static_cast<uint16_t>(get(kBC)); }
    [[nodiscard]] constexpr uint16_t de() const noexcept { return static_cast<uint16_t>(get(kDE)); }
    [[nodiscard]] constexpr uint16_t hl() const noexcept { return static_cast<uint16_t>(get(kHL)); }

    constexpr void setAf(uint16_t value) noexcept { set(kAF, value & 0xFFF0u); }
    constexpr void setBc(uint16_t value) noexcept { set(kBC, value); }
    constexpr void setDe(uint16_t value) noexcept { set(kDE, value); }
    constexpr void setHl(uint16_t value) noexcept { set(kHL, value); }

    // Flags
    [[nodiscard]] constexpr bool cFlag() const noexcept { return get(kCarry) != 0; }
    [[nodiscard]] constexpr bool hFlag() const noexcept { return get(kHalfCarry) != 0; }
    [[nodiscard]] constexpr bool nFlag() const noexcept { return get(kSubtract) != 0; }
    [[nodiscard]] constexpr bool zFlag() const noexcept { return get(kZero) != 0; }

    constexpr void setCFlag(bool value) noexcept { set(kCarry, value ? 1u : 0u); }
    constexpr void setHFlag(bool value) noexcept { set(kHalfCarry, value ? 1u : 0u); }
    constexpr void setNFlag(bool value) noexcept { set(kSubtract, value ? 1u : 0u); }
    constexpr void setZFlag(bool value) noexcept { set(kZero, value ? 1u : 0u); }

    /// Sets all four flags at once.
    constexpr void setFlags(bool z, bool n, bool h, bool c) noexcept {
        setZFlag(z);
        setNFlag(n);
        setHFlag(h);
        setCFlag(c);
    }

    bool operator==(const Sm83Registers&) const = default;

private:
    struct BitRange {
        uint8_t offset;
        uint8_t width;

        [[nodiscard]] constexpr uint64_t mask() const noexcept {
            return (width >= 64 ? ~uint64_t{0} : ((uint64_t{1} << width) - 1)) << offset;
        }
    };

    static constexpr BitRange kCarry{4, 1};
    static constexpr BitRange kHalfCarry{5, 1};
    static constexpr BitRange kSubtract{6, 1};
    static constexpr BitRange kZero{7, 1};

    static constexpr BitRange kF{0, 8};
    static constexpr BitRange kA{8, 8};
    static constexpr BitRange kC{16, 8};
    static constexpr BitRange kB{24, 8};
    static constexpr BitRange kE{32, 8};
    static constexpr BitRange kD{40, 8};
    static constexpr BitRange kL{48, 8};
    static constexpr BitRange kH{56, 8};

    static constexpr BitRange kAF{0, 16};
    static constexpr BitRange kBC{16, 16};
    static constexpr BitRange kDE{32, 16};
    static constexpr BitRange kHL{48, 16};

    [[nodiscard]] constexpr uint64_t get(BitRange range) const noexcept {
        return (raw_ & range.mask()) >> range.offset;
    }

    constexpr void set(BitRange range, uint64_t value) noexcept {
        raw_ = (raw_ & ~range.mask()) | ((value << range.offset) & range.mask());
    }

    uint64_t raw_ = 0;
};

}  // namespace dotmatrix::core
