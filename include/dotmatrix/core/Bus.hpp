#pragma once

#include "dotmatrix/core/Cartridge.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace dotmatrix::core {

/// Readable and writable memory, 0xFF at power on.
struct RamPage {
    std::array<uint8_t, 256> bytes;

    RamPage() { bytes.fill(0xFF); }
};

/// 256 bytes of a cartridge ROM. Writes are dropped.
struct RomPage {
    std::shared_ptr<const std::vector<uint8_t>> rom;
    size_t base = 0;

    [[nodiscard]] uint8_t read(uint8_t index) const noexcept {
        const size_t offset = base + index;
        return offset < rom->size() ? (*rom)[offset] : 0xFF;
    }
};

using Page = std::variant<RamPage, RomPage>;

/// The main bus of the system, split into 256 pages of 256 bytes. An address selects its page with
/// the high byte and the offset in that page with the low byte, so every address is mapped.
class Bus {
public:
    static constexpr size_t kPageSize = 0x100;
    static constexpr size_t kPageCount = 0x100;
    static constexpr size_t kCartridgeRomPages = 0x80;  ///< 0x0000..0x7FFF

    /// The console memory map. Everything is RAM until a cartridge is mapped.
    static Bus standard();

    /// Nothing but RAM, for staging arbitrary CPU states in conformance tests.
    static Bus flat();

    [[nodiscard]] uint8_t read(uint16_t address) const noexcept;
    void write(uint16_t address, uint8_t value) noexcept;

    /// Little endian. The second byte is at address + 1 with 16-bit wraparound.
    [[nodiscard]] uint16_t read16(uint16_t address) const noexcept;
    void write16(uint16_t address, uint16_t value) noexcept;

    /// Maps 0x0000..0x7FFF onto the cartridge ROM. There is no bank switching.
    void mapCartridge(const Cartridge& cartridge);

    /// False for addresses backed by ROM.
    [[nodiscard]] bool isWritable(uint16_t address) const noexcept;

private:
    Bus();

    std::vector<Page> pages_;
};

}  // namespace dotmatrix::core
