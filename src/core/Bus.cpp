#include "dotmatrix/core/Bus.hpp"

#include "dotmatrix/opcodes/MCode.hpp"

namespace dotmatrix::core {
namespace {

using opcodes::overloaded;

constexpr uint8_t pageOf(uint16_t address) noexcept {
    return static_cast<uint8_t>(address >> 8);
}

constexpr uint8_t indexOf(uint16_t address) noexcept {
    return static_cast<uint8_t>(address & 0xFF);
}

}  // namespace

Bus::Bus() : pages_(kPageCount) {}

Bus Bus::standard() {
    return Bus();
}

Bus Bus::flat() {
    return Bus();
}

uint8_t Bus::read(uint16_t address) const noexcept {
    const uint8_t index = indexOf(address);
    return std::visit(overloaded{
                          [index](const RamPage& page) { return page.bytes[index]; },
                          [index](const RomPage& page) { return page.read(index); },
                      },
                      pages_[pageOf(address)]);
}

void Bus::write(uint16_t address, uint8_t value) noexcept {
    const uint8_t index = indexOf(address);
    std::visit(overloaded{
                   [index, value](RamPage& page) { page.bytes[index] = value; },
                   [](RomPage&) {},
               },
               pages_[pageOf(address)]);
}

uint16_t Bus::read16(uint16_t address) const noexcept {
    const uint8_t lo = read(address);
    const uint8_t hi = read(static_cast<uint16_t>(address + 1));
    return static_cast<uint16_t>(lo | (hi << 8));
}

void Bus::write16(uint16_t address, uint16_t value) noexcept {
    write(address, static_cast<uint8_t>(value & 0xFF));
    write(static_cast<uint16_t>(address + 1), static_cast<uint8_t>(value >> 8));
}

void Bus::mapCartridge(const Cartridge& cartridge) {
    for (size_t page = 0; page < kCartridgeRomPages; ++page) {
        pages_[page] = RomPage{cartridge.rom(), page * kPageSize};
    }
}

bool Bus::isWritable(uint16_t address) const noexcept {
    return std::holds_alternative<RamPage>(pages_[pageOf(address)]);
}

}  // namespace dotmatrix::core
