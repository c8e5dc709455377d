#include "dotmatrix/core/DotMatrix.hpp"

#include "dotmatrix/common/Logger.hpp"

#include <format>
#include <string>
#include <utility>

namespace dotmatrix::core {

DotMatrix::DotMatrix(HardwareModel model) : DotMatrix(model, Sm83::forModel(model), Bus::standard()) {}

DotMatrix::DotMatrix(HardwareModel model, Sm83 cpu, Bus bus)
    : model_(model), cpu_(std::move(cpu)), bus_(std::move(bus)) {}

DotMatrix DotMatrix::withFlatBus() {
    return DotMatrix(HardwareModel::Dmg, Sm83(), Bus::flat());
}

void DotMatrix::load(Cartridge cartridge) {
    bus_.mapCartridge(cartridge);
    common::Logger::log(std::format("Loaded cartridge '{}' ({} bytes)", cartridge.title(), cartridge.size()));
    cartridge_ = std::move(cartridge);
}

void DotMatrix::execInstruction() {
    cpu_.execInstruction(bus_);
}

void DotMatrix::execMCycle() {
    cpu_.execMCycle(bus_);
}

}  // namespace dotmatrix::core
