#pragma once

#include "dotmatrix/core/Bus.hpp"
#include "dotmatrix/core/Cartridge.hpp"
#include "dotmatrix/core/HardwareModel.hpp"
#include "dotmatrix/core/Sm83.hpp"

#include <optional>

namespace dotmatrix::core {

/// The console: one CPU driving one bus, with an optional cartridge plugged in.
class DotMatrix {
public:
    explicit DotMatrix(HardwareModel model = HardwareModel::Dmg);

    /// A console on an all-RAM bus with zeroed registers, for staging conformance test states.
    static DotMatrix withFlatBus();

    /// Plug in a cartridge and map its ROM onto the bus.
    void load(Cartridge cartridge);

    void execInstruction();
    void execMCycle();

    [[nodiscard]] HardwareModel model() const noexcept { return model_; }

    [[nodiscard]] Sm83& cpu() noexcept { return cpu_; }
    [[nodiscard]] const Sm83& cpu() const noexcept { return cpu_; }

    [[nodiscard]] Bus& bus() noexcept { return bus_; }
    [[nodiscard]] const Bus& bus() const noexcept { return bus_; }

    [[nodiscard]] const std::optional<Cartridge>& cartridge() const noexcept { return cartridge_; }

private:
    DotMatrix(HardwareModel model, Sm83 cpu, Bus bus);

    HardwareModel model_;
    Sm83 cpu_;
    Bus bus_;
    std::optional<Cartridge> cartridge_;
};

}  // namespace dotmatrix::core
