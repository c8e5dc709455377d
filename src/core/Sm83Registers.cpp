#include "dotmatrix/core/Sm83Registers.hpp"

namespace dotmatrix::core {

Sm83Registers Sm83Registers::initialFor(HardwareModel model) noexcept {
    //                       0xHH_LL_DD_EE_BB_CC_AA_FF
    switch (model) {
    case HardwareModel::Dmg:
        return fromRaw(0x01'4D'00'D8'00'13'01'B0);
    case HardwareModel::Mgb:
        return fromRaw(0x01'4D'00'D8'00'13'FF'B0);
    case HardwareModel::Sgb:
        return fromRaw(0xC0'60'00'00'00'14'01'00);
    case HardwareModel::Sgb2: {
        // Only A is documented for SGB2; the rest follows SGB.
        auto registers = fromRaw(0xC0'60'00'00'00'14'01'00);
        registers.setA(0xFF);
        return registers;
    }
    case HardwareModel::Cgb:
        return fromRaw(0x00'7C'00'08'00'00'11'80);
    case HardwareModel::Agb:
    case HardwareModel::Ags:
        return fromRaw(0x00'7C'00'08'01'00'11'00);
    }
    return fromRaw(0x01'4D'00'D8'00'13'01'B0);
}

}  // namespace dotmatrix::core
