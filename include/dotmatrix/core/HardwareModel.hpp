#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace dotmatrix::core {

/// Hardware revisions of the handheld. Each boots into a different register pattern.
enum class HardwareModel : uint8_t {
    Dmg,   ///< Original Game Boy
    Mgb,   ///< Game Boy Pocket
    Sgb,   ///< Super Game Boy
    Sgb2,  ///< Super Game Boy 2
    Cgb,   ///< Game Boy Color
    Agb,   ///< Game Boy Advance
    Ags,   ///< Game Boy Advance SP
};

/// Lower case short name, e.g. "dmg".
std::string_view modelName(HardwareModel model) noexcept;

/// Parses a short name case-insensitively. Returns nullopt for unknown names.
std::optional<HardwareModel> parseHardwareModel(std::string_view name);

}  // namespace dotmatrix::core
