#include "dotmatrix/core/HardwareModel.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace dotmatrix::core {
namespace {

constexpr std::array<std::pair<HardwareModel, std::string_view>, 7> kModelNames = {{
    {HardwareModel::Dmg, "dmg"},
    {HardwareModel::Mgb, "mgb"},
    {HardwareModel::Sgb, "sgb"},
    {HardwareModel::Sgb2, "sgb2"},
    {HardwareModel::Cgb, "cgb"},
    {HardwareModel::Agb, "agb"},
    {HardwareModel::Ags, "ags"},
}};

}  // namespace

std::string_view modelName(HardwareModel model) noexcept {
    for (const auto& [candidate, name] : kModelNames) {
        if (candidate == model) {
            return name;
        }
    }
    return "unknown";
}

std::optional<HardwareModel> parseHardwareModel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    const auto it = std::find_if(kModelNames.begin(), kModelNames.end(),
                                 [&](const auto& entry) { return entry.second == lowered; });
    if (it == kModelNames.end()) {
        return std::nullopt;
    }
    return it->first;
}

}  // namespace dotmatrix::core
