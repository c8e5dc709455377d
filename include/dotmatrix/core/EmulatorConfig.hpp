#pragma once

#include "dotmatrix/core/HardwareModel.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace dotmatrix::core {

/// Run settings for the console, stored as JSON:
///   {"model": "dmg", "maxInstructions": 0, "trace": false}
/// Missing keys keep their defaults; unknown keys are ignored.
struct EmulatorConfig {
    HardwareModel model = HardwareModel::Dmg;
    uint64_t maxInstructions = 0;  ///< 0 = no limit
    bool trace = false;            ///< Log every executed instruction
};

std::expected<EmulatorConfig, std::string> parseEmulatorConfig(std::string_view text);

std::expected<EmulatorConfig, std::string> loadEmulatorConfig(const std::filesystem::path& path);

/// Loads the user config file (see common::userConfigPath) when one exists, defaults otherwise.
std::expected<EmulatorConfig, std::string> loadUserEmulatorConfig();

}  // namespace dotmatrix::core
