#include "dotmatrix/core/EmulatorConfig.hpp"

#include "dotmatrix/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace dotmatrix::core {
namespace {

using json = nlohmann::json;

std::expected<EmulatorConfig, std::string> configFromJson(const json& root) {
    if (!root.is_object()) {
        return std::unexpected("Emulator config must be a JSON object");
    }

    EmulatorConfig config;

    if (const auto it = root.find("model"); it != root.end()) {
        if (!it->is_string()) {
            return std::unexpected("'model' must be a string");
        }
        const auto name = it->get<std::string>();
        const auto model = parseHardwareModel(name);
        if (!model.has_value()) {
            return std::unexpected(std::format("Unknown hardware model '{}'", name));
        }
        config.model = *model;
    }

    if (const auto it = root.find("maxInstructions"); it != root.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected("'maxInstructions' must be a non-negative integer");
        }
        config.maxInstructions = it->get<uint64_t>();
    }

    if (const auto it = root.find("trace"); it != root.end()) {
        if (!it->is_boolean()) {
            return std::unexpected("'trace' must be true or false");
        }
        config.trace = it->get<bool>();
    }

    return config;
}

}  // namespace

std::expected<EmulatorConfig, std::string> parseEmulatorConfig(std::string_view text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::format("Malformed emulator config: {}", e.what()));
    }
    return configFromJson(parsed);
}

std::expected<EmulatorConfig, std::string> loadEmulatorConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Failed to open config '{}'", path.string()));
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    auto config = parseEmulatorConfig(contents.str());
    if (!config.has_value()) {
        return std::unexpected(std::format("{}: {}", path.string(), config.error()));
    }
    return config;
}

std::expected<EmulatorConfig, std::string> loadUserEmulatorConfig() {
    const auto path = common::userConfigPath();
    if (path.empty()) {
        return EmulatorConfig{};
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return EmulatorConfig{};
    }
    return loadEmulatorConfig(path);
}

}  // namespace dotmatrix::core
