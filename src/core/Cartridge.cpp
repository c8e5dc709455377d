#include "dotmatrix/core/Cartridge.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <utility>

namespace dotmatrix::core {

Cartridge::Cartridge() : rom_(std::make_shared<const std::vector<uint8_t>>()) {}

Cartridge::Cartridge(std::vector<uint8_t> rom) : rom_(std::make_shared<const std::vector<uint8_t>>(std::move(rom))) {}

uint8_t Cartridge::read(size_t offset) const noexcept {
    if (offset >= rom_->size()) {
        return 0xFF;
    }
    return (*rom_)[offset];
}

std::string Cartridge::title() const {
    std::string title;
    for (size_t i = 0; i < kTitleLength; ++i) {
        const size_t offset = kTitleOffset + i;
        if (offset >= rom_->size()) {
            break;
        }
        const uint8_t byte = (*rom_)[offset];
        if (byte == 0) {
            break;
        }
        title.push_back(byte >= 0x20 && byte < 0x7F ? static_cast<char>(byte) : '?');
    }
    while (!title.empty() && title.back() == ' ') {
        title.pop_back();
    }
    return title;
}

std::expected<Cartridge, std::string> loadCartridgeFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::format("Failed to open ROM '{}'", path.string()));
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(std::format("Failed while reading ROM '{}'", path.string()));
    }
    if (bytes.empty()) {
        return std::unexpected(std::format("ROM '{}' is empty", path.string()));
    }
    return Cartridge(std::move(bytes));
}

}  // namespace dotmatrix::core
