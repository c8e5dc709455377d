#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dotmatrix::core {

/// A cartridge plugged into the console. Holds the ROM image, shared between every owner
/// (the console and bus-mapped ROM pages) and never modified after construction.
class Cartridge {
public:
    static constexpr size_t kTitleOffset = 0x0134;
    static constexpr size_t kTitleLength = 16;

    /// An empty cartridge; every read returns 0xFF (open bus).
    Cartridge();
    explicit Cartridge(std::vector<uint8_t> rom);

    /// Byte at a ROM offset, or 0xFF past the end of the image.
    [[nodiscard]] uint8_t read(size_t offset) const noexcept;

    [[nodiscard]] size_t size() const noexcept { return rom_->size(); }

    /// Header title (0x0134..0x0143), cut at the first NUL with trailing spaces removed.
    /// Non-printable bytes are replaced with '?'.
    [[nodiscard]] std::string title() const;

    [[nodiscard]] const std::shared_ptr<const std::vector<uint8_t>>& rom() const noexcept { return rom_; }

private:
    std::shared_ptr<const std::vector<uint8_t>> rom_;
};

/// Reads a ROM image from disk.
std::expected<Cartridge, std::string> loadCartridgeFile(const std::filesystem::path& path);

}  // namespace dotmatrix::core
