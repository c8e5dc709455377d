// Build-time generator: turns the declarative opcode tables in data/ into OpcodeTable.hpp/.cpp.
// Any problem with the input data is reported on stderr with a non-zero exit so the build stops.

#include "dotmatrix/opcodes/OpcodeTableSource.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using json = nlohmann::json;

namespace dotmatrix::tools {
namespace {

using namespace dotmatrix::opcodes;

std::string escapeString(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

std::expected<json, std::string> loadJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("failed to open '{}'", path.string()));
    }

    try {
        json parsed;
        in >> parsed;
        return parsed;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("failed to parse '{}': {}", path.string(), e.what()));
    }
}

void emitEnum(std::ostream& out, std::string_view name, const std::vector<OpcodeRecord>& records) {
    out << "enum class " << name << " : uint8_t {\n";
    for (const auto& record : records) {
        out << "    " << record.id << " = " << formatOpcodeByte(record.opcode) << ",\n";
    }
    out << "};\n\n";
}

std::string buildHeader(const std::vector<OpcodeRecord>& base, const std::vector<OpcodeRecord>& prefixed) {
    std::ostringstream out;
    out << "#pragma once\n\n";
    out << "// Generated by dotmatrix_opcodegen from opcodes.json and cb_opcodes.json. Do not edit.\n\n";
    out << "#include <cstdint>\n\n";
    out << "namespace dotmatrix::opcodes {\n\n";
    emitEnum(out, "Opcode", base);
    emitEnum(out, "CbOpcode", prefixed);
    out << "/// Every byte names exactly one opcode, so decoding cannot fail.\n";
    out << "[[nodiscard]] constexpr Opcode decode(uint8_t byte) noexcept {\n";
    out << "    return static_cast<Opcode>(byte);\n";
    out << "}\n\n";
    out << "[[nodiscard]] constexpr CbOpcode decodePrefixed(uint8_t byte) noexcept {\n";
    out << "    return static_cast<CbOpcode>(byte);\n";
    out << "}\n\n";
    out << "}  // namespace dotmatrix::opcodes\n";
    return out.str();
}

void emitPool(std::ostream& out, const std::vector<OpcodeRecord>& records, std::string_view label) {
    for (const auto& record : records) {
        out << "    // " << label << ' ' << formatOpcodeByte(record.opcode) << ' ' << record.mnemonics.front() << '\n';
        for (const auto& expression : record.mcodeExpressions) {
            out << "    MCode{" << expression << "},\n";
        }
    }
}

void emitEntries(std::ostream& out, std::string_view name, const std::vector<OpcodeRecord>& records,
                 size_t& poolOffset) {
    out << "constexpr std::array<OpcodeEntry, 256> " << name << " = {{\n";
    for (const auto& record : records) {
        out << "    {\"" << record.id << "\", \"" << escapeString(record.mnemonics.front()) << "\", "
            << static_cast<unsigned>(record.length) << ", " << poolOffset << ", " << record.mcodeExpressions.size()
            << "},\n";
        poolOffset += record.mcodeExpressions.size();
    }
    out << "}};\n\n";
}

std::string buildSource(const std::vector<OpcodeRecord>& base, const std::vector<OpcodeRecord>& prefixed) {
    size_t poolSize = 0;
    for (const auto& record : base) {
        poolSize += record.mcodeExpressions.size();
    }
    for (const auto& record : prefixed) {
        poolSize += record.mcodeExpressions.size();
    }

    std::ostringstream out;
    out << "// Generated by dotmatrix_opcodegen from opcodes.json and cb_opcodes.json. Do not edit.\n\n";
    out << "#include \"dotmatrix/opcodes/Opcode.hpp\"\n\n";
    out << "#include <array>\n\n";
    out << "namespace dotmatrix::opcodes {\n";
    out << "namespace {\n\n";
    out << "struct OpcodeEntry {\n";
    out << "    std::string_view identifier;\n";
    out << "    std::string_view mnemonic;\n";
    out << "    uint8_t length;\n";
    out << "    uint16_t mcodeOffset;\n";
    out << "    uint8_t mcodeCount;\n";
    out << "};\n\n";
    out << "constexpr std::array<MCode, " << poolSize << "> kMCodePool = {\n";
    emitPool(out, base, "base");
    emitPool(out, prefixed, "cb");
    out << "};\n\n";

    size_t poolOffset = 0;
    emitEntries(out, "kOpcodeEntries", base, poolOffset);
    emitEntries(out, "kCbOpcodeEntries", prefixed, poolOffset);

    out << "std::span<const MCode> poolSlice(const OpcodeEntry& entry) noexcept {\n";
    out << "    return std::span<const MCode>(kMCodePool).subspan(entry.mcodeOffset, entry.mcodeCount);\n";
    out << "}\n\n";
    out << "}  // namespace\n\n";

    const std::array<std::string_view, 2> types = {"Opcode", "CbOpcode"};
    const std::array<std::string_view, 2> tables = {"kOpcodeEntries", "kCbOpcodeEntries"};
    for (size_t i = 0; i < types.size(); ++i) {
        const auto type = types[i];
        const auto table = tables[i];
        out << "std::string_view mnemonic(" << type << " opcode) noexcept {\n";
        out << "    return " << table << "[toByte(opcode)].mnemonic;\n";
        out << "}\n\n";
        out << "std::string_view identifier(" << type << " opcode) noexcept {\n";
        out << "    return " << table << "[toByte(opcode)].identifier;\n";
        out << "}\n\n";
        out << "uint8_t length(" << type << " opcode) noexcept {\n";
        out << "    return " << table << "[toByte(opcode)].length;\n";
        out << "}\n\n";
        out << "std::span<const MCode> mcode(" << type << " opcode) noexcept {\n";
        out << "    return poolSlice(" << table << "[toByte(opcode)]);\n";
        out << "}\n\n";
    }
    out << "}  // namespace dotmatrix::opcodes\n";
    return out.str();
}

/// Rewrite the file only when its content changes so dependent objects are not rebuilt needlessly.
std::expected<void, std::string> writeIfChanged(const std::filesystem::path& path, const std::string& content) {
    {
        std::ifstream existing(path, std::ios::binary);
        if (existing) {
            std::ostringstream current;
            current << existing.rdbuf();
            if (current.str() == content) {
                return {};
            }
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(std::format("failed to create '{}': {}", path.parent_path().string(), ec.message()));
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("failed to open '{}' for writing", path.string()));
    }
    out << content;
    if (!out.good()) {
        return std::unexpected(std::format("failed while writing '{}'", path.string()));
    }
    return {};
}

std::expected<void, std::string> run(const std::filesystem::path& basePath, const std::filesystem::path& prefixedPath,
                                     const std::filesystem::path& headerPath, const std::filesystem::path& sourcePath) {
    const auto baseJson = loadJsonFile(basePath);
    if (!baseJson.has_value()) {
        return std::unexpected(baseJson.error());
    }
    const auto prefixedJson = loadJsonFile(prefixedPath);
    if (!prefixedJson.has_value()) {
        return std::unexpected(prefixedJson.error());
    }

    const auto base = parseTable(*baseJson, TableKind::Base);
    if (!base.has_value()) {
        return std::unexpected(std::format("{}: {}", basePath.filename().string(), base.error()));
    }
    const auto prefixed = parseTable(*prefixedJson, TableKind::Prefixed);
    if (!prefixed.has_value()) {
        return std::unexpected(std::format("{}: {}", prefixedPath.filename().string(), prefixed.error()));
    }

    if (auto result = writeIfChanged(headerPath, buildHeader(*base, *prefixed)); !result.has_value()) {
        return result;
    }
    return writeIfChanged(sourcePath, buildSource(*base, *prefixed));
}

}  // namespace
}  // namespace dotmatrix::tools

int main(int argc, char** argv) {
    if (argc != 5) {
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "dotmatrix_opcodegen")
                  << " <opcodes.json> <cb_opcodes.json> <OpcodeTable.hpp> <OpcodeTable.cpp>\n";
        return 1;
    }

    auto result = dotmatrix::tools::run(argv[1], argv[2], argv[3], argv[4]);
    if (!result.has_value()) {
        std::cerr << "dotmatrix_opcodegen: " << result.error() << '\n';
        return 1;
    }
    return 0;
}
