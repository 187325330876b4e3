/*
 * ClusterSig - PE Header Clustering and Signature Synthesis
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file PEParser.hpp
 * @brief Tolerant PE header parser.
 *
 * Decodes the DOS header, COFF file header, optional header, data
 * directories, section table and the first entries of the resource tree.
 * Parsing is staged: a failure at one stage stops the later ones but keeps
 * everything decoded so far, so a truncated or malformed sample still
 * yields its leading header fields.
 *
 * @note All parsing operations are noexcept and report errors via PEError.
 * @warning Never trust parsed values without validation - this parser
 *          is designed to handle malicious input safely.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "PEConstants.hpp"
#include "PETypes.hpp"
#include "PEValidation.hpp"
#include "SafeReader.hpp"

namespace ClusterSig {
namespace PEParser {

// Forward declaration for PIMPL
class PEParserImpl;

// ============================================================================
// Parse Stages
// ============================================================================

/**
 * @brief Header extraction stages, in the order they run.
 *
 * PEHeaders::completed names the last stage that finished.
 */
enum class ParseStage : uint8_t {
    None = 0,
    DosHeader,
    FileHeader,        ///< PE signature and COFF header
    OptionalMagic,
    OptionalHeader,
    DataDirectories,
    Sections,
    Resources,
};

[[nodiscard]] const char* ParseStageToString(ParseStage stage) noexcept;

// ============================================================================
// Parsed Information Structures
// ============================================================================

struct DataDirectoryInfo {
    uint32_t rva = 0;               ///< Relative virtual address
    uint32_t size = 0;              ///< Size in bytes
    std::optional<size_t> fileOffset; ///< Computed file offset
};

struct SectionInfo {
    std::string name;               ///< Section name (max 8 chars)
    uint32_t virtualAddress = 0;
    uint32_t virtualSize = 0;
    uint32_t rawAddress = 0;        ///< PointerToRawData
    uint32_t rawSize = 0;           ///< SizeOfRawData
};

/**
 * @brief One leaf of the resource tree (type / name / language).
 */
struct ResourceEntry {
    std::string typeName;           ///< Name string, RT_* symbol, or decimal id
    uint16_t typeId = 0;            ///< Type id (0 when the type is named)
    bool typeIsString = false;
    uint16_t language = 0;          ///< Full LANGID of the leaf (0 above language level)
    uint32_t dataRva = 0;           ///< OffsetToData of the data entry
    uint32_t size = 0;
    uint32_t codePage = 0;
};

/**
 * @brief Everything decoded from one file's headers.
 *
 * Fields belonging to stages that did not complete stay empty.
 */
struct PEHeaders {
    size_t fileSize = 0;
    ParseStage completed = ParseStage::None;

    std::optional<FileHeader> fileHeader;

    std::optional<uint16_t> magic;
    bool is64Bit = false;

    /// Exactly one of these is filled, up to optionalHeaderBytes
    OptionalHeader32 optional32{};
    OptionalHeader64 optional64{};

    /// Bytes of the fixed optional header actually present in the file
    size_t optionalHeaderBytes = 0;

    /// Directory entries read: min(NumberOfRvaAndSizes, 16, entries in file)
    size_t dataDirectoryCount = 0;
    std::array<DataDirectoryInfo, DataDirectory::MAX_ENTRIES> dataDirectories{};

    std::vector<SectionInfo> sections;
    std::vector<ResourceEntry> resources;

    /// Recoverable problems met while parsing
    std::vector<PEError> warnings;

    /**
     * @brief Is [offset, offset+size) of the optional header backed by file bytes?
     */
    [[nodiscard]] bool HasOptionalBytes(size_t offset, size_t size) const noexcept {
        return magic.has_value() && offset + size <= optionalHeaderBytes;
    }
};

/**
 * @brief Parser behaviour switches.
 */
struct ParserOptions {
    ValidationOptions validation;

    /// Resource leaves collected before traversal stops
    size_t maxResourceLeaves = Limits::MAX_RESOURCE_LEAVES;
};

// ============================================================================
// Main Parser Class
// ============================================================================

/**
 * @brief Staged PE header parser.
 *
 * Usage:
 * @code
 *   PEParser parser;
 *   PEHeaders headers;
 *   PEError err;
 *
 *   if (!parser.ParseFile(path, headers, &err)) {
 *       // headers still holds every stage before err
 *   }
 * @endcode
 *
 * @note Single instance should only parse one file at a time.
 */
class PEParser {
public:
    explicit PEParser(const ParserOptions& options = {}) noexcept;

    ~PEParser();

    // Non-copyable
    PEParser(const PEParser&) = delete;
    PEParser& operator=(const PEParser&) = delete;

    // Movable
    PEParser(PEParser&&) noexcept;
    PEParser& operator=(PEParser&&) noexcept;

    // ========================================================================
    // Primary Parsing Methods
    // ========================================================================

    /**
     * @brief Parse a PE file from disk through a read-only memory map.
     *
     * @param path Path to the PE file.
     * @param out Output headers; partially filled on failure.
     * @param err Optional error output describing the stage that failed.
     * @return true if every stage completed.
     */
    [[nodiscard]] bool ParseFile(const std::filesystem::path& path,
                                 PEHeaders& out,
                                 PEError* err = nullptr) noexcept;

    /**
     * @brief Parse an in-memory PE image (zero-copy).
     */
    [[nodiscard]] bool ParseBuffer(const uint8_t* data,
                                   size_t size,
                                   PEHeaders& out,
                                   PEError* err = nullptr) noexcept;

    // ========================================================================
    // Address Translation
    // ========================================================================

    /**
     * @brief Convert RVA to file offset using the last parsed section table.
     * @return File offset, or nullopt if RVA does not map into the file.
     */
    [[nodiscard]] std::optional<size_t> RvaToOffset(uint32_t rva) const noexcept;

    /**
     * @brief Release any memory-mapped file and clear parsed data.
     */
    void Reset() noexcept;

private:
    std::unique_ptr<PEParserImpl> m_impl;
};

} // namespace PEParser
} // namespace ClusterSig
