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
 * @file FeatureCatalog.hpp
 * @brief The fixed catalog of header fields a feature record can hold.
 *
 * Every column of a feature table is one of these ids. Catalog names are
 * the human-readable column names used in table files; identifiers are the
 * lower-case, underscore-joined form used in YARA rules.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ClusterSig {
namespace Features {

// ============================================================================
// FEATURE IDS
// ============================================================================

enum class FeatureId : uint8_t {
    // File header
    MachineType = 0,
    NumberOfSections,
    CompileDate,
    PointerToSymbolTable,
    NumberOfSymbols,
    SizeOfOptionalHeader,
    Characteristics,

    // Optional header
    Magic,
    MajorLinkerVersion,
    MinorLinkerVersion,
    SizeOfCode,
    SizeOfInitializedData,
    SizeOfUninitializedData,
    EntryPointAddress,
    BaseOfCode,
    BaseOfData,
    ImageBase,
    SectionAlignment,
    FileAlignment,
    MajorOsVersion,
    MinorOsVersion,
    MajorImageVersion,
    MinorImageVersion,
    MajorSubsystemVersion,
    MinorSubsystemVersion,
    SizeOfImage,
    SizeOfHeaders,
    Checksum,
    Subsystem,
    DllCharacteristics,
    SizeOfStackReserve,
    SizeOfStackCommit,
    SizeOfHeapReserve,
    SizeOfHeapCommit,
    LoaderFlags,
    NumberOfRvaAndSizes,

    // Data directories (size, virtual address)
    ExportTableSize,
    ExportTableVirtualAddress,
    ImportTableSize,
    ImportTableVirtualAddress,
    ResourceTableSize,
    ResourceTableVirtualAddress,
    ExceptionTableSize,
    ExceptionTableVirtualAddress,
    BaseRelocationTableSize,
    BaseRelocationTableVirtualAddress,
    DebugSize,
    DebugVirtualAddress,
    TlsTableSize,
    TlsTableVirtualAddress,
    ImportAddressTableSize,
    ImportAddressTableVirtualAddress,

    // Resource leaves
    Resource0Size,
    Resource0Offset,
    Resource0Language,
    Resource1Size,
    Resource1Offset,
    Resource1Language,

    Count
};

inline constexpr size_t kFeatureCount = static_cast<size_t>(FeatureId::Count);

enum class FeatureGroup : uint8_t {
    FileHeader,
    OptionalHeader,
    DataDirectory,
    Resource,
};

struct FeatureDescriptor {
    FeatureId id;
    const char* name;            ///< Catalog (column) name
    FeatureGroup group;
    bool wide;                   ///< 64-bit in PE32+
    bool alwaysMeaningful;       ///< Kept even when constant at the sentinel
};

// ============================================================================
// DATA DIRECTORY SUBSET
// ============================================================================

/// Directories that contribute features, with the catalog ids they map to
struct DirectoryFeature {
    size_t index;                ///< Index in the optional header's directory array
    FeatureId sizeId;
    FeatureId addressId;
};

inline constexpr DirectoryFeature kDirectoryFeatures[] = {
    { 0,  FeatureId::ExportTableSize,         FeatureId::ExportTableVirtualAddress },
    { 1,  FeatureId::ImportTableSize,         FeatureId::ImportTableVirtualAddress },
    { 2,  FeatureId::ResourceTableSize,       FeatureId::ResourceTableVirtualAddress },
    { 3,  FeatureId::ExceptionTableSize,      FeatureId::ExceptionTableVirtualAddress },
    { 5,  FeatureId::BaseRelocationTableSize, FeatureId::BaseRelocationTableVirtualAddress },
    { 6,  FeatureId::DebugSize,               FeatureId::DebugVirtualAddress },
    { 9,  FeatureId::TlsTableSize,            FeatureId::TlsTableVirtualAddress },
    { 12, FeatureId::ImportAddressTableSize,  FeatureId::ImportAddressTableVirtualAddress },
};

/// Resource leaves recorded per file
inline constexpr size_t kResourceSlots = 2;

struct ResourceFeature {
    FeatureId sizeId;
    FeatureId offsetId;
    FeatureId languageId;
};

inline constexpr ResourceFeature kResourceFeatures[kResourceSlots] = {
    { FeatureId::Resource0Size, FeatureId::Resource0Offset, FeatureId::Resource0Language },
    { FeatureId::Resource1Size, FeatureId::Resource1Offset, FeatureId::Resource1Language },
};

// ============================================================================
// LOOKUP
// ============================================================================

[[nodiscard]] const FeatureDescriptor& Describe(FeatureId id) noexcept;

[[nodiscard]] const char* FeatureName(FeatureId id) noexcept;

/**
 * @brief Find a feature by its catalog name (exact match).
 */
[[nodiscard]] std::optional<FeatureId> FindFeature(std::string_view name) noexcept;

/**
 * @brief YARA identifier form: lower-case, spaces replaced with underscores.
 *
 * "DLL characteristics" becomes "dll_characteristics".
 */
[[nodiscard]] std::string Identifier(FeatureId id);

[[nodiscard]] inline constexpr size_t ToIndex(FeatureId id) noexcept {
    return static_cast<size_t>(id);
}

[[nodiscard]] inline constexpr FeatureId FromIndex(size_t index) noexcept {
    return static_cast<FeatureId>(index);
}

[[nodiscard]] bool IsFileHeaderField(FeatureId id) noexcept;

/// Optional header fields and the data directory pairs
[[nodiscard]] bool IsOptionalHeaderField(FeatureId id) noexcept;

[[nodiscard]] bool IsResourceField(FeatureId id) noexcept;

[[nodiscard]] bool IsWideField(FeatureId id) noexcept;

[[nodiscard]] bool IsAlwaysMeaningful(FeatureId id) noexcept;

} // namespace Features
} // namespace ClusterSig
