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
 * @file PETypes.hpp
 * @brief PE header structure definitions with explicit packing.
 *
 * These structures mirror the on-disk PE layout:
 * - Explicit #pragma pack(1), no padding bytes
 * - Read by value through SafeReader, never dereferenced in place
 *
 * @warning Never trust values read from these structures without validation.
 *          All fields can be malicious in hostile PE files.
 */

#include <cstdint>
#include <cstddef>

#include "PEConstants.hpp"

namespace ClusterSig {
namespace PEParser {

#pragma pack(push, 1)

// ============================================================================
// DOS Header (64 bytes)
// ============================================================================

/**
 * @brief DOS header structure at the start of every PE file.
 *
 * @note e_lfanew is SIGNED and can be negative. Always validate before use.
 */
struct DosHeader {
    uint16_t e_magic;      ///< Magic number (must be 0x5A4D = "MZ")
    uint16_t e_cblp;
    uint16_t e_cp;
    uint16_t e_crlc;
    uint16_t e_cparhdr;
    uint16_t e_minalloc;
    uint16_t e_maxalloc;
    uint16_t e_ss;
    uint16_t e_sp;
    uint16_t e_csum;
    uint16_t e_ip;
    uint16_t e_cs;
    uint16_t e_lfarlc;
    uint16_t e_ovno;
    uint16_t e_res[4];
    uint16_t e_oemid;
    uint16_t e_oeminfo;
    uint16_t e_res2[10];
    int32_t  e_lfanew;     ///< File address of NT headers (SIGNED!)
};

static_assert(sizeof(DosHeader) == 64, "DosHeader must be 64 bytes");

// ============================================================================
// COFF File Header (20 bytes)
// ============================================================================

/**
 * @brief COFF file header, immediately after PE signature.
 */
struct FileHeader {
    uint16_t Machine;              ///< Target machine type
    uint16_t NumberOfSections;     ///< Number of sections
    uint32_t TimeDateStamp;        ///< Unix timestamp when file was created
    uint32_t PointerToSymbolTable; ///< File offset of COFF symbol table
    uint32_t NumberOfSymbols;      ///< Number of symbols in symbol table
    uint16_t SizeOfOptionalHeader; ///< Size of optional header
    uint16_t Characteristics;      ///< File characteristics flags
};

static_assert(sizeof(FileHeader) == 20, "FileHeader must be 20 bytes");

// ============================================================================
// Data Directory (8 bytes)
// ============================================================================

struct DataDirectoryEntry {
    uint32_t VirtualAddress;  ///< RVA of the table
    uint32_t Size;            ///< Size of the table in bytes
};

static_assert(sizeof(DataDirectoryEntry) == 8, "DataDirectoryEntry must be 8 bytes");

// ============================================================================
// Optional Headers (without the data directory array)
// ============================================================================

/**
 * @brief PE32 (32-bit) optional header.
 */
struct OptionalHeader32 {
    uint16_t Magic;                   ///< Magic number (0x10B for PE32)
    uint8_t  MajorLinkerVersion;
    uint8_t  MinorLinkerVersion;
    uint32_t SizeOfCode;
    uint32_t SizeOfInitializedData;
    uint32_t SizeOfUninitializedData;
    uint32_t AddressOfEntryPoint;     ///< RVA of entry point
    uint32_t BaseOfCode;
    uint32_t BaseOfData;              ///< PE32 only
    uint32_t ImageBase;
    uint32_t SectionAlignment;
    uint32_t FileAlignment;
    uint16_t MajorOperatingSystemVersion;
    uint16_t MinorOperatingSystemVersion;
    uint16_t MajorImageVersion;
    uint16_t MinorImageVersion;
    uint16_t MajorSubsystemVersion;
    uint16_t MinorSubsystemVersion;
    uint32_t Win32VersionValue;       ///< Reserved, must be 0
    uint32_t SizeOfImage;
    uint32_t SizeOfHeaders;
    uint32_t CheckSum;
    uint16_t Subsystem;
    uint16_t DllCharacteristics;
    uint32_t SizeOfStackReserve;
    uint32_t SizeOfStackCommit;
    uint32_t SizeOfHeapReserve;
    uint32_t SizeOfHeapCommit;
    uint32_t LoaderFlags;
    uint32_t NumberOfRvaAndSizes;     ///< Number of data directories
};

static_assert(sizeof(OptionalHeader32) == 96, "OptionalHeader32 must be 96 bytes");

/**
 * @brief PE32+ (64-bit) optional header.
 */
struct OptionalHeader64 {
    uint16_t Magic;                   ///< Magic number (0x20B for PE32+)
    uint8_t  MajorLinkerVersion;
    uint8_t  MinorLinkerVersion;
    uint32_t SizeOfCode;
    uint32_t SizeOfInitializedData;
    uint32_t SizeOfUninitializedData;
    uint32_t AddressOfEntryPoint;
    uint32_t BaseOfCode;
    uint64_t ImageBase;               ///< 64-bit preferred base
    uint32_t SectionAlignment;
    uint32_t FileAlignment;
    uint16_t MajorOperatingSystemVersion;
    uint16_t MinorOperatingSystemVersion;
    uint16_t MajorImageVersion;
    uint16_t MinorImageVersion;
    uint16_t MajorSubsystemVersion;
    uint16_t MinorSubsystemVersion;
    uint32_t Win32VersionValue;
    uint32_t SizeOfImage;
    uint32_t SizeOfHeaders;
    uint32_t CheckSum;
    uint16_t Subsystem;
    uint16_t DllCharacteristics;
    uint64_t SizeOfStackReserve;
    uint64_t SizeOfStackCommit;
    uint64_t SizeOfHeapReserve;
    uint64_t SizeOfHeapCommit;
    uint32_t LoaderFlags;
    uint32_t NumberOfRvaAndSizes;
};

static_assert(sizeof(OptionalHeader64) == 112, "OptionalHeader64 must be 112 bytes");

// ============================================================================
// Section Header (40 bytes)
// ============================================================================

struct SectionHeader {
    uint8_t  Name[8];             ///< Section name (NOT null-terminated if 8 chars)
    uint32_t VirtualSize;
    uint32_t VirtualAddress;      ///< RVA of section in memory
    uint32_t SizeOfRawData;       ///< Size of section data in file
    uint32_t PointerToRawData;    ///< File offset of section data
    uint32_t PointerToRelocations;
    uint32_t PointerToLinenumbers;
    uint16_t NumberOfRelocations;
    uint16_t NumberOfLinenumbers;
    uint32_t Characteristics;
};

static_assert(sizeof(SectionHeader) == 40, "SectionHeader must be 40 bytes");

// ============================================================================
// Resource Directory
// ============================================================================

struct ResourceDirectory {
    uint32_t Characteristics;
    uint32_t TimeDateStamp;
    uint16_t MajorVersion;
    uint16_t MinorVersion;
    uint16_t NumberOfNamedEntries;  ///< Named entries, listed first
    uint16_t NumberOfIdEntries;     ///< Id entries, after the named ones
};

static_assert(sizeof(ResourceDirectory) == 16, "ResourceDirectory must be 16 bytes");

/**
 * @brief Resource directory entry (8 bytes).
 *
 * High bits are decoded with masks rather than bitfields so the layout
 * does not depend on compiler bitfield ordering.
 */
struct ResourceDirectoryEntry {
    uint32_t Name;          ///< Integer id, or string offset when the high bit is set
    uint32_t OffsetToData;  ///< Data entry offset, or subdirectory offset when the high bit is set

    [[nodiscard]] bool NameIsString() const noexcept { return (Name & Resource::NAME_IS_STRING) != 0; }
    [[nodiscard]] uint32_t NameOffset() const noexcept { return Name & Resource::OFFSET_MASK; }
    [[nodiscard]] uint16_t Id() const noexcept { return static_cast<uint16_t>(Name & 0xFFFF); }
    [[nodiscard]] bool DataIsDirectory() const noexcept { return (OffsetToData & Resource::DATA_IS_DIRECTORY) != 0; }
    [[nodiscard]] uint32_t TargetOffset() const noexcept { return OffsetToData & Resource::OFFSET_MASK; }
};

static_assert(sizeof(ResourceDirectoryEntry) == 8, "ResourceDirectoryEntry must be 8 bytes");

struct ResourceDataEntry {
    uint32_t OffsetToData;  ///< RVA of resource data
    uint32_t Size;          ///< Size of resource data
    uint32_t CodePage;
    uint32_t Reserved;
};

static_assert(sizeof(ResourceDataEntry) == 16, "ResourceDataEntry must be 16 bytes");

#pragma pack(pop)

// ============================================================================
// Layout Offsets
// ============================================================================

/// Size of the "PE\0\0" signature preceding the file header
inline constexpr size_t NT_SIGNATURE_SIZE = sizeof(uint32_t);

/// Offset of the data directory array inside each optional header variant
inline constexpr size_t OPTIONAL_HEADER32_DIRECTORY_OFFSET = sizeof(OptionalHeader32);
inline constexpr size_t OPTIONAL_HEADER64_DIRECTORY_OFFSET = sizeof(OptionalHeader64);

} // namespace PEParser
} // namespace ClusterSig
