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
 * @file PEConstants.hpp
 * @brief PE (Portable Executable) header constants and parsing limits.
 *
 * Magic numbers, directory indices, resource type codes and the limits
 * that keep header extraction bounded on hostile input.
 */

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace ClusterSig {
namespace PEParser {

// ============================================================================
// DOS Header Constants
// ============================================================================

/// DOS signature "MZ" (little-endian)
inline constexpr uint16_t DOS_SIGNATURE = 0x5A4D;

/// Offset of e_lfanew inside the DOS header
inline constexpr size_t LFANEW_OFFSET = 0x3C;

/// Minimum e_lfanew in strict mode (past DOS header)
inline constexpr int32_t MIN_LFANEW = 0x40;

/// Maximum e_lfanew to prevent scanning entire large files
inline constexpr int32_t MAX_LFANEW = 0x10000000; // 256MB

// ============================================================================
// NT Headers Constants
// ============================================================================

/// PE signature "PE\0\0" (little-endian)
inline constexpr uint32_t NT_SIGNATURE = 0x00004550;

/// Optional header magic for PE32
inline constexpr uint16_t PE32_MAGIC = 0x10B;

/// Optional header magic for PE32+
inline constexpr uint16_t PE64_MAGIC = 0x20B;

/// ROM image magic (recognized, not parsed)
inline constexpr uint16_t ROM_MAGIC = 0x107;

// ============================================================================
// Machine Types
// ============================================================================

namespace Machine {
    inline constexpr uint16_t UNKNOWN = 0x0000;
    inline constexpr uint16_t I386    = 0x014C;  // Intel 386+
    inline constexpr uint16_t ARM     = 0x01C0;  // ARM little-endian
    inline constexpr uint16_t ARMNT   = 0x01C4;  // ARM Thumb-2
    inline constexpr uint16_t IA64    = 0x0200;  // Intel Itanium
    inline constexpr uint16_t AMD64   = 0x8664;  // AMD64 (x64)
    inline constexpr uint16_t ARM64   = 0xAA64;  // ARM64
} // namespace Machine

// ============================================================================
// File Header Characteristics
// ============================================================================

namespace FileCharacteristics {
    inline constexpr uint16_t RELOCS_STRIPPED     = 0x0001;
    inline constexpr uint16_t EXECUTABLE_IMAGE    = 0x0002;
    inline constexpr uint16_t LARGE_ADDRESS_AWARE = 0x0020;
    inline constexpr uint16_t MACHINE_32BIT       = 0x0100;
    inline constexpr uint16_t DEBUG_STRIPPED      = 0x0200;
    inline constexpr uint16_t DLL                 = 0x2000;
} // namespace FileCharacteristics

// ============================================================================
// Data Directory Indices
// ============================================================================

namespace DataDirectory {
    inline constexpr size_t EXPORT         = 0;
    inline constexpr size_t IMPORT         = 1;
    inline constexpr size_t RESOURCE       = 2;
    inline constexpr size_t EXCEPTION      = 3;
    inline constexpr size_t SECURITY       = 4;
    inline constexpr size_t BASERELOC      = 5;
    inline constexpr size_t DEBUG          = 6;
    inline constexpr size_t ARCHITECTURE   = 7;
    inline constexpr size_t GLOBALPTR      = 8;
    inline constexpr size_t TLS            = 9;
    inline constexpr size_t LOAD_CONFIG    = 10;
    inline constexpr size_t BOUND_IMPORT   = 11;
    inline constexpr size_t IAT            = 12;
    inline constexpr size_t DELAY_IMPORT   = 13;
    inline constexpr size_t COM_DESCRIPTOR = 14;
    inline constexpr size_t RESERVED       = 15;
    inline constexpr size_t MAX_ENTRIES    = 16;
} // namespace DataDirectory

// ============================================================================
// Resource Directory Constants
// ============================================================================

namespace Resource {
    /// High bit of an entry's name field: name is a string offset
    inline constexpr uint32_t NAME_IS_STRING = 0x80000000;

    /// High bit of an entry's offset field: target is a subdirectory
    inline constexpr uint32_t DATA_IS_DIRECTORY = 0x80000000;

    /// Mask for the low 31 bits of either field
    inline constexpr uint32_t OFFSET_MASK = 0x7FFFFFFF;

    /// Mask extracting the primary language id from a LANGID
    inline constexpr uint16_t PRIMARY_LANG_MASK = 0x03FF;

    /// Tree levels: type, name/id, language
    inline constexpr uint32_t LEVEL_TYPE = 0;
    inline constexpr uint32_t LEVEL_NAME = 1;
    inline constexpr uint32_t LEVEL_LANGUAGE = 2;
} // namespace Resource

namespace ResourceType {
    inline constexpr uint16_t CURSOR       = 1;
    inline constexpr uint16_t BITMAP       = 2;
    inline constexpr uint16_t ICON         = 3;
    inline constexpr uint16_t MENU         = 4;
    inline constexpr uint16_t DIALOG       = 5;
    inline constexpr uint16_t STRING       = 6;
    inline constexpr uint16_t FONTDIR      = 7;
    inline constexpr uint16_t FONT         = 8;
    inline constexpr uint16_t ACCELERATOR  = 9;
    inline constexpr uint16_t RCDATA       = 10;
    inline constexpr uint16_t MESSAGETABLE = 11;
    inline constexpr uint16_t GROUP_CURSOR = 12;
    inline constexpr uint16_t GROUP_ICON   = 14;
    inline constexpr uint16_t VERSION      = 16;
    inline constexpr uint16_t DLGINCLUDE   = 17;
    inline constexpr uint16_t PLUGPLAY     = 19;
    inline constexpr uint16_t VXD          = 20;
    inline constexpr uint16_t ANICURSOR    = 21;
    inline constexpr uint16_t ANIICON      = 22;
    inline constexpr uint16_t HTML         = 23;
    inline constexpr uint16_t MANIFEST     = 24;

    /**
     * @brief Symbolic name of a predefined resource type id.
     * @return "RT_..." for known ids, empty view otherwise
     */
    [[nodiscard]] constexpr std::string_view Name(uint16_t id) noexcept {
        switch (id) {
        case CURSOR:       return "RT_CURSOR";
        case BITMAP:       return "RT_BITMAP";
        case ICON:         return "RT_ICON";
        case MENU:         return "RT_MENU";
        case DIALOG:       return "RT_DIALOG";
        case STRING:       return "RT_STRING";
        case FONTDIR:      return "RT_FONTDIR";
        case FONT:         return "RT_FONT";
        case ACCELERATOR:  return "RT_ACCELERATOR";
        case RCDATA:       return "RT_RCDATA";
        case MESSAGETABLE: return "RT_MESSAGETABLE";
        case GROUP_CURSOR: return "RT_GROUP_CURSOR";
        case GROUP_ICON:   return "RT_GROUP_ICON";
        case VERSION:      return "RT_VERSION";
        case DLGINCLUDE:   return "RT_DLGINCLUDE";
        case PLUGPLAY:     return "RT_PLUGPLAY";
        case VXD:          return "RT_VXD";
        case ANICURSOR:    return "RT_ANICURSOR";
        case ANIICON:      return "RT_ANIICON";
        case HTML:         return "RT_HTML";
        case MANIFEST:     return "RT_MANIFEST";
        default:           return {};
        }
    }
} // namespace ResourceType

// ============================================================================
// Security Limits - Critical for DoS Prevention
// ============================================================================

namespace Limits {
    /// Maximum file size we'll attempt to parse (2GB)
    inline constexpr size_t MAX_FILE_SIZE = 2ULL * 1024ULL * 1024ULL * 1024ULL;

    /// Maximum number of sections (Windows loader limit is 96, we allow more for analysis)
    inline constexpr uint16_t MAX_SECTIONS = 256;

    /// Maximum resource directory depth
    inline constexpr uint32_t MAX_RESOURCE_DEPTH = 32;

    /// Maximum resource entries per directory
    inline constexpr size_t MAX_RESOURCE_ENTRIES = 10000;

    /// Total resource entries visited in one traversal
    inline constexpr size_t MAX_RESOURCE_VISITS = 4096;

    /// Resource leaves reported per file
    inline constexpr size_t MAX_RESOURCE_LEAVES = 2;

    /// Maximum UTF-16 characters in a resource name string
    inline constexpr size_t MAX_RESOURCE_NAME = 256;

    /// Minimum DOS header size
    inline constexpr size_t MIN_DOS_HEADER_SIZE = 64;

    /// Minimum PE file size (DOS header + PE signature + minimal headers)
    inline constexpr size_t MIN_PE_FILE_SIZE = 128;

    /// Smallest file the relaxed (experimental) mode still looks at
    inline constexpr size_t MIN_TINY_PE_FILE_SIZE = 97;

    /// Maximum optional header size (prevent overflow in section table offset calc)
    inline constexpr uint16_t MAX_OPTIONAL_HEADER_SIZE = 1024;
} // namespace Limits

} // namespace PEParser
} // namespace ClusterSig
