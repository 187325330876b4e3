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
 * @file PEValidation.hpp
 * @brief Header validation with detailed error reporting.
 *
 * Only the checks needed to locate header fields safely are enforced.
 * Anything a real loader would reject but that still leaves the header
 * bytes readable is tolerated, since clustering works on malformed
 * samples too.
 */

#include <cstdint>
#include <new>
#include <string>

#include "PEConstants.hpp"
#include "PETypes.hpp"
#include "SafeReader.hpp"

namespace ClusterSig {
namespace PEParser {

// ============================================================================
// Validation Result Codes
// ============================================================================

enum class ValidationResult : uint32_t {
    Valid = 0,

    // General errors (1-9)
    UnknownError = 1,
    FileTooSmall = 2,
    FileTooLarge = 3,
    NullPointer = 4,
    IntegerOverflow = 5,
    FileUnreadable = 6,

    // DOS Header failures (10-29)
    InvalidDosSignature = 10,
    LfanewOutOfBounds = 12,
    LfanewNegative = 13,
    LfanewTooSmall = 15,
    LfanewTooLarge = 16,

    // NT Headers failures (30-59)
    InvalidNtSignature = 30,
    InvalidOptionalMagic = 32,
    NtHeadersOutOfBounds = 38,
    OptionalHeaderTruncated = 39,

    // Section failures (60-99)
    SectionTableOutOfBounds = 60,
    SectionTableOverflow = 61,

    // Data Directory failures (100-129)
    DataDirectoryOutOfBounds = 100,
    DataDirectoryRvaInvalid = 102,

    // Resource failures (200-229)
    ResourceDirectoryOutOfBounds = 200,
    ResourceDepthExceeded = 201,
    ResourceCircularReference = 202,
    ResourceEntryCountExceeded = 203,
    ResourceDataOutOfBounds = 204,
    ResourceNameOutOfBounds = 205,
};

/**
 * @brief Convert validation result to string.
 */
[[nodiscard]] const char* ValidationResultToString(ValidationResult result) noexcept;

// ============================================================================
// Error Structure
// ============================================================================

/**
 * @brief Detailed error information for PE parsing operations.
 */
struct PEError {
    ValidationResult code = ValidationResult::Valid;
    std::string message;
    uint64_t offset = 0;      ///< File offset where error occurred
    std::string context;      ///< What was being parsed

    [[nodiscard]] bool HasError() const noexcept {
        return code != ValidationResult::Valid;
    }

    void Clear() noexcept {
        code = ValidationResult::Valid;
        message.clear();
        offset = 0;
        context.clear();
    }

    void Set(ValidationResult c, const char* msg, uint64_t off = 0) noexcept {
        code = c;
        try {
            message = msg ? msg : "";
        }
        catch (const std::bad_alloc&) {
            message.clear();
        }
        offset = off;
    }

    void SetWithContext(ValidationResult c, const char* msg,
                        const char* ctx, uint64_t off = 0) noexcept {
        Set(c, msg, off);
        try {
            context = ctx ? ctx : "";
        }
        catch (const std::bad_alloc&) {
            context.clear();
        }
    }

    /// "context: message (offset 0x..)" for logs and warnings
    [[nodiscard]] std::string Describe() const;
};

// ============================================================================
// Validation Options
// ============================================================================

struct ValidationOptions {
    /// Smaller files are rejected outright
    size_t minFileSize = Limits::MIN_PE_FILE_SIZE;

    /// Accept e_lfanew below 0x40 (NT headers overlapping the DOS header)
    bool allowOverlappingHeaders = false;
};

// ============================================================================
// Validation Functions
// ============================================================================

/**
 * @brief Validate DOS header and locate the NT headers.
 * @param outLfanew Output for e_lfanew value if valid.
 */
[[nodiscard]] ValidationResult ValidateDosHeader(
    const SafeReader& reader,
    const ValidationOptions& options,
    int32_t& outLfanew,
    PEError* err = nullptr) noexcept;

/**
 * @brief Validate the PE signature and read the COFF file header.
 *
 * Machine type and section count are not judged; they are features.
 */
[[nodiscard]] ValidationResult ValidateNtHeaders(
    const SafeReader& reader,
    size_t ntOffset,
    FileHeader& outFileHeader,
    PEError* err = nullptr) noexcept;

/**
 * @brief Read and check the optional header magic.
 * @param outIs64Bit true for PE32+
 */
[[nodiscard]] ValidationResult ValidateOptionalMagic(
    const SafeReader& reader,
    size_t optionalHeaderOffset,
    uint16_t& outMagic,
    bool& outIs64Bit,
    PEError* err = nullptr) noexcept;

} // namespace PEParser
} // namespace ClusterSig
