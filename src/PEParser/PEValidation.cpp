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
/**
 * @file PEValidation.cpp
 * @brief Header validation implementation.
 */

#include "PEValidation.hpp"

#include <cstddef>
#include <cstdio>

namespace ClusterSig {
namespace PEParser {

// ============================================================================
// Validation Result String Conversion
// ============================================================================

const char* ValidationResultToString(ValidationResult result) noexcept {
    switch (result) {
        case ValidationResult::Valid: return "Valid";
        case ValidationResult::UnknownError: return "Unknown error";
        case ValidationResult::FileTooSmall: return "File too small to be a valid PE";
        case ValidationResult::FileTooLarge: return "File exceeds maximum supported size";
        case ValidationResult::NullPointer: return "Null pointer provided";
        case ValidationResult::IntegerOverflow: return "Integer overflow detected";
        case ValidationResult::FileUnreadable: return "File could not be opened or mapped";

        case ValidationResult::InvalidDosSignature: return "Invalid DOS signature (expected MZ)";
        case ValidationResult::LfanewOutOfBounds: return "e_lfanew points outside file";
        case ValidationResult::LfanewNegative: return "e_lfanew is negative";
        case ValidationResult::LfanewTooSmall: return "e_lfanew is too small";
        case ValidationResult::LfanewTooLarge: return "e_lfanew exceeds maximum allowed";

        case ValidationResult::InvalidNtSignature: return "Invalid NT signature (expected PE\\0\\0)";
        case ValidationResult::InvalidOptionalMagic: return "Invalid optional header magic";
        case ValidationResult::NtHeadersOutOfBounds: return "NT headers extend beyond file";
        case ValidationResult::OptionalHeaderTruncated: return "Optional header truncated";

        case ValidationResult::SectionTableOutOfBounds: return "Section table extends beyond file";
        case ValidationResult::SectionTableOverflow: return "Section table size overflow";

        case ValidationResult::DataDirectoryOutOfBounds: return "Data directory extends beyond file";
        case ValidationResult::DataDirectoryRvaInvalid: return "Data directory RVA does not map to file";

        case ValidationResult::ResourceDirectoryOutOfBounds: return "Resource directory beyond file";
        case ValidationResult::ResourceDepthExceeded: return "Resource directory depth exceeded";
        case ValidationResult::ResourceCircularReference: return "Circular resource reference";
        case ValidationResult::ResourceEntryCountExceeded: return "Resource entry count exceeded";
        case ValidationResult::ResourceDataOutOfBounds: return "Resource data beyond file";
        case ValidationResult::ResourceNameOutOfBounds: return "Resource name beyond file";

        default: return "Unknown validation result";
    }
}

std::string PEError::Describe() const {
    std::string out;
    if (!context.empty()) {
        out += context;
        out += ": ";
    }
    out += message.empty() ? ValidationResultToString(code) : message;

    char buf[32];
    std::snprintf(buf, sizeof(buf), " (offset 0x%llx)", static_cast<unsigned long long>(offset));
    out += buf;
    return out;
}

// ============================================================================
// DOS Header Validation
// ============================================================================

ValidationResult ValidateDosHeader(
    const SafeReader& reader,
    const ValidationOptions& options,
    int32_t& outLfanew,
    PEError* err) noexcept
{
    outLfanew = 0;

    if (reader.Size() < options.minFileSize) {
        if (err) {
            err->Set(ValidationResult::FileTooSmall,
                     "File is smaller than minimum PE size",
                     0);
        }
        return ValidationResult::FileTooSmall;
    }

    if (reader.Size() > Limits::MAX_FILE_SIZE) {
        if (err) {
            err->Set(ValidationResult::FileTooLarge,
                     "File exceeds maximum supported size",
                     0);
        }
        return ValidationResult::FileTooLarge;
    }

    DosHeader dos;
    if (!reader.Read(0, dos)) {
        if (err) {
            err->Set(ValidationResult::FileTooSmall,
                     "Cannot read DOS header",
                     0);
        }
        return ValidationResult::FileTooSmall;
    }

    if (dos.e_magic != DOS_SIGNATURE) {
        if (err) {
            err->Set(ValidationResult::InvalidDosSignature,
                     "Invalid DOS signature (expected 0x5A4D 'MZ')",
                     0);
        }
        return ValidationResult::InvalidDosSignature;
    }

    // e_lfanew is SIGNED
    if (dos.e_lfanew < 0) {
        if (err) {
            err->Set(ValidationResult::LfanewNegative,
                     "e_lfanew is negative",
                     offsetof(DosHeader, e_lfanew));
        }
        return ValidationResult::LfanewNegative;
    }

    // Tiny PEs place the NT headers inside the DOS header; only allowed when relaxed
    if (dos.e_lfanew < MIN_LFANEW && !options.allowOverlappingHeaders) {
        if (err) {
            err->Set(ValidationResult::LfanewTooSmall,
                     "e_lfanew is too small (overlaps DOS header)",
                     offsetof(DosHeader, e_lfanew));
        }
        return ValidationResult::LfanewTooSmall;
    }

    if (dos.e_lfanew > MAX_LFANEW) {
        if (err) {
            err->Set(ValidationResult::LfanewTooLarge,
                     "e_lfanew exceeds maximum allowed offset",
                     offsetof(DosHeader, e_lfanew));
        }
        return ValidationResult::LfanewTooLarge;
    }

    // Need space for at least PE signature + file header
    const size_t minNtSize = NT_SIGNATURE_SIZE + sizeof(FileHeader);
    size_t ntEnd;
    if (!SafeMath::SafeAdd(static_cast<size_t>(dos.e_lfanew), minNtSize, ntEnd)) {
        if (err) {
            err->Set(ValidationResult::IntegerOverflow,
                     "Integer overflow checking NT headers bounds",
                     offsetof(DosHeader, e_lfanew));
        }
        return ValidationResult::IntegerOverflow;
    }

    if (ntEnd > reader.Size()) {
        if (err) {
            err->Set(ValidationResult::LfanewOutOfBounds,
                     "e_lfanew points beyond file boundary",
                     offsetof(DosHeader, e_lfanew));
        }
        return ValidationResult::LfanewOutOfBounds;
    }

    outLfanew = dos.e_lfanew;
    return ValidationResult::Valid;
}

// ============================================================================
// NT Headers Validation
// ============================================================================

ValidationResult ValidateNtHeaders(
    const SafeReader& reader,
    size_t ntOffset,
    FileHeader& outFileHeader,
    PEError* err) noexcept
{
    uint32_t signature;
    if (!reader.ReadU32LE(ntOffset, signature)) {
        if (err) {
            err->Set(ValidationResult::NtHeadersOutOfBounds,
                     "Cannot read PE signature",
                     ntOffset);
        }
        return ValidationResult::NtHeadersOutOfBounds;
    }

    if (signature != NT_SIGNATURE) {
        if (err) {
            err->Set(ValidationResult::InvalidNtSignature,
                     "Invalid PE signature (expected 0x00004550)",
                     ntOffset);
        }
        return ValidationResult::InvalidNtSignature;
    }

    const size_t fileHeaderOffset = ntOffset + NT_SIGNATURE_SIZE;
    if (!reader.Read(fileHeaderOffset, outFileHeader)) {
        if (err) {
            err->Set(ValidationResult::NtHeadersOutOfBounds,
                     "Cannot read file header",
                     fileHeaderOffset);
        }
        return ValidationResult::NtHeadersOutOfBounds;
    }

    return ValidationResult::Valid;
}

// ============================================================================
// Optional Header Magic
// ============================================================================

ValidationResult ValidateOptionalMagic(
    const SafeReader& reader,
    size_t optionalHeaderOffset,
    uint16_t& outMagic,
    bool& outIs64Bit,
    PEError* err) noexcept
{
    outMagic = 0;
    outIs64Bit = false;

    if (!reader.ReadU16LE(optionalHeaderOffset, outMagic)) {
        if (err) {
            err->Set(ValidationResult::NtHeadersOutOfBounds,
                     "Cannot read optional header magic",
                     optionalHeaderOffset);
        }
        return ValidationResult::NtHeadersOutOfBounds;
    }

    if (outMagic == PE32_MAGIC) {
        return ValidationResult::Valid;
    }
    if (outMagic == PE64_MAGIC) {
        outIs64Bit = true;
        return ValidationResult::Valid;
    }

    if (err) {
        err->Set(ValidationResult::InvalidOptionalMagic,
                 outMagic == ROM_MAGIC ? "ROM image optional header is not supported"
                                       : "Invalid optional header magic",
                 optionalHeaderOffset);
    }
    return ValidationResult::InvalidOptionalMagic;
}

} // namespace PEParser
} // namespace ClusterSig
