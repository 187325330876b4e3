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
/*
 * ============================================================================
 * ClusterSig SignatureFormat - synthesized signature data model
 * ============================================================================
 *
 * A Signature is what the synthesizer derives from one cluster before it is
 * rendered as a YARA rule:
 *
 *   meta            author, contact, cluster id, one sample_<i> per row
 *   file header     field == value assertions (pe module)
 *   optional header one hex pattern per field, '?' = wildcard nibble
 *
 * Only signatures with a non-empty optional header block are written.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../Features/FeatureCatalog.hpp"

namespace ClusterSig {
namespace SignatureStore {

// ============================================================================
// CORE CONSTANTS
// ============================================================================

constexpr size_t PACK_WIDTH_DEFAULT = 4;                 // Bytes per packed field
constexpr size_t PACK_WIDTH_WIDE = 8;                    // Wide fields in PE32+
constexpr size_t MAX_CONSENSUS_VALUES = 9;               // Distinct values per wildcarded column
constexpr size_t FILE_HEADER_PATTERN_BYTES = 20;         // COFF file header
constexpr uint64_t MAX_CONSENSUS_VALUE = 0xFFFFFFFFULL;  // Consensus packs at 4 bytes

constexpr const char* DEFAULT_RULE_EXTENSION = "yar";

// ============================================================================
// CLUSTER TYPES
// ============================================================================

/// Algorithms whose labels are accepted; the name prefixes every rule
constexpr const char* SUPPORTED_CLUSTER_TYPES[] = { "dbscan", "meanshift", "kmeans" };

[[nodiscard]] bool IsSupportedClusterType(const std::string& type) noexcept;

// ============================================================================
// CANDIDATE CLASSIFICATION
// ============================================================================

enum class CandidateClass : uint8_t {
    ConstantUseful = 0,         // Same value in every row, kept
    ConstantSuppressed,         // Same value, but nothing to anchor on
    VariableConvertible,        // Differs, partial wildcard pattern found
    VariableUnconvertible,      // Differs, contributes nothing
};

[[nodiscard]] const char* CandidateClassToString(CandidateClass c) noexcept;

enum class HeaderRegion : uint8_t {
    None = 0,                   // Resource columns
    FileHeader,
    OptionalHeader,
};

struct CandidateField {
    Features::FeatureId id{Features::FeatureId::MachineType};
    CandidateClass classification{CandidateClass::VariableUnconvertible};
    HeaderRegion region{HeaderRegion::None};
    size_t distinctValues{0};
    std::string reason;                                  // Why it was dropped, if it was
};

// ============================================================================
// SIGNATURE
// ============================================================================

struct FileHeaderAssertion {
    Features::FeatureId id{Features::FeatureId::MachineType};
    uint64_t value{0};                                   // Representative sample's value
};

struct OptionalHeaderPattern {
    Features::FeatureId id{Features::FeatureId::Magic};
    std::string hex;                                     // Little-endian, two digits per byte
    bool wildcarded{false};                              // Built by consensus
};

struct Signature {
    int64_t clusterId{-1};
    std::string clusterType;
    std::vector<std::pair<std::string, std::string>> meta;

    std::vector<FileHeaderAssertion> fileHeader;
    std::vector<OptionalHeaderPattern> optionalHeader;

    /// 40 hex digits over the COFF header (experimental mode only)
    std::optional<std::string> fileHeaderPattern;

    std::string representative;
    size_t representativeRow{0};

    std::vector<CandidateField> candidates;

    /// A cluster is written only with optional header content
    [[nodiscard]] bool IsEmitable() const noexcept {
        return !optionalHeader.empty();
    }

    [[nodiscard]] size_t CountOf(CandidateClass c) const noexcept {
        size_t n = 0;
        for (const auto& f : candidates) {
            if (f.classification == c) ++n;
        }
        return n;
    }
};

// ============================================================================
// ERROR HANDLING
// ============================================================================

enum class SignatureStoreError : uint32_t {
    Success = 0,
    InvalidSignature,           // Nothing to emit
    CompilationFailed,          // Yara rule compilation failed
    WriteFailed,
    OutOfMemory,
    Unknown = 0xFFFFFFFF
};

struct StoreError {
    SignatureStoreError code{SignatureStoreError::Success};
    int errnoValue{0};
    std::string message;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return code == SignatureStoreError::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return IsSuccess();
    }

    [[nodiscard]] static StoreError Success() noexcept {
        return StoreError{ SignatureStoreError::Success, 0, {} };
    }

    void Clear() noexcept {
        code = SignatureStoreError::Success;
        errnoValue = 0;
        message.clear();
    }
};

} // namespace SignatureStore
} // namespace ClusterSig
