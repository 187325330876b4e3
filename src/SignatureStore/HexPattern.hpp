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
 * @file HexPattern.hpp
 * @brief Little-endian hex packing and nibble-level consensus.
 *
 * A packed value is a string of lower-case hex digits, two per byte, least
 * significant byte first: 0x1000 at width 4 is "00100000". A consensus
 * keeps a digit where every input agrees and writes '?' elsewhere.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ClusterSig {
namespace SignatureStore {

/// Wildcard nibble in consensus patterns
constexpr char WILDCARD_NIBBLE = '?';

/**
 * @brief Pack value as widthBytes little-endian bytes in hex.
 * @return false if the value does not fit or widthBytes is not 1..8.
 */
[[nodiscard]] bool PackLittleEndianHex(uint64_t value, size_t widthBytes, std::string& out);

/**
 * @brief Inverse of PackLittleEndianHex. Accepts either digit case.
 */
[[nodiscard]] bool UnpackLittleEndianHex(std::string_view hex, uint64_t& out) noexcept;

/**
 * @brief Position-wise agreement over equally long patterns.
 *
 * Inputs may already contain wildcards; a wildcard never turns back into
 * a literal. The result does not depend on input order.
 *
 * @return false for an empty input or mismatched lengths.
 */
[[nodiscard]] bool BuildConsensus(const std::vector<std::string>& patterns, std::string& out);

/**
 * @brief Pack each value at widthBytes and build their consensus.
 * @return false if any value does not fit.
 */
[[nodiscard]] bool BuildValueConsensus(const std::vector<uint64_t>& values,
                                       size_t widthBytes,
                                       std::string& out);

[[nodiscard]] bool IsFullyWildcarded(std::string_view pattern) noexcept;

[[nodiscard]] size_t CountWildcards(std::string_view pattern) noexcept;

/**
 * @brief Split into space separated byte pairs for a YARA hex string.
 *
 * "0?100000" becomes "0? 10 00 00".
 */
[[nodiscard]] std::string ToYaraHexString(std::string_view pattern);

} // namespace SignatureStore
} // namespace ClusterSig
