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
#include "HexPattern.hpp"

#include <algorithm>
#include <utility>

namespace ClusterSig {
namespace SignatureStore {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool PackLittleEndianHex(uint64_t value, size_t widthBytes, std::string& out) {
    if (widthBytes == 0 || widthBytes > sizeof(uint64_t)) {
        return false;
    }
    if (widthBytes < sizeof(uint64_t) && (value >> (8 * widthBytes)) != 0) {
        return false;
    }

    out.clear();
    out.reserve(widthBytes * 2);
    for (size_t i = 0; i < widthBytes; ++i) {
        const auto byte = static_cast<uint8_t>(value >> (8 * i));
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return true;
}

bool UnpackLittleEndianHex(std::string_view hex, uint64_t& out) noexcept {
    if (hex.empty() || hex.size() % 2 != 0 || hex.size() > 2 * sizeof(uint64_t)) {
        return false;
    }

    uint64_t value = 0;
    for (size_t i = 0; i < hex.size() / 2; ++i) {
        const int hi = HexValue(hex[2 * i]);
        const int lo = HexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        value |= static_cast<uint64_t>((hi << 4) | lo) << (8 * i);
    }
    out = value;
    return true;
}

bool BuildConsensus(const std::vector<std::string>& patterns, std::string& out) {
    if (patterns.empty()) {
        return false;
    }
    const size_t length = patterns.front().size();
    for (const auto& p : patterns) {
        if (p.size() != length) return false;
    }

    out = patterns.front();
    for (size_t pos = 0; pos < length; ++pos) {
        for (const auto& p : patterns) {
            if (p[pos] == WILDCARD_NIBBLE || p[pos] != out[pos]) {
                out[pos] = WILDCARD_NIBBLE;
                break;
            }
        }
    }
    return true;
}

bool BuildValueConsensus(const std::vector<uint64_t>& values, size_t widthBytes, std::string& out) {
    std::vector<std::string> packed;
    packed.reserve(values.size());
    for (uint64_t v : values) {
        std::string hex;
        if (!PackLittleEndianHex(v, widthBytes, hex)) {
            return false;
        }
        packed.push_back(std::move(hex));
    }
    return BuildConsensus(packed, out);
}

bool IsFullyWildcarded(std::string_view pattern) noexcept {
    return !pattern.empty() &&
           std::all_of(pattern.begin(), pattern.end(), [](char c) { return c == WILDCARD_NIBBLE; });
}

size_t CountWildcards(std::string_view pattern) noexcept {
    return static_cast<size_t>(std::count(pattern.begin(), pattern.end(), WILDCARD_NIBBLE));
}

std::string ToYaraHexString(std::string_view pattern) {
    std::string out;
    out.reserve(pattern.size() + pattern.size() / 2);
    for (size_t i = 0; i < pattern.size(); i += 2) {
        if (i > 0) out.push_back(' ');
        out.append(pattern.substr(i, 2));
    }
    return out;
}

} // namespace SignatureStore
} // namespace ClusterSig
