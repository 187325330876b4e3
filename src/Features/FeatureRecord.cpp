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
#include "FeatureRecord.hpp"

#include <string>

namespace ClusterSig {
namespace Features {

namespace {

const std::optional<FeatureValue> kNoValue{};

// Compare two numeric alternatives: -1 below 0, 0 equal, 1 above
int CompareNumbers(const FeatureValue& a, const FeatureValue& b) noexcept {
    const bool aSigned = std::holds_alternative<int64_t>(a);
    const bool bSigned = std::holds_alternative<int64_t>(b);

    if (aSigned && bSigned) {
        const int64_t x = std::get<int64_t>(a);
        const int64_t y = std::get<int64_t>(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (!aSigned && !bSigned) {
        const uint64_t x = std::get<uint64_t>(a);
        const uint64_t y = std::get<uint64_t>(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (aSigned) {
        const int64_t x = std::get<int64_t>(a);
        if (x < 0) return -1;
        const uint64_t ux = static_cast<uint64_t>(x);
        const uint64_t y = std::get<uint64_t>(b);
        return ux < y ? -1 : (ux > y ? 1 : 0);
    }
    return -CompareNumbers(b, a);
}

} // namespace

bool IsNumeric(const FeatureValue& value) noexcept {
    return !std::holds_alternative<std::string>(value);
}

bool IsSentinelValue(const FeatureValue& value) noexcept {
    const auto* v = std::get_if<int64_t>(&value);
    return v != nullptr && *v == kSentinel;
}

bool ValuesEqual(const FeatureValue& a, const FeatureValue& b) noexcept {
    const bool aNum = IsNumeric(a);
    const bool bNum = IsNumeric(b);
    if (aNum != bNum) {
        return false;
    }
    if (!aNum) {
        return std::get<std::string>(a) == std::get<std::string>(b);
    }
    return CompareNumbers(a, b) == 0;
}

bool ValueLess(const FeatureValue& a, const FeatureValue& b) noexcept {
    const bool aNum = IsNumeric(a);
    const bool bNum = IsNumeric(b);
    if (aNum != bNum) {
        return aNum;
    }
    if (!aNum) {
        return std::get<std::string>(a) < std::get<std::string>(b);
    }
    return CompareNumbers(a, b) < 0;
}

bool AsUnsigned(const FeatureValue& value, uint64_t& out) noexcept {
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        out = *u;
        return true;
    }
    if (const auto* s = std::get_if<int64_t>(&value)) {
        if (*s < 0) return false;
        out = static_cast<uint64_t>(*s);
        return true;
    }
    return false;
}

std::optional<double> ToDouble(const FeatureValue& value) noexcept {
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        return static_cast<double>(*u);
    }
    if (const auto* s = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*s);
    }
    return std::nullopt;
}

std::string FormatValue(const FeatureValue& value) {
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        return std::to_string(*u);
    }
    if (const auto* s = std::get_if<int64_t>(&value)) {
        return std::to_string(*s);
    }
    return std::get<std::string>(value);
}

// ============================================================================
// FeatureRecord
// ============================================================================

void FeatureRecord::Set(FeatureId id, FeatureValue value) {
    if (ToIndex(id) >= kFeatureCount) {
        return;
    }
    m_values[ToIndex(id)] = std::move(value);
}

const std::optional<FeatureValue>& FeatureRecord::Get(FeatureId id) const noexcept {
    if (ToIndex(id) >= kFeatureCount) {
        return kNoValue;
    }
    return m_values[ToIndex(id)];
}

std::vector<FeatureId> FeatureRecord::PresentIds() const {
    std::vector<FeatureId> ids;
    ids.reserve(kFeatureCount);
    for (size_t i = 0; i < kFeatureCount; ++i) {
        if (m_values[i].has_value()) {
            ids.push_back(FromIndex(i));
        }
    }
    return ids;
}

size_t FeatureRecord::PresentCount() const noexcept {
    size_t count = 0;
    for (const auto& v : m_values) {
        if (v.has_value()) ++count;
    }
    return count;
}

} // namespace Features
} // namespace ClusterSig
