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
 * @file FeatureRecord.hpp
 * @brief Per-file feature vector over the fixed catalog.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "FeatureCatalog.hpp"

namespace ClusterSig {
namespace Features {

/**
 * @brief A single feature value.
 *
 * Parsed header fields are always unsigned. Signed values appear only for
 * the -1 sentinel and for numbers loaded from a table file; strings only
 * come from table files.
 */
using FeatureValue = std::variant<int64_t, uint64_t, std::string>;

/// Marks a field the source file did not have
inline constexpr int64_t kSentinel = -1;

// ============================================================================
// VALUE HELPERS
// ============================================================================

[[nodiscard]] bool IsNumeric(const FeatureValue& value) noexcept;

[[nodiscard]] bool IsSentinelValue(const FeatureValue& value) noexcept;

/**
 * @brief Equality with signed and unsigned numbers compared by value.
 *
 * int64_t{5} equals uint64_t{5}; a number never equals a string.
 */
[[nodiscard]] bool ValuesEqual(const FeatureValue& a, const FeatureValue& b) noexcept;

/**
 * @brief Strict weak ordering consistent with ValuesEqual.
 *
 * Numbers order by value and sort before strings.
 */
[[nodiscard]] bool ValueLess(const FeatureValue& a, const FeatureValue& b) noexcept;

/**
 * @brief Non-negative numeric value as uint64_t.
 * @return false for strings and negative numbers.
 */
[[nodiscard]] bool AsUnsigned(const FeatureValue& value, uint64_t& out) noexcept;

/// Numeric projection; strings give nullopt
[[nodiscard]] std::optional<double> ToDouble(const FeatureValue& value) noexcept;

/// Decimal for numbers, the text itself for strings
[[nodiscard]] std::string FormatValue(const FeatureValue& value);

// ============================================================================
// FEATURE RECORD
// ============================================================================

class FeatureRecord {
public:
    FeatureRecord() = default;
    explicit FeatureRecord(std::string filename) : m_filename(std::move(filename)) {}

    [[nodiscard]] const std::string& Filename() const noexcept { return m_filename; }
    void SetFilename(std::string filename) { m_filename = std::move(filename); }

    void Set(FeatureId id, FeatureValue value);

    /// Convenience for header fields
    void SetUnsigned(FeatureId id, uint64_t value) { Set(id, FeatureValue{value}); }

    [[nodiscard]] bool Has(FeatureId id) const noexcept {
        return ToIndex(id) < kFeatureCount && m_values[ToIndex(id)].has_value();
    }

    [[nodiscard]] const std::optional<FeatureValue>& Get(FeatureId id) const noexcept;

    /// Present ids in catalog order
    [[nodiscard]] std::vector<FeatureId> PresentIds() const;

    [[nodiscard]] size_t PresentCount() const noexcept;

    [[nodiscard]] bool Empty() const noexcept { return PresentCount() == 0; }

private:
    std::string m_filename;
    std::array<std::optional<FeatureValue>, kFeatureCount> m_values{};
};

} // namespace Features
} // namespace ClusterSig
