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
 * @file ILabelSource.hpp
 * @brief Seam for the external clustering step.
 *
 * Label computation lives outside this project. A label source hands back
 * one label per table row, in row order; -1 marks noise.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "../Features/FeatureTable.hpp"

namespace ClusterSig {
namespace Clustering {

/// Label of rows that belong to no cluster
inline constexpr int64_t kNoiseLabel = -1;

struct ClusterError {
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
    void clear() noexcept { message.clear(); }
};

class ILabelSource {
public:
    virtual ~ILabelSource() = default;

    /**
     * @brief Produce one label per row of the table.
     * @return false with err set when no labels are available.
     */
    [[nodiscard]] virtual bool Assign(const Features::FeatureTable& table,
                                      std::vector<int64_t>& labels,
                                      ClusterError* err = nullptr) noexcept = 0;

    /// Short description for logs
    [[nodiscard]] virtual std::string Describe() const = 0;
};

} // namespace Clustering
} // namespace ClusterSig
