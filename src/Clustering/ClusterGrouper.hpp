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
 * @file ClusterGrouper.hpp
 * @brief Splits a labelled feature table into per-cluster sub-tables.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "ILabelSource.hpp"
#include "../Features/FeatureTable.hpp"

namespace ClusterSig {
namespace Clustering {

struct Cluster {
    int64_t id = kNoiseLabel;
    Features::FeatureTable rows;        ///< Member rows, table order, all columns
    std::vector<size_t> sourceRows;     ///< Row indices in the full table
};

struct GroupingStats {
    size_t labelled = 0;
    size_t noise = 0;
    size_t clusters = 0;
};

class ClusterGrouper {
public:
    /**
     * @brief Group rows by label. Noise rows are dropped.
     *
     * Labels below -1 count as noise. Duplicate filenames stay as
     * separate rows.
     *
     * @return false when the label count differs from the row count.
     */
    [[nodiscard]] static bool Group(const Features::FeatureTable& table,
                                    const std::vector<int64_t>& labels,
                                    std::map<int64_t, Cluster>& out,
                                    GroupingStats* stats = nullptr,
                                    ClusterError* err = nullptr);

    /**
     * @brief Group using the labels already attached to the table.
     */
    [[nodiscard]] static bool Group(const Features::FeatureTable& table,
                                    std::map<int64_t, Cluster>& out,
                                    GroupingStats* stats = nullptr,
                                    ClusterError* err = nullptr);
};

} // namespace Clustering
} // namespace ClusterSig
