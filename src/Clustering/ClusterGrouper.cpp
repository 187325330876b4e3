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
#include "ClusterGrouper.hpp"
#include "../Utils/Logger.hpp"

#include <string>
#include <utility>

namespace ClusterSig {
namespace Clustering {

bool ClusterGrouper::Group(const Features::FeatureTable& table,
                           const std::vector<int64_t>& labels,
                           std::map<int64_t, Cluster>& out,
                           GroupingStats* stats,
                           ClusterError* err) {
    out.clear();
    GroupingStats local;

    if (labels.size() != table.RowCount()) {
        if (err) {
            err->message = "Label count " + std::to_string(labels.size()) +
                           " does not match row count " + std::to_string(table.RowCount());
        }
        return false;
    }

    std::map<int64_t, std::vector<size_t>> members;
    size_t belowNoise = 0;
    for (size_t r = 0; r < labels.size(); ++r) {
        const int64_t label = labels[r];
        if (label < kNoiseLabel) {
            ++belowNoise;
        }
        if (label <= kNoiseLabel) {
            ++local.noise;
            continue;
        }
        ++local.labelled;
        members[label].push_back(r);
    }

    if (belowNoise > 0) {
        CS_LOG_WARN("ClusterGrouper", "%zu rows carry labels below -1, treated as noise", belowNoise);
    }

    for (auto& [label, rows] : members) {
        Cluster cluster;
        cluster.id = label;
        cluster.rows = table.Subset(rows);
        cluster.sourceRows = std::move(rows);
        out.emplace(label, std::move(cluster));
    }
    local.clusters = out.size();

    CS_LOG_INFO("ClusterGrouper", "%zu clusters, %zu labelled rows, %zu noise rows",
                local.clusters, local.labelled, local.noise);

    if (stats) *stats = local;
    return true;
}

bool ClusterGrouper::Group(const Features::FeatureTable& table,
                           std::map<int64_t, Cluster>& out,
                           GroupingStats* stats,
                           ClusterError* err) {
    if (!table.HasLabels()) {
        out.clear();
        if (err) err->message = "Table has no cluster labels";
        return false;
    }
    return Group(table, *table.Labels(), out, stats, err);
}

} // namespace Clustering
} // namespace ClusterSig
