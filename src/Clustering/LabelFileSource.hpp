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
 * @file LabelFileSource.hpp
 * @brief Labels read from a JSON file written by the external clusterer.
 *
 * Accepted layouts, aligned to table row order:
 * @code
 *   [0, 0, 1, -1]
 *   { "labels": [0, 0, 1, -1] }
 * @endcode
 */

#include <filesystem>
#include <utility>

#include "ILabelSource.hpp"
#include "../Utils/JSONUtils.hpp"

namespace ClusterSig {
namespace Clustering {

class LabelFileSource final : public ILabelSource {
public:
    explicit LabelFileSource(std::filesystem::path path) : m_path(std::move(path)) {}

    [[nodiscard]] bool Assign(const Features::FeatureTable& table,
                              std::vector<int64_t>& labels,
                              ClusterError* err = nullptr) noexcept override;

    [[nodiscard]] std::string Describe() const override;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
};

/**
 * @brief Decode a label document (either accepted layout).
 */
[[nodiscard]] bool ParseLabels(const Utils::JSON::Json& doc,
                               std::vector<int64_t>& labels,
                               ClusterError* err = nullptr) noexcept;

} // namespace Clustering
} // namespace ClusterSig
