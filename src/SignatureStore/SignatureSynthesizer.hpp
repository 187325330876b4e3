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
 * @file SignatureSynthesizer.hpp
 * @brief Derives a wildcarded header signature from one cluster's rows.
 *
 * Every column is classified on its own:
 * - constant columns are kept, unless they sit at the sentinel and are not
 *   one of the always-meaningful fields (magic, checksum, subsystem,
 *   characteristics);
 * - variable optional header columns with at most 9 distinct 32-bit values
 *   become a nibble consensus pattern;
 * - everything else is dropped.
 *
 * Kept file header columns become pe module assertions on the
 * representative sample's values; kept optional header columns become hex
 * patterns.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "SignatureFormat.hpp"
#include "../Features/FeatureTable.hpp"

namespace ClusterSig {
namespace SignatureStore {

struct SynthesisOptions {
    bool experimental = false;          ///< Also anchor the raw COFF header
    std::string author;
    std::string contact;
    std::string clusterType = "dbscan";
};

class SignatureSynthesizer {
public:
    explicit SignatureSynthesizer(SynthesisOptions options);

    /**
     * @brief Build the signature for one cluster.
     *
     * The result may have no optional header content; check IsEmitable()
     * before rendering.
     *
     * @param rows Member rows with the full table column schema.
     */
    [[nodiscard]] Signature Synthesize(int64_t clusterId, const Features::FeatureTable& rows) const;

    /**
     * @brief Row whose filename occurs most often; ties go to the earliest.
     */
    [[nodiscard]] static size_t SelectRepresentative(const Features::FeatureTable& rows);

    [[nodiscard]] const SynthesisOptions& Options() const noexcept { return m_options; }

private:
    SynthesisOptions m_options;
};

} // namespace SignatureStore
} // namespace ClusterSig
