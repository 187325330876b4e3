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
/**
 * @file SignatureSynthesizer.cpp
 * @brief Column classification and pattern building.
 */

#include "SignatureSynthesizer.hpp"
#include "HexPattern.hpp"
#include "../PEParser/PEConstants.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ClusterSig {
namespace SignatureStore {

namespace {

using Features::FeatureId;
using Features::FeatureTable;
using Features::FeatureValue;

/// COFF file header layout, in on-disk order
struct CoffField {
    FeatureId id;
    size_t width;
};

constexpr CoffField kCoffLayout[] = {
    { FeatureId::MachineType,          2 },
    { FeatureId::NumberOfSections,     2 },
    { FeatureId::CompileDate,          4 },
    { FeatureId::PointerToSymbolTable, 4 },
    { FeatureId::NumberOfSymbols,      4 },
    { FeatureId::SizeOfOptionalHeader, 2 },
    { FeatureId::Characteristics,      2 },
};

std::vector<FeatureValue> ColumnValues(const FeatureTable& rows, size_t column) {
    std::vector<FeatureValue> values;
    values.reserve(rows.RowCount());
    for (size_t r = 0; r < rows.RowCount(); ++r) {
        values.push_back(rows.Value(r, column));
    }
    return values;
}

std::vector<FeatureValue> DistinctValues(std::vector<FeatureValue> values) {
    std::sort(values.begin(), values.end(), Features::ValueLess);
    auto last = std::unique(values.begin(), values.end(), Features::ValuesEqual);
    values.erase(last, values.end());
    return values;
}

/// The cluster's magic when every row agrees on it
std::optional<uint64_t> ConstantMagic(const FeatureTable& rows) {
    const auto column = rows.ColumnIndex(FeatureId::Magic);
    if (!column || rows.RowCount() == 0) {
        return std::nullopt;
    }
    const auto distinct = DistinctValues(ColumnValues(rows, *column));
    uint64_t magic = 0;
    if (distinct.size() == 1 && Features::AsUnsigned(distinct.front(), magic)) {
        return magic;
    }
    return std::nullopt;
}

HeaderRegion RegionOf(FeatureId id) noexcept {
    if (Features::IsFileHeaderField(id)) return HeaderRegion::FileHeader;
    if (Features::IsOptionalHeaderField(id)) return HeaderRegion::OptionalHeader;
    return HeaderRegion::None;
}

} // namespace

SignatureSynthesizer::SignatureSynthesizer(SynthesisOptions options)
    : m_options(std::move(options))
{}

size_t SignatureSynthesizer::SelectRepresentative(const FeatureTable& rows) {
    std::unordered_map<std::string, size_t> counts;
    for (size_t r = 0; r < rows.RowCount(); ++r) {
        ++counts[rows.Filename(r)];
    }

    size_t best = 0;
    size_t bestCount = 0;
    for (size_t r = 0; r < rows.RowCount(); ++r) {
        const size_t count = counts[rows.Filename(r)];
        if (count > bestCount) {
            best = r;
            bestCount = count;
        }
    }
    return best;
}

Signature SignatureSynthesizer::Synthesize(int64_t clusterId, const FeatureTable& rows) const {
    Signature sig;
    sig.clusterId = clusterId;
    sig.clusterType = m_options.clusterType;

    sig.meta.emplace_back("author", m_options.author);
    sig.meta.emplace_back("contact", m_options.contact);
    sig.meta.emplace_back("cluster", std::to_string(clusterId));
    for (size_t r = 0; r < rows.RowCount(); ++r) {
        sig.meta.emplace_back("sample_" + std::to_string(r), rows.Filename(r));
    }

    if (rows.Empty()) {
        CS_LOG_WARN("SignatureSynthesizer", "Cluster %lld has no rows", static_cast<long long>(clusterId));
        return sig;
    }

    sig.representativeRow = SelectRepresentative(rows);
    sig.representative = rows.Filename(sig.representativeRow);

    const std::optional<uint64_t> magic = ConstantMagic(rows);
    const bool wideHeader = magic && *magic == PEParser::PE64_MAGIC;

    for (size_t c = 0; c < rows.ColumnCount(); ++c) {
        const FeatureId id = rows.Columns()[c];
        const auto values = ColumnValues(rows, c);
        const auto distinct = DistinctValues(values);

        CandidateField field;
        field.id = id;
        field.region = RegionOf(id);
        field.distinctValues = distinct.size();

        if (distinct.size() == 1) {
            const FeatureValue& value = distinct.front();

            if (Features::IsSentinelValue(value) && !Features::IsAlwaysMeaningful(id)) {
                field.classification = CandidateClass::ConstantSuppressed;
                field.reason = "constant sentinel";
            }
            else if (field.region == HeaderRegion::FileHeader) {
                field.classification = CandidateClass::ConstantUseful;
                uint64_t literal = 0;
                // A sentinel cannot be anchored on header bytes
                if (Features::AsUnsigned(rows.Value(sig.representativeRow, c), literal)) {
                    sig.fileHeader.push_back(FileHeaderAssertion{ id, literal });
                }
            }
            else if (field.region == HeaderRegion::OptionalHeader) {
                const size_t width = (Features::IsWideField(id) && wideHeader) ? PACK_WIDTH_WIDE
                                                                               : PACK_WIDTH_DEFAULT;
                uint64_t number = 0;
                std::string hex;
                if (Features::IsSentinelValue(value)) {
                    // Always-meaningful columns survive the sentinel check, but -1 has no byte form
                    field.classification = CandidateClass::ConstantSuppressed;
                    field.reason = "sentinel cannot be packed";
                }
                else if (Features::AsUnsigned(value, number) && PackLittleEndianHex(number, width, hex)) {
                    field.classification = CandidateClass::ConstantUseful;
                    sig.optionalHeader.push_back(OptionalHeaderPattern{ id, std::move(hex), false });
                }
                else {
                    field.classification = CandidateClass::ConstantSuppressed;
                    field.reason = "value cannot be packed";
                    CS_LOG_WARN("SignatureSynthesizer",
                                "Cluster %lld: \"%s\" = %s does not pack into %zu bytes, dropped",
                                static_cast<long long>(clusterId), Features::FeatureName(id),
                                Features::FormatValue(value).c_str(), width);
                }
            }
            else {
                // Resource columns are kept but have no region to go to
                field.classification = CandidateClass::ConstantUseful;
            }
        }
        else {
            field.classification = CandidateClass::VariableUnconvertible;

            std::vector<uint64_t> numbers;
            bool eligible = field.region == HeaderRegion::OptionalHeader;
            if (!eligible) {
                field.reason = "not an optional header field";
            }
            else if (distinct.size() > MAX_CONSENSUS_VALUES) {
                eligible = false;
                field.reason = "too many distinct values";
            }
            else {
                for (const auto& v : distinct) {
                    uint64_t n = 0;
                    if (!Features::AsUnsigned(v, n) || n > MAX_CONSENSUS_VALUE) {
                        eligible = false;
                        if (Features::IsSentinelValue(v)) {
                            field.reason = "sentinel value";
                        }
                        else {
                            field.reason = Features::IsNumeric(v) ? "value outside 32 bits" : "string value";
                        }
                        break;
                    }
                    numbers.push_back(n);
                }
            }

            std::string consensus;
            if (eligible && BuildValueConsensus(numbers, PACK_WIDTH_DEFAULT, consensus)) {
                if (IsFullyWildcarded(consensus)) {
                    field.reason = "no common nibble";
                }
                else {
                    field.classification = CandidateClass::VariableConvertible;
                    sig.optionalHeader.push_back(OptionalHeaderPattern{ id, consensus, true });
                }
            }
        }

        CS_LOG_TRACE("SignatureSynthesizer", "Cluster %lld: \"%s\" %s (%zu distinct)%s%s",
                     static_cast<long long>(clusterId), Features::FeatureName(id),
                     CandidateClassToString(field.classification), field.distinctValues,
                     field.reason.empty() ? "" : ": ", field.reason.c_str());
        sig.candidates.push_back(std::move(field));
    }

    if (m_options.experimental && !sig.fileHeader.empty()) {
        std::string pattern;
        for (const auto& coff : kCoffLayout) {
            const auto kept = std::find_if(sig.fileHeader.begin(), sig.fileHeader.end(),
                                           [&](const FileHeaderAssertion& a) { return a.id == coff.id; });
            std::string hex;
            if (kept == sig.fileHeader.end() || !PackLittleEndianHex(kept->value, coff.width, hex)) {
                hex.assign(coff.width * 2, WILDCARD_NIBBLE);
            }
            pattern += hex;
        }
        sig.fileHeaderPattern = std::move(pattern);
    }

    CS_LOG_DEBUG("SignatureSynthesizer",
                 "Cluster %lld: %zu rows, representative %s, %zu file header assertions, %zu optional header patterns",
                 static_cast<long long>(clusterId), rows.RowCount(), sig.representative.c_str(),
                 sig.fileHeader.size(), sig.optionalHeader.size());
    return sig;
}

} // namespace SignatureStore
} // namespace ClusterSig
