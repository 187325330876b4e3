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
 * @file Pipeline.cpp
 * @brief Stage sequencing and run accounting.
 */

#include "Pipeline.hpp"
#include "../Clustering/ClusterGrouper.hpp"
#include "../Clustering/LabelFileSource.hpp"
#include "../Features/FeatureExtractor.hpp"
#include "../SignatureStore/SignatureSynthesizer.hpp"
#include "../SignatureStore/YaraRuleWriter.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <cstdio>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ClusterSig {
namespace Pipeline {

const char* PipelineStatusToString(PipelineStatus status) noexcept {
    switch (status) {
        case PipelineStatus::Ok: return "ok";
        case PipelineStatus::UsageError: return "usage error";
        case PipelineStatus::EmptyInput: return "empty input";
        case PipelineStatus::IoError: return "I/O error";
        default: return "unknown";
    }
}

namespace {

void Fail(PipelineError* err, PipelineStatus status, std::string message) {
    CS_LOG_ERROR("Pipeline", "%s: %s", PipelineStatusToString(status), message.c_str());
    if (err) {
        err->Set(status, std::move(message));
    }
}

} // namespace

// ============================================================================
// RunReport
// ============================================================================

std::string RunReport::ToText() const {
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "Files ingested:        %zu\n"
                  "Records with warnings: %zu\n"
                  "Features per vector:   %zu\n"
                  "Clusters found:        %zu\n"
                  "Labelled samples:      %zu\n"
                  "Unlabelled samples:    %zu\n"
                  "Signatures written:    %zu\n"
                  "Degenerate clusters:   %zu\n"
                  "Rules rejected:        %zu\n",
                  filesIngested, recordsWithWarnings, featuresPerVector, clustersFound,
                  labelledSamples, unlabelledSamples, signaturesWritten, degenerateClusters,
                  rulesRejected);
    std::string text = buf;
    if (writeFailures > 0) {
        text += "Write failures:        " + std::to_string(writeFailures) + "\n";
    }
    return text;
}

void RunReport::Log() const {
    CS_LOG_INFO("Pipeline",
                "files=%zu warned=%zu features=%zu clusters=%zu labelled=%zu unlabelled=%zu "
                "written=%zu degenerate=%zu rejected=%zu",
                filesIngested, recordsWithWarnings, featuresPerVector, clustersFound,
                labelledSamples, unlabelledSamples, signaturesWritten, degenerateClusters,
                rulesRejected);
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(Config::PipelineConfig config)
    : m_config(std::move(config))
{}

bool Pipeline::CheckClusterType(PipelineError* err) const {
    if (!SignatureStore::IsSupportedClusterType(m_config.clusterType)) {
        Fail(err, PipelineStatus::UsageError, "Unsupported cluster type \"" + m_config.clusterType + "\"");
        return false;
    }
    return true;
}

bool Pipeline::ExtractDirectory(const std::filesystem::path& dir,
                                Features::FeatureTable& table,
                                RunReport& report,
                                PipelineError* err) {
    CS_LOG_SCOPE("Pipeline");

    Utils::FileUtils::Error fileErr;
    if (!Utils::FileUtils::IsDirectory(dir, &fileErr)) {
        Fail(err, PipelineStatus::IoError, "Input is not a readable directory: " + dir.string() +
             (fileErr.hasError() ? " (" + fileErr.message + ")" : std::string()));
        return false;
    }

    std::vector<std::filesystem::path> files;
    if (!Utils::FileUtils::ListRegularFiles(dir, files, &fileErr)) {
        Fail(err, PipelineStatus::IoError, "Cannot list " + dir.string() + ": " + fileErr.message);
        return false;
    }

    if (files.empty()) {
        Fail(err, PipelineStatus::EmptyInput, "No input files in " + dir.string());
        return false;
    }

    Features::FeatureExtractor extractor(m_config.ToParseOptions());
    std::vector<Features::FeatureRecord> records;
    records.reserve(files.size());
    size_t usable = 0;

    for (const auto& file : files) {
        Features::ParseResult result = extractor.Parse(file);
        if (!result.warnings.empty()) {
            ++report.recordsWithWarnings;
        }
        if (!result.record.Empty()) {
            ++usable;
        }
        records.push_back(std::move(result.record));
    }
    report.filesIngested = records.size();

    if (usable == 0) {
        Fail(err, PipelineStatus::EmptyInput,
             "None of the " + std::to_string(files.size()) + " files in " + dir.string() + " yielded features");
        return false;
    }

    Features::TableError tableErr;
    if (!Features::FeatureTable::Build(records, table, &tableErr)) {
        Fail(err, PipelineStatus::EmptyInput, tableErr.message);
        return false;
    }
    table.FillSentinels();
    report.featuresPerVector = table.ColumnCount();

    CS_LOG_INFO("Pipeline", "Extracted %zu files (%zu usable, %zu with warnings), %zu features per vector",
                report.filesIngested, usable, report.recordsWithWarnings, report.featuresPerVector);
    return true;
}

bool Pipeline::SynthesizeClusters(const Features::FeatureTable& table,
                                  Clustering::ILabelSource& labels,
                                  RunReport& report,
                                  PipelineError* err) {
    CS_LOG_SCOPE("Pipeline");

    if (!CheckClusterType(err)) {
        return false;
    }

    if (table.Empty()) {
        Fail(err, PipelineStatus::EmptyInput, "Feature table has no rows");
        return false;
    }
    report.featuresPerVector = table.ColumnCount();

    std::vector<int64_t> assigned;
    Clustering::ClusterError clusterErr;
    if (!labels.Assign(table, assigned, &clusterErr)) {
        Fail(err, PipelineStatus::IoError, labels.Describe() + ": " + clusterErr.message);
        return false;
    }

    std::map<int64_t, Clustering::Cluster> clusters;
    Clustering::GroupingStats stats;
    if (!Clustering::ClusterGrouper::Group(table, assigned, clusters, &stats, &clusterErr)) {
        Fail(err, PipelineStatus::IoError, clusterErr.message);
        return false;
    }
    report.clustersFound = stats.clusters;
    report.labelledSamples = stats.labelled;
    report.unlabelledSamples = stats.noise;

    const SignatureStore::SignatureSynthesizer synthesizer(m_config.ToSynthesisOptions());
    const SignatureStore::YaraRuleWriter writer(m_config.ToRuleOutputOptions());

    for (const auto& [id, cluster] : clusters) {
        const SignatureStore::Signature sig = synthesizer.Synthesize(id, cluster.rows);
        if (!sig.IsEmitable()) {
            ++report.degenerateClusters;
            CS_LOG_WARN("Pipeline", "Cluster %lld (%zu rows) has no optional header content, skipped",
                        static_cast<long long>(id), cluster.rows.RowCount());
            continue;
        }

        const SignatureStore::StoreError writeErr = writer.Write(sig);
        if (writeErr.IsSuccess()) {
            ++report.signaturesWritten;
        }
        else if (writeErr.code == SignatureStore::SignatureStoreError::CompilationFailed) {
            ++report.rulesRejected;
        }
        else {
            ++report.writeFailures;
        }
    }

    if (report.writeFailures > 0) {
        Fail(err, PipelineStatus::IoError,
             std::to_string(report.writeFailures) + " rule files could not be written to " +
             m_config.outputDirectory.string());
        return false;
    }
    return true;
}

bool Pipeline::RunExtract(const std::filesystem::path& inputDir,
                          const std::filesystem::path& tablePath,
                          RunReport& report,
                          PipelineError* err) {
    Features::FeatureTable table;
    if (!ExtractDirectory(inputDir, table, report, err)) {
        return false;
    }

    Features::TableError tableErr;
    if (!Features::SaveTable(tablePath, table, m_config.preprocess, &tableErr)) {
        Fail(err, PipelineStatus::IoError, tableErr.message);
        return false;
    }
    return true;
}

bool Pipeline::RunSynthesize(const std::filesystem::path& tablePath,
                             const std::filesystem::path& labelsPath,
                             RunReport& report,
                             PipelineError* err) {
    if (!CheckClusterType(err)) {
        return false;
    }

    Features::FeatureTable table;
    Features::TableError tableErr;
    if (!Features::LoadTable(tablePath, table, nullptr, &tableErr)) {
        Fail(err, PipelineStatus::IoError, tableErr.message);
        return false;
    }
    report.filesIngested = table.RowCount();

    Clustering::LabelFileSource labels(labelsPath);
    return SynthesizeClusters(table, labels, report, err);
}

bool Pipeline::RunAll(const std::filesystem::path& inputDir,
                      const std::filesystem::path& labelsPath,
                      RunReport& report,
                      PipelineError* err) {
    if (!CheckClusterType(err)) {
        return false;
    }

    Features::FeatureTable table;
    if (!ExtractDirectory(inputDir, table, report, err)) {
        return false;
    }

    Clustering::LabelFileSource labels(labelsPath);
    return SynthesizeClusters(table, labels, report, err);
}

} // namespace Pipeline
} // namespace ClusterSig
