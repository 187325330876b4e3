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
 * @file Pipeline.hpp
 * @brief Batch orchestration: extract, cluster consumption, synthesis.
 *
 * Stages run sequentially on one thread:
 *   1. enumerate the input directory (regular files, sorted by path)
 *   2. extract one feature record per file
 *   3. build the table and fill sentinels
 *   4. read labels from the external clusterer and group rows
 *   5. synthesize and write one rule per qualifying cluster
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

#include "../Clustering/ILabelSource.hpp"
#include "../Config/PipelineConfig.hpp"
#include "../Features/FeatureTable.hpp"

namespace ClusterSig {
namespace Pipeline {

// ============================================================================
// Status and errors
// ============================================================================

/// Values double as process exit codes
enum class PipelineStatus : int {
    Ok = 0,
    UsageError = 1,     ///< CLI misuse or unsupported cluster type
    EmptyInput = 2,     ///< No usable input files
    IoError = 3,        ///< Unreadable or malformed config, table, labels; failed writes
};

[[nodiscard]] const char* PipelineStatusToString(PipelineStatus status) noexcept;

[[nodiscard]] inline int ExitCode(PipelineStatus status) noexcept {
    return static_cast<int>(status);
}

struct PipelineError {
    PipelineStatus status = PipelineStatus::Ok;
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return status != PipelineStatus::Ok; }

    void Set(PipelineStatus s, std::string msg) {
        status = s;
        message = std::move(msg);
    }
};

// ============================================================================
// Run report
// ============================================================================

struct RunReport {
    size_t filesIngested = 0;
    size_t recordsWithWarnings = 0;
    size_t featuresPerVector = 0;
    size_t clustersFound = 0;
    size_t labelledSamples = 0;
    size_t unlabelledSamples = 0;
    size_t signaturesWritten = 0;
    size_t degenerateClusters = 0;
    size_t rulesRejected = 0;
    size_t writeFailures = 0;

    /// Short human-readable summary, one count per line
    [[nodiscard]] std::string ToText() const;

    void Log() const;
};

// ============================================================================
// Pipeline
// ============================================================================

class Pipeline {
public:
    explicit Pipeline(Config::PipelineConfig config);

    /**
     * @brief Parse every regular file in dir into a sentinel-filled table.
     *
     * Fails with EmptyInput when the directory holds no file that yielded
     * at least one feature.
     */
    [[nodiscard]] bool ExtractDirectory(const std::filesystem::path& dir,
                                        Features::FeatureTable& table,
                                        RunReport& report,
                                        PipelineError* err = nullptr);

    /**
     * @brief Label, group and synthesize. Degenerate clusters and rejected
     *        rules are counted and skipped.
     */
    [[nodiscard]] bool SynthesizeClusters(const Features::FeatureTable& table,
                                          Clustering::ILabelSource& labels,
                                          RunReport& report,
                                          PipelineError* err = nullptr);

    // ========================================================================
    // CLI commands
    // ========================================================================

    /// extract: directory to table file
    [[nodiscard]] bool RunExtract(const std::filesystem::path& inputDir,
                                  const std::filesystem::path& tablePath,
                                  RunReport& report,
                                  PipelineError* err = nullptr);

    /// synthesize: table file and label file to rules
    [[nodiscard]] bool RunSynthesize(const std::filesystem::path& tablePath,
                                     const std::filesystem::path& labelsPath,
                                     RunReport& report,
                                     PipelineError* err = nullptr);

    /// run: directory and label file to rules, in one process
    [[nodiscard]] bool RunAll(const std::filesystem::path& inputDir,
                              const std::filesystem::path& labelsPath,
                              RunReport& report,
                              PipelineError* err = nullptr);

    [[nodiscard]] const Config::PipelineConfig& GetConfig() const noexcept { return m_config; }

private:
    [[nodiscard]] bool CheckClusterType(PipelineError* err) const;

    Config::PipelineConfig m_config;
};

} // namespace Pipeline
} // namespace ClusterSig
