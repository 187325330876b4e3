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
 * ============================================================================
 * ClusterSig - PIPELINE CONFIGURATION
 * ============================================================================
 *
 * @file PipelineConfig.hpp
 * @brief Typed run configuration loaded from JSON and overridden from the CLI.
 *
 * All keys are optional:
 * @code
 *   {
 *     "author": "ClusterSig",
 *     "contact": "",
 *     "clusterType": "dbscan",
 *     "experimental": false,
 *     "validateRules": true,
 *     "output": { "directory": "rules", "extension": "yar" },
 *     "preprocess": { "scale": true, "components": "auto" },
 *     "log": { "level": "info", "toConsole": true, "toFile": false,
 *              "directory": "logs", "jsonLines": false, "async": false }
 *   }
 * @endcode
 *
 * The value is passed explicitly to every stage; there is no global copy.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "../Features/FeatureExtractor.hpp"
#include "../Features/FeatureTable.hpp"
#include "../SignatureStore/SignatureSynthesizer.hpp"
#include "../SignatureStore/YaraRuleWriter.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

namespace ClusterSig {
namespace Config {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace ConfigConstants {

    inline constexpr const char* DEFAULT_AUTHOR = "ClusterSig";
    inline constexpr const char* DEFAULT_CLUSTER_TYPE = "dbscan";
    inline constexpr const char* DEFAULT_RULE_DIRECTORY = "rules";
    inline constexpr const char* DEFAULT_LOG_DIRECTORY = "logs";
    inline constexpr const char* DEFAULT_LOG_LEVEL = "info";

    /// @brief Config files are small; anything larger is a mistake
    inline constexpr size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;

}  // namespace ConfigConstants

// ============================================================================
// ERRORS
// ============================================================================

enum class ConfigErrorKind : uint8_t {
    None    = 0,
    Io      = 1,    ///< File missing or unreadable
    Format  = 2,    ///< Not JSON, wrong types, unknown log level
    Usage   = 3     ///< Unsupported cluster type
};

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::None;
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return kind != ConfigErrorKind::None; }
};

// ============================================================================
// STRUCTURES
// ============================================================================

struct LogSettings {
    /// @brief trace, debug, info, warn, error or fatal
    std::string level = ConfigConstants::DEFAULT_LOG_LEVEL;

    bool toConsole = true;
    bool toFile = false;
    std::string directory = ConfigConstants::DEFAULT_LOG_DIRECTORY;
    bool jsonLines = false;
    bool async = false;
};

struct PipelineConfig {
    /// @brief Rule meta "author"
    std::string author = ConfigConstants::DEFAULT_AUTHOR;

    /// @brief Rule meta "contact"
    std::string contact;

    /// @brief dbscan, meanshift or kmeans; prefixes every rule name
    std::string clusterType = ConfigConstants::DEFAULT_CLUSTER_TYPE;

    /// @brief Tiny-PE parsing and raw COFF header patterns
    bool experimental = false;

    /// @brief Compile rules with libyara before writing
    bool validateRules = true;

    std::filesystem::path outputDirectory = ConfigConstants::DEFAULT_RULE_DIRECTORY;
    std::string extension = SignatureStore::DEFAULT_RULE_EXTENSION;

    Features::PreprocessOptions preprocess;

    LogSettings log;

    [[nodiscard]] Features::ParseOptions ToParseOptions() const;
    [[nodiscard]] SignatureStore::SynthesisOptions ToSynthesisOptions() const;
    [[nodiscard]] SignatureStore::RuleOutputOptions ToRuleOutputOptions() const;

    /**
     * @brief Logger settings for this run.
     * @return false if the log level name is unknown.
     */
    [[nodiscard]] bool ToLoggerConfig(Utils::LoggerConfig& out, ConfigError* err = nullptr) const;
};

/**
 * @brief Values given on the command line; set fields win over the file.
 */
struct ConfigOverrides {
    std::optional<std::string> author;
    std::optional<std::string> contact;
    std::optional<std::string> clusterType;
    std::optional<std::filesystem::path> outputDirectory;
    bool experimental = false;      ///< Only ever switches it on
    bool verbose = false;           ///< Debug logging
};

// ============================================================================
// LOADING
// ============================================================================

/**
 * @brief Fill config from a parsed document. Missing keys keep their value.
 */
[[nodiscard]] bool FromJson(const Utils::JSON::Json& doc, PipelineConfig& config, ConfigError* err = nullptr);

[[nodiscard]] bool LoadConfig(const std::filesystem::path& path, PipelineConfig& config,
                              ConfigError* err = nullptr);

void ApplyOverrides(const ConfigOverrides& overrides, PipelineConfig& config);

/**
 * @brief Check the finished config: cluster type, log level, extension.
 */
[[nodiscard]] bool Validate(const PipelineConfig& config, ConfigError* err = nullptr);

}  // namespace Config
}  // namespace ClusterSig
