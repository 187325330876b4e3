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
 * @file PipelineConfig.cpp
 * @brief Config loading, overrides and validation.
 */

#include "PipelineConfig.hpp"

#include <cstdint>
#include <utility>

namespace ClusterSig {
namespace Config {

namespace {

using Utils::JSON::Json;

void SetError(ConfigError* err, ConfigErrorKind kind, std::string message) {
    if (err) {
        err->kind = kind;
        err->message = std::move(message);
    }
}

// Type-checked readers: absent keys are fine, wrong types are not
bool ReadString(const Json& obj, const char* key, std::string& out, const char* where, ConfigError* err) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_string()) {
        SetError(err, ConfigErrorKind::Format, std::string(where) + key + " must be a string");
        return false;
    }
    out = obj[key].get<std::string>();
    return true;
}

bool ReadBool(const Json& obj, const char* key, bool& out, const char* where, ConfigError* err) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_boolean()) {
        SetError(err, ConfigErrorKind::Format, std::string(where) + key + " must be a boolean");
        return false;
    }
    out = obj[key].get<bool>();
    return true;
}

bool ReadSection(const Json& doc, const char* key, const Json*& out, ConfigError* err) {
    out = nullptr;
    if (!doc.contains(key)) return true;
    if (!doc[key].is_object()) {
        SetError(err, ConfigErrorKind::Format, std::string(key) + " must be an object");
        return false;
    }
    out = &doc[key];
    return true;
}

} // namespace

// ============================================================================
// Conversions
// ============================================================================

Features::ParseOptions PipelineConfig::ToParseOptions() const {
    Features::ParseOptions options;
    options.experimental = experimental;
    return options;
}

SignatureStore::SynthesisOptions PipelineConfig::ToSynthesisOptions() const {
    SignatureStore::SynthesisOptions options;
    options.experimental = experimental;
    options.author = author;
    options.contact = contact;
    options.clusterType = clusterType;
    return options;
}

SignatureStore::RuleOutputOptions PipelineConfig::ToRuleOutputOptions() const {
    SignatureStore::RuleOutputOptions options;
    options.directory = outputDirectory;
    options.extension = extension;
    options.validate = validateRules;
    return options;
}

bool PipelineConfig::ToLoggerConfig(Utils::LoggerConfig& out, ConfigError* err) const {
    Utils::LogLevel level = Utils::LogLevel::Info;
    if (!Utils::ParseLogLevel(log.level, level)) {
        SetError(err, ConfigErrorKind::Format, "Unknown log level: " + log.level);
        return false;
    }
    out = Utils::LoggerConfig{};
    out.minimalLevel = level;
    out.toConsole = log.toConsole;
    out.toFile = log.toFile;
    out.logDirectory = log.directory;
    out.jsonLines = log.jsonLines;
    out.async = log.async;
    out.includeSrcLocation = level <= Utils::LogLevel::Debug;
    return true;
}

// ============================================================================
// Loading
// ============================================================================

bool FromJson(const Json& doc, PipelineConfig& config, ConfigError* err) {
    if (!doc.is_object()) {
        SetError(err, ConfigErrorKind::Format, "Configuration must be a JSON object");
        return false;
    }

    try {
        if (!ReadString(doc, "author", config.author, "", err) ||
            !ReadString(doc, "contact", config.contact, "", err) ||
            !ReadString(doc, "clusterType", config.clusterType, "", err) ||
            !ReadBool(doc, "experimental", config.experimental, "", err) ||
            !ReadBool(doc, "validateRules", config.validateRules, "", err)) {
            return false;
        }

        const Json* output = nullptr;
        if (!ReadSection(doc, "output", output, err)) return false;
        if (output) {
            std::string directory = config.outputDirectory.string();
            if (!ReadString(*output, "directory", directory, "output.", err) ||
                !ReadString(*output, "extension", config.extension, "output.", err)) {
                return false;
            }
            config.outputDirectory = directory;
        }

        const Json* preprocess = nullptr;
        if (!ReadSection(doc, "preprocess", preprocess, err)) return false;
        if (preprocess) {
            if (!ReadBool(*preprocess, "scale", config.preprocess.scale, "preprocess.", err)) {
                return false;
            }
            if (preprocess->contains("components")) {
                const Json& comp = (*preprocess)["components"];
                if (comp.is_string() && comp.get<std::string>() == "auto") {
                    config.preprocess.components.reset();
                }
                else if (comp.is_number_unsigned() && comp.get<uint64_t>() > 0 &&
                         comp.get<uint64_t>() <= UINT32_MAX) {
                    config.preprocess.components = comp.get<uint32_t>();
                }
                else {
                    SetError(err, ConfigErrorKind::Format,
                             "preprocess.components must be a positive integer or \"auto\"");
                    return false;
                }
            }
        }

        const Json* log = nullptr;
        if (!ReadSection(doc, "log", log, err)) return false;
        if (log) {
            if (!ReadString(*log, "level", config.log.level, "log.", err) ||
                !ReadBool(*log, "toConsole", config.log.toConsole, "log.", err) ||
                !ReadBool(*log, "toFile", config.log.toFile, "log.", err) ||
                !ReadString(*log, "directory", config.log.directory, "log.", err) ||
                !ReadBool(*log, "jsonLines", config.log.jsonLines, "log.", err) ||
                !ReadBool(*log, "async", config.log.async, "log.", err)) {
                return false;
            }
        }
    }
    catch (const Json::exception& ex) {
        SetError(err, ConfigErrorKind::Format, std::string("Malformed configuration: ") + ex.what());
        return false;
    }
    return true;
}

bool LoadConfig(const std::filesystem::path& path, PipelineConfig& config, ConfigError* err) {
    Json doc;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(path, doc, &jsonErr, {}, ConfigConstants::MAX_CONFIG_FILE_SIZE)) {
        // A parse position means the file was read but is not valid JSON
        const ConfigErrorKind kind = (jsonErr.line > 0 || jsonErr.byteOffset > 0) ? ConfigErrorKind::Format
                                                                                   : ConfigErrorKind::Io;
        SetError(err, kind, "Cannot load configuration " + path.string() + ": " + jsonErr.message);
        return false;
    }
    if (!FromJson(doc, config, err)) {
        if (err) err->message = path.string() + ": " + err->message;
        return false;
    }
    CS_LOG_DEBUG("Config", "Loaded configuration from %s", path.c_str());
    return true;
}

void ApplyOverrides(const ConfigOverrides& overrides, PipelineConfig& config) {
    if (overrides.author) config.author = *overrides.author;
    if (overrides.contact) config.contact = *overrides.contact;
    if (overrides.clusterType) config.clusterType = *overrides.clusterType;
    if (overrides.outputDirectory) config.outputDirectory = *overrides.outputDirectory;
    if (overrides.experimental) config.experimental = true;
    if (overrides.verbose) config.log.level = "debug";
}

bool Validate(const PipelineConfig& config, ConfigError* err) {
    if (!SignatureStore::IsSupportedClusterType(config.clusterType)) {
        SetError(err, ConfigErrorKind::Usage,
                 "Unsupported cluster type \"" + config.clusterType + "\" (expected dbscan, meanshift or kmeans)");
        return false;
    }

    Utils::LogLevel level;
    if (!Utils::ParseLogLevel(config.log.level, level)) {
        SetError(err, ConfigErrorKind::Format, "Unknown log level: " + config.log.level);
        return false;
    }

    if (config.extension.empty() || config.extension.find_first_of("/\\") != std::string::npos) {
        SetError(err, ConfigErrorKind::Format, "Invalid rule file extension: \"" + config.extension + "\"");
        return false;
    }
    return true;
}

}  // namespace Config
}  // namespace ClusterSig
