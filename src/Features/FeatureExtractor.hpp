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
 * @file FeatureExtractor.hpp
 * @brief Turns one PE file into a FeatureRecord.
 *
 * Extraction never fails outright. Whatever the parser decoded before it
 * stopped becomes the record, and the reason it stopped is returned as a
 * warning next to it.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "FeatureRecord.hpp"
#include "../PEParser/PEParser.hpp"

namespace ClusterSig {
namespace Features {

struct ParseOptions {
    /// Accept tiny PEs: smaller minimum size, headers overlapping the DOS header
    bool experimental = false;
};

/**
 * @brief A recoverable problem met while extracting one file.
 */
struct ParseWarning {
    PEParser::ValidationResult code = PEParser::ValidationResult::Valid;
    std::string context;        ///< Parse stage the problem was met in
    std::string message;
    uint64_t offset = 0;
};

struct ParseResult {
    FeatureRecord record;
    std::vector<ParseWarning> warnings;

    /// Last parse stage that completed
    PEParser::ParseStage completed = PEParser::ParseStage::None;

    [[nodiscard]] bool Complete() const noexcept {
        return completed == PEParser::ParseStage::Resources;
    }
};

/**
 * @brief Parser options for the given extraction mode.
 */
[[nodiscard]] PEParser::ParserOptions MakeParserOptions(const ParseOptions& options) noexcept;

/**
 * @brief Copy the catalog fields out of decoded headers.
 *
 * Fields of stages that did not run stay absent. A truncated optional
 * header contributes exactly the fields lying wholly inside the file.
 */
void ExtractFeatures(const PEParser::PEHeaders& headers, FeatureRecord& record);

class FeatureExtractor {
public:
    explicit FeatureExtractor(const ParseOptions& options = {}) noexcept;

    /**
     * @brief Parse a file from disk. The record's filename is the base name.
     */
    [[nodiscard]] ParseResult Parse(const std::filesystem::path& path) noexcept;

    [[nodiscard]] ParseResult ParseBuffer(const std::string& filename,
                                          const uint8_t* data,
                                          size_t size) noexcept;

    [[nodiscard]] const ParseOptions& Options() const noexcept { return m_options; }

private:
    void Finish(const PEParser::PEHeaders& headers, bool ok, const PEParser::PEError& err,
                ParseResult& result);

    ParseOptions m_options;
    PEParser::PEParser m_parser;
};

} // namespace Features
} // namespace ClusterSig
