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
 * @file YaraRuleWriter.hpp
 * @brief Renders a Signature as YARA source and writes it to the rule directory.
 *
 * Output shape:
 * @code
 *   import "pe"
 *
 *   rule dbscan_cluster_3
 *   {
 *       meta:
 *           author = "..."
 *           contact = "..."
 *           cluster = "3"
 *           sample_0 = "a.exe"
 *       strings:
 *           $magic = { 0b 01 00 00 }
 *           $entry_point_address = { 0? 10 00 00 }
 *       condition:
 *           uint16(0) == 0x5A4D and
 *           pe.machine == 0x14C and
 *           all of them
 *   }
 * @endcode
 */

#include <filesystem>
#include <string>

#include "SignatureFormat.hpp"

namespace ClusterSig {
namespace SignatureStore {

struct RuleOutputOptions {
    std::filesystem::path directory{"rules"};
    std::string extension{DEFAULT_RULE_EXTENSION};
    bool validate{true};                             // Compile with libyara before writing
};

class YaraRuleWriter {
public:
    explicit YaraRuleWriter(RuleOutputOptions options);

    /// "<type>_cluster_<id>"
    [[nodiscard]] static std::string RuleName(const Signature& sig);

    /// Escape a value for a YARA meta string
    [[nodiscard]] static std::string EscapeString(const std::string& value);

    /// pe module field for a file header column, nullptr for other columns
    [[nodiscard]] static const char* PeModuleField(Features::FeatureId id) noexcept;

    [[nodiscard]] static std::string Render(const Signature& sig);

    /// "<directory>/<type>_cluster_<id>.<extension>"
    [[nodiscard]] std::filesystem::path OutputPath(const Signature& sig) const;

    /**
     * @brief Render, optionally validate, and atomically write one rule.
     *
     * Signatures that are not emitable are refused with InvalidSignature;
     * rules libyara rejects are refused with CompilationFailed.
     */
    [[nodiscard]] StoreError Write(const Signature& sig, std::filesystem::path* written = nullptr) const;

    [[nodiscard]] const RuleOutputOptions& Options() const noexcept { return m_options; }

private:
    RuleOutputOptions m_options;
};

} // namespace SignatureStore
} // namespace ClusterSig
