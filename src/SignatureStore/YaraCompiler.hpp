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
/*
 * ============================================================================
 * ClusterSig YaraCompiler - libyara compilation wrapper
 * ============================================================================
 *
 * Every synthesized rule goes through libyara before it is written, so a
 * rule file on disk is always one that YARA accepts.
 *
 * ============================================================================
 */

#pragma once
#include <yara.h>

#include "SignatureFormat.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ClusterSig {
namespace SignatureStore {

// ============================================================================
// YARA COMPILER WRAPPER
// ============================================================================

class YaraCompiler {
public:
    YaraCompiler();
    ~YaraCompiler();

    // Disable copy, enable move
    YaraCompiler(const YaraCompiler&) = delete;
    YaraCompiler& operator=(const YaraCompiler&) = delete;
    YaraCompiler(YaraCompiler&&) noexcept;
    YaraCompiler& operator=(YaraCompiler&&) noexcept;

    // libyara initialised and compiler created
    [[nodiscard]] bool IsValid() const noexcept { return m_compiler != nullptr; }

    // ========================================================================
    // RULE COMPILATION
    // ========================================================================

    // Add rule string. After a failure the compiler accepts no more rules.
    [[nodiscard]] StoreError AddString(
        const std::string& ruleSource,
        const std::string& namespace_ = "default"
    ) noexcept;

    // Get compilation errors
    [[nodiscard]] std::vector<std::string> GetErrors() const noexcept;
    [[nodiscard]] std::vector<std::string> GetWarnings() const noexcept;

    // Clear errors
    void ClearErrors() noexcept;

    // ========================================================================
    // COMPILED RULES
    // ========================================================================

    // Get compiled rules (transfers ownership, release with yr_rules_destroy)
    [[nodiscard]] YR_RULES* GetRules() noexcept;

private:
    void Release() noexcept;

    YR_COMPILER* m_compiler{nullptr};
    bool m_initialized{false};
    bool m_failed{false};
    std::vector<std::string> m_errors;
    std::vector<std::string> m_warnings;

    // YARA callback signature (matches YR_COMPILER_CALLBACK_FUNC)
    static void ErrorCallback(
        int errorLevel,
        const char* fileName,
        int lineNumber,
        const YR_RULE* rule,
        const char* message,
        void* userData
    );
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

namespace YaraUtils {

// Validate YARA rule syntax
[[nodiscard]] bool ValidateRuleSyntax(
    const std::string& ruleSource,
    std::vector<std::string>& errors
) noexcept;

// Compile ruleSource and count the rules matching a memory buffer
[[nodiscard]] bool CountMatches(
    const std::string& ruleSource,
    const uint8_t* data,
    size_t size,
    size_t& matches,
    std::vector<std::string>* errors = nullptr
) noexcept;

} // namespace YaraUtils

} // namespace SignatureStore
} // namespace ClusterSig
