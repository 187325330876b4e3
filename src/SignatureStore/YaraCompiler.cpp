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
#include "YaraCompiler.hpp"
#include "../Utils/Logger.hpp"

#include <new>
#include <string>
#include <utility>

namespace ClusterSig {
namespace SignatureStore {

// ============================================================================
// YaraCompiler
// ============================================================================

YaraCompiler::YaraCompiler() {
    int result = yr_initialize();
    if (result != ERROR_SUCCESS) {
        CS_LOG_ERROR("YaraCompiler", "yr_initialize failed: %d", result);
        return;
    }
    m_initialized = true;

    result = yr_compiler_create(&m_compiler);
    if (result != ERROR_SUCCESS || m_compiler == nullptr) {
        CS_LOG_ERROR("YaraCompiler", "yr_compiler_create failed: %d", result);
        m_compiler = nullptr;
        yr_finalize();
        m_initialized = false;
        return;
    }

    yr_compiler_set_callback(m_compiler, ErrorCallback, this);
}

YaraCompiler::~YaraCompiler() {
    Release();
}

YaraCompiler::YaraCompiler(YaraCompiler&& other) noexcept
    : m_compiler(std::exchange(other.m_compiler, nullptr))
    , m_initialized(std::exchange(other.m_initialized, false))
    , m_failed(other.m_failed)
    , m_errors(std::move(other.m_errors))
    , m_warnings(std::move(other.m_warnings))
{
    // The callback carries a pointer to the owning object
    if (m_compiler) {
        yr_compiler_set_callback(m_compiler, ErrorCallback, this);
    }
}

YaraCompiler& YaraCompiler::operator=(YaraCompiler&& other) noexcept {
    if (this != &other) {
        Release();
        m_compiler = std::exchange(other.m_compiler, nullptr);
        m_initialized = std::exchange(other.m_initialized, false);
        m_failed = other.m_failed;
        m_errors = std::move(other.m_errors);
        m_warnings = std::move(other.m_warnings);
        if (m_compiler) {
            yr_compiler_set_callback(m_compiler, ErrorCallback, this);
        }
    }
    return *this;
}

void YaraCompiler::Release() noexcept {
    if (m_compiler) {
        yr_compiler_destroy(m_compiler);
        m_compiler = nullptr;
    }
    if (m_initialized) {
        yr_finalize();
        m_initialized = false;
    }
}

StoreError YaraCompiler::AddString(const std::string& ruleSource, const std::string& namespace_) noexcept {
    StoreError err;
    if (!m_compiler) {
        err.code = SignatureStoreError::CompilationFailed;
        err.message = "YARA compiler not initialized";
        return err;
    }
    if (m_failed) {
        err.code = SignatureStoreError::CompilationFailed;
        err.message = "YARA compiler unusable after an earlier error";
        return err;
    }

    const int errors = yr_compiler_add_string(m_compiler, ruleSource.c_str(), namespace_.c_str());
    if (errors != 0) {
        m_failed = true;
        err.code = SignatureStoreError::CompilationFailed;
        err.message = m_errors.empty() ? "YARA compilation failed" : m_errors.back();
        return err;
    }
    return StoreError::Success();
}

std::vector<std::string> YaraCompiler::GetErrors() const noexcept {
    try {
        return m_errors;
    }
    catch (const std::bad_alloc&) {
        return {};
    }
}

std::vector<std::string> YaraCompiler::GetWarnings() const noexcept {
    try {
        return m_warnings;
    }
    catch (const std::bad_alloc&) {
        return {};
    }
}

void YaraCompiler::ClearErrors() noexcept {
    m_errors.clear();
    m_warnings.clear();
}

YR_RULES* YaraCompiler::GetRules() noexcept {
    if (!m_compiler || m_failed) {
        return nullptr;
    }
    YR_RULES* rules = nullptr;
    const int result = yr_compiler_get_rules(m_compiler, &rules);
    if (result != ERROR_SUCCESS) {
        CS_LOG_ERROR("YaraCompiler", "yr_compiler_get_rules failed: %d", result);
        return nullptr;
    }
    return rules;
}

void YaraCompiler::ErrorCallback(int errorLevel, const char* fileName, int lineNumber,
                                 const YR_RULE* rule, const char* message, void* userData) {
    (void)fileName;
    (void)rule;
    auto* self = static_cast<YaraCompiler*>(userData);
    if (!self) {
        return;
    }

    // Called from C; nothing may propagate out of here
    try {
        std::string text = "line " + std::to_string(lineNumber) + ": " + (message ? message : "");
        if (errorLevel == YARA_ERROR_LEVEL_ERROR) {
            CS_LOG_DEBUG("YaraCompiler", "error %s", text.c_str());
            self->m_errors.push_back(std::move(text));
        }
        else {
            CS_LOG_DEBUG("YaraCompiler", "warning %s", text.c_str());
            self->m_warnings.push_back(std::move(text));
        }
    }
    catch (const std::bad_alloc&) {
        CS_LOG_ERROR("YaraCompiler", "Out of memory recording compiler message");
    }
}

// ============================================================================
// YaraUtils
// ============================================================================

namespace YaraUtils {

bool ValidateRuleSyntax(const std::string& ruleSource, std::vector<std::string>& errors) noexcept {
    errors.clear();
    YaraCompiler compiler;
    if (!compiler.IsValid()) {
        errors.push_back("YARA compiler not initialized");
        return false;
    }
    const StoreError err = compiler.AddString(ruleSource, "validation");
    if (!err.IsSuccess()) {
        errors = compiler.GetErrors();
        if (errors.empty()) {
            errors.push_back(err.message);
        }
        return false;
    }
    return true;
}

namespace {

int CountingCallback(YR_SCAN_CONTEXT* context, int message, void* messageData, void* userData) {
    (void)context;
    (void)messageData;
    if (message == CALLBACK_MSG_RULE_MATCHING) {
        ++*static_cast<size_t*>(userData);
    }
    return CALLBACK_CONTINUE;
}

} // namespace

bool CountMatches(const std::string& ruleSource, const uint8_t* data, size_t size,
                  size_t& matches, std::vector<std::string>* errors) noexcept {
    matches = 0;
    YaraCompiler compiler;
    const StoreError err = compiler.AddString(ruleSource, "scan");
    if (!err.IsSuccess()) {
        if (errors) *errors = compiler.GetErrors();
        return false;
    }

    YR_RULES* rules = compiler.GetRules();
    if (!rules) {
        return false;
    }

    const int result = yr_rules_scan_mem(rules, data, size, 0, CountingCallback, &matches, 0);
    yr_rules_destroy(rules);
    return result == ERROR_SUCCESS;
}

} // namespace YaraUtils

} // namespace SignatureStore
} // namespace ClusterSig
