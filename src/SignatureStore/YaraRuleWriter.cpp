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
#include "YaraRuleWriter.hpp"
#include "HexPattern.hpp"
#include "YaraCompiler.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <cstdio>
#include <utility>
#include <vector>

namespace ClusterSig {
namespace SignatureStore {

namespace {

std::string HexLiteral(uint64_t value) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%llX", static_cast<unsigned long long>(value));
    return buf;
}

} // namespace

YaraRuleWriter::YaraRuleWriter(RuleOutputOptions options)
    : m_options(std::move(options))
{
    if (m_options.extension.empty()) {
        m_options.extension = DEFAULT_RULE_EXTENSION;
    }
}

std::string YaraRuleWriter::RuleName(const Signature& sig) {
    return sig.clusterType + "_cluster_" + std::to_string(sig.clusterId);
}

std::string YaraRuleWriter::EscapeString(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const unsigned char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7F) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                }
                else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

const char* YaraRuleWriter::PeModuleField(Features::FeatureId id) noexcept {
    using Features::FeatureId;
    switch (id) {
        case FeatureId::MachineType: return "machine";
        case FeatureId::NumberOfSections: return "number_of_sections";
        case FeatureId::CompileDate: return "timestamp";
        case FeatureId::PointerToSymbolTable: return "pointer_to_symbol_table";
        case FeatureId::NumberOfSymbols: return "number_of_symbols";
        case FeatureId::SizeOfOptionalHeader: return "size_of_optional_header";
        case FeatureId::Characteristics: return "characteristics";
        default: return nullptr;
    }
}

std::string YaraRuleWriter::Render(const Signature& sig) {
    std::string out;
    out += "import \"pe\"\n\n";
    out += "rule " + RuleName(sig) + "\n{\n";

    out += "    meta:\n";
    for (const auto& [key, value] : sig.meta) {
        out += "        " + key + " = \"" + EscapeString(value) + "\"\n";
    }

    const bool hasStrings = !sig.optionalHeader.empty() || sig.fileHeaderPattern.has_value();
    if (hasStrings) {
        out += "    strings:\n";
        if (sig.fileHeaderPattern) {
            out += "        $file_header = { " + ToYaraHexString(*sig.fileHeaderPattern) + " }\n";
        }
        for (const auto& pattern : sig.optionalHeader) {
            out += "        $" + Features::Identifier(pattern.id) + " = { " +
                   ToYaraHexString(pattern.hex) + " }\n";
        }
    }

    std::vector<std::string> terms;
    terms.emplace_back("uint16(0) == 0x5A4D");
    for (const auto& assertion : sig.fileHeader) {
        const char* field = PeModuleField(assertion.id);
        if (field) {
            terms.push_back(std::string("pe.") + field + " == " + HexLiteral(assertion.value));
        }
    }
    if (sig.fileHeaderPattern) {
        terms.emplace_back("$file_header at uint32(0x3C) + 4");
    }
    if (hasStrings) {
        terms.emplace_back("all of them");
    }

    out += "    condition:\n";
    for (size_t i = 0; i < terms.size(); ++i) {
        out += "        " + terms[i];
        out += (i + 1 < terms.size()) ? " and\n" : "\n";
    }
    out += "}\n";
    return out;
}

std::filesystem::path YaraRuleWriter::OutputPath(const Signature& sig) const {
    return m_options.directory / (RuleName(sig) + "." + m_options.extension);
}

StoreError YaraRuleWriter::Write(const Signature& sig, std::filesystem::path* written) const {
    StoreError err;
    if (!sig.IsEmitable()) {
        err.code = SignatureStoreError::InvalidSignature;
        err.message = "Signature has no optional header content";
        return err;
    }

    const std::string source = Render(sig);

    if (m_options.validate) {
        std::vector<std::string> errors;
        if (!YaraUtils::ValidateRuleSyntax(source, errors)) {
            err.code = SignatureStoreError::CompilationFailed;
            err.message = errors.empty() ? "YARA rejected the rule" : errors.front();
            CS_LOG_ERROR("YaraCompiler", "Rule %s rejected: %s", RuleName(sig).c_str(), err.message.c_str());
            return err;
        }
    }

    const std::filesystem::path path = OutputPath(sig);
    Utils::FileUtils::Error fileErr;
    if (!Utils::FileUtils::WriteAllTextAtomic(path, source, &fileErr)) {
        err.code = SignatureStoreError::WriteFailed;
        err.errnoValue = fileErr.errnoValue;
        err.message = fileErr.message;
        CS_LOG_ERROR("SignatureSynthesizer", "Cannot write %s: %s", path.c_str(), fileErr.message.c_str());
        return err;
    }

    CS_LOG_INFO("SignatureSynthesizer", "Wrote %s (%zu patterns, %zu assertions)",
                path.c_str(), sig.optionalHeader.size(), sig.fileHeader.size());
    if (written) {
        *written = path;
    }
    return StoreError::Success();
}

} // namespace SignatureStore
} // namespace ClusterSig
