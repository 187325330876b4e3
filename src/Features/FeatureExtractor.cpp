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
 * @file FeatureExtractor.cpp
 * @brief Header-to-feature mapping.
 */

#include "FeatureExtractor.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <cstddef>
#include <new>
#include <type_traits>

namespace ClusterSig {
namespace Features {

namespace {

using PEParser::OptionalHeader32;
using PEParser::OptionalHeader64;
using PEParser::PEHeaders;

void ExtractFileHeader(const PEParser::FileHeader& fh, FeatureRecord& record) {
    record.SetUnsigned(FeatureId::MachineType, fh.Machine);
    record.SetUnsigned(FeatureId::NumberOfSections, fh.NumberOfSections);
    record.SetUnsigned(FeatureId::CompileDate, fh.TimeDateStamp);
    record.SetUnsigned(FeatureId::PointerToSymbolTable, fh.PointerToSymbolTable);
    record.SetUnsigned(FeatureId::NumberOfSymbols, fh.NumberOfSymbols);
    record.SetUnsigned(FeatureId::SizeOfOptionalHeader, fh.SizeOfOptionalHeader);
    record.SetUnsigned(FeatureId::Characteristics, fh.Characteristics);
}

// A field counts only when all of its bytes came from the file
template<typename T>
void SetOptionalField(const PEHeaders& headers, FeatureRecord& record, FeatureId id,
                      size_t offset, T value) {
    static_assert(std::is_unsigned_v<T>, "optional header fields are unsigned");
    if (headers.HasOptionalBytes(offset, sizeof(T))) {
        record.SetUnsigned(id, static_cast<uint64_t>(value));
    }
}

template<typename OptHeader>
void ExtractOptionalHeader(const PEHeaders& headers, const OptHeader& opt, FeatureRecord& record) {
    SetOptionalField(headers, record, FeatureId::Magic, offsetof(OptHeader, Magic), opt.Magic);
    SetOptionalField(headers, record, FeatureId::MajorLinkerVersion, offsetof(OptHeader, MajorLinkerVersion), opt.MajorLinkerVersion);
    SetOptionalField(headers, record, FeatureId::MinorLinkerVersion, offsetof(OptHeader, MinorLinkerVersion), opt.MinorLinkerVersion);
    SetOptionalField(headers, record, FeatureId::SizeOfCode, offsetof(OptHeader, SizeOfCode), opt.SizeOfCode);
    SetOptionalField(headers, record, FeatureId::SizeOfInitializedData, offsetof(OptHeader, SizeOfInitializedData), opt.SizeOfInitializedData);
    SetOptionalField(headers, record, FeatureId::SizeOfUninitializedData, offsetof(OptHeader, SizeOfUninitializedData), opt.SizeOfUninitializedData);
    SetOptionalField(headers, record, FeatureId::EntryPointAddress, offsetof(OptHeader, AddressOfEntryPoint), opt.AddressOfEntryPoint);
    SetOptionalField(headers, record, FeatureId::BaseOfCode, offsetof(OptHeader, BaseOfCode), opt.BaseOfCode);
    if constexpr (std::is_same_v<OptHeader, OptionalHeader32>) {
        SetOptionalField(headers, record, FeatureId::BaseOfData, offsetof(OptHeader, BaseOfData), opt.BaseOfData);
    }
    SetOptionalField(headers, record, FeatureId::ImageBase, offsetof(OptHeader, ImageBase), opt.ImageBase);
    SetOptionalField(headers, record, FeatureId::SectionAlignment, offsetof(OptHeader, SectionAlignment), opt.SectionAlignment);
    SetOptionalField(headers, record, FeatureId::FileAlignment, offsetof(OptHeader, FileAlignment), opt.FileAlignment);
    SetOptionalField(headers, record, FeatureId::MajorOsVersion, offsetof(OptHeader, MajorOperatingSystemVersion), opt.MajorOperatingSystemVersion);
    SetOptionalField(headers, record, FeatureId::MinorOsVersion, offsetof(OptHeader, MinorOperatingSystemVersion), opt.MinorOperatingSystemVersion);
    SetOptionalField(headers, record, FeatureId::MajorImageVersion, offsetof(OptHeader, MajorImageVersion), opt.MajorImageVersion);
    SetOptionalField(headers, record, FeatureId::MinorImageVersion, offsetof(OptHeader, MinorImageVersion), opt.MinorImageVersion);
    SetOptionalField(headers, record, FeatureId::MajorSubsystemVersion, offsetof(OptHeader, MajorSubsystemVersion), opt.MajorSubsystemVersion);
    SetOptionalField(headers, record, FeatureId::MinorSubsystemVersion, offsetof(OptHeader, MinorSubsystemVersion), opt.MinorSubsystemVersion);
    SetOptionalField(headers, record, FeatureId::SizeOfImage, offsetof(OptHeader, SizeOfImage), opt.SizeOfImage);
    SetOptionalField(headers, record, FeatureId::SizeOfHeaders, offsetof(OptHeader, SizeOfHeaders), opt.SizeOfHeaders);
    SetOptionalField(headers, record, FeatureId::Checksum, offsetof(OptHeader, CheckSum), opt.CheckSum);
    SetOptionalField(headers, record, FeatureId::Subsystem, offsetof(OptHeader, Subsystem), opt.Subsystem);
    SetOptionalField(headers, record, FeatureId::DllCharacteristics, offsetof(OptHeader, DllCharacteristics), opt.DllCharacteristics);
    SetOptionalField(headers, record, FeatureId::SizeOfStackReserve, offsetof(OptHeader, SizeOfStackReserve), opt.SizeOfStackReserve);
    SetOptionalField(headers, record, FeatureId::SizeOfStackCommit, offsetof(OptHeader, SizeOfStackCommit), opt.SizeOfStackCommit);
    SetOptionalField(headers, record, FeatureId::SizeOfHeapReserve, offsetof(OptHeader, SizeOfHeapReserve), opt.SizeOfHeapReserve);
    SetOptionalField(headers, record, FeatureId::SizeOfHeapCommit, offsetof(OptHeader, SizeOfHeapCommit), opt.SizeOfHeapCommit);
    SetOptionalField(headers, record, FeatureId::LoaderFlags, offsetof(OptHeader, LoaderFlags), opt.LoaderFlags);
    SetOptionalField(headers, record, FeatureId::NumberOfRvaAndSizes, offsetof(OptHeader, NumberOfRvaAndSizes), opt.NumberOfRvaAndSizes);
}

void ExtractDataDirectories(const PEHeaders& headers, FeatureRecord& record) {
    for (const auto& dir : kDirectoryFeatures) {
        if (dir.index >= headers.dataDirectoryCount) {
            continue;
        }
        const auto& entry = headers.dataDirectories[dir.index];
        record.SetUnsigned(dir.sizeId, entry.size);
        record.SetUnsigned(dir.addressId, entry.rva);
    }
}

void ExtractResources(const PEHeaders& headers, FeatureRecord& record) {
    const size_t count = std::min(kResourceSlots, headers.resources.size());
    for (size_t i = 0; i < count; ++i) {
        const auto& leaf = headers.resources[i];
        record.SetUnsigned(kResourceFeatures[i].sizeId, leaf.size);
        record.SetUnsigned(kResourceFeatures[i].offsetId, leaf.dataRva);
        record.SetUnsigned(kResourceFeatures[i].languageId,
                           leaf.language & PEParser::Resource::PRIMARY_LANG_MASK);
    }
}

ParseWarning ToWarning(const PEParser::PEError& err) {
    ParseWarning w;
    w.code = err.code;
    w.context = err.context;
    w.message = err.message.empty() ? PEParser::ValidationResultToString(err.code) : err.message;
    w.offset = err.offset;
    return w;
}

} // namespace

PEParser::ParserOptions MakeParserOptions(const ParseOptions& options) noexcept {
    PEParser::ParserOptions parserOptions;
    if (options.experimental) {
        parserOptions.validation.minFileSize = PEParser::Limits::MIN_TINY_PE_FILE_SIZE;
        parserOptions.validation.allowOverlappingHeaders = true;
    }
    return parserOptions;
}

void ExtractFeatures(const PEParser::PEHeaders& headers, FeatureRecord& record) {
    if (headers.fileHeader) {
        ExtractFileHeader(*headers.fileHeader, record);
    }

    if (headers.magic) {
        if (headers.is64Bit) {
            ExtractOptionalHeader(headers, headers.optional64, record);
        }
        else {
            ExtractOptionalHeader(headers, headers.optional32, record);
        }
    }

    ExtractDataDirectories(headers, record);
    ExtractResources(headers, record);
}

// ============================================================================
// FeatureExtractor
// ============================================================================

FeatureExtractor::FeatureExtractor(const ParseOptions& options) noexcept
    : m_options(options)
    , m_parser(MakeParserOptions(options))
{}

ParseResult FeatureExtractor::Parse(const std::filesystem::path& path) noexcept {
    ParseResult result;
    try {
        result.record.SetFilename(path.filename().string());

        PEParser::PEHeaders headers;
        PEParser::PEError err;
        const bool ok = m_parser.ParseFile(path, headers, &err);
        Finish(headers, ok, err, result);
    }
    catch (const std::bad_alloc&) {
        CS_LOG_ERROR("FeatureExtractor", "Out of memory while extracting %s", path.c_str());
    }
    m_parser.Reset();
    return result;
}

ParseResult FeatureExtractor::ParseBuffer(const std::string& filename,
                                          const uint8_t* data,
                                          size_t size) noexcept {
    ParseResult result;
    try {
        result.record.SetFilename(filename);

        PEParser::PEHeaders headers;
        PEParser::PEError err;
        const bool ok = m_parser.ParseBuffer(data, size, headers, &err);
        Finish(headers, ok, err, result);
    }
    catch (const std::bad_alloc&) {
        CS_LOG_ERROR("FeatureExtractor", "Out of memory while extracting %s", filename.c_str());
    }
    m_parser.Reset();
    return result;
}

void FeatureExtractor::Finish(const PEParser::PEHeaders& headers, bool ok,
                              const PEParser::PEError& err, ParseResult& result) {
    ExtractFeatures(headers, result.record);
    result.completed = headers.completed;

    for (const auto& w : headers.warnings) {
        result.warnings.push_back(ToWarning(w));
        CS_LOG_DEBUG("FeatureExtractor", "%s: %s",
                     result.record.Filename().c_str(), w.Describe().c_str());
    }

    if (!ok) {
        result.warnings.push_back(ToWarning(err));
        CS_LOG_WARN("FeatureExtractor", "%s: parse stopped after %s (%s), kept %zu fields",
                    result.record.Filename().c_str(),
                    PEParser::ParseStageToString(headers.completed),
                    err.Describe().c_str(),
                    result.record.PresentCount());
    }
}

} // namespace Features
} // namespace ClusterSig
