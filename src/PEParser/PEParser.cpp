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
 * @file PEParser.cpp
 * @brief Staged PE header parser implementation.
 *
 * - Bounds checking on all reads through SafeReader
 * - Integer overflow protection on offset arithmetic
 * - Loop guard and entry budget on the resource tree
 * - Memory-mapped I/O for file input
 */

#include "PEParser.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/MemoryUtils.hpp"

#include <algorithm>
#include <unordered_set>

namespace ClusterSig {
namespace PEParser {

const char* ParseStageToString(ParseStage stage) noexcept {
    switch (stage) {
        case ParseStage::None: return "none";
        case ParseStage::DosHeader: return "DOS header";
        case ParseStage::FileHeader: return "file header";
        case ParseStage::OptionalMagic: return "optional header magic";
        case ParseStage::OptionalHeader: return "optional header";
        case ParseStage::DataDirectories: return "data directories";
        case ParseStage::Sections: return "section table";
        case ParseStage::Resources: return "resources";
        default: return "unknown";
    }
}

// ============================================================================
// Implementation Class (PIMPL)
// ============================================================================

class PEParserImpl {
public:
    explicit PEParserImpl(const ParserOptions& options) : m_options(options) {}
    ~PEParserImpl() { Reset(); }

    // Non-copyable
    PEParserImpl(const PEParserImpl&) = delete;
    PEParserImpl& operator=(const PEParserImpl&) = delete;

    // ========================================================================
    // State
    // ========================================================================

    ParserOptions m_options;
    PEHeaders m_headers;
    SafeReader m_reader;

    // Memory-mapped file (if parsing from file)
    Utils::MemoryUtils::MappedView m_mappedFile;

    // Raw headers for address translation
    std::vector<SectionHeader> m_rawSections;
    uint32_t m_sizeOfHeaders = 0;
    size_t m_ntHeaderOffset = 0;
    size_t m_optionalHeaderOffset = 0;

    void Reset() noexcept {
        m_headers = PEHeaders();
        m_reader = SafeReader();
        m_mappedFile.close();
        m_rawSections.clear();
        m_sizeOfHeaders = 0;
        m_ntHeaderOffset = 0;
        m_optionalHeaderOffset = 0;
    }

    // ========================================================================
    // Core Parsing
    // ========================================================================

    /**
     * Runs every stage in order. On failure err names the stage and
     * m_headers keeps what earlier stages produced.
     */
    [[nodiscard]] bool ParseInternal(PEError& err) noexcept {
        try {
            m_headers = PEHeaders();
            m_headers.fileSize = m_reader.Size();
            m_rawSections.clear();
            m_sizeOfHeaders = 0;

            // Step 1: DOS header
            int32_t lfanew = 0;
            if (ValidateDosHeader(m_reader, m_options.validation, lfanew, &err) != ValidationResult::Valid) {
                err.context = ParseStageToString(ParseStage::DosHeader);
                return false;
            }
            m_headers.completed = ParseStage::DosHeader;
            m_ntHeaderOffset = static_cast<size_t>(lfanew);

            // Step 2: PE signature and COFF file header
            FileHeader fileHeader;
            if (ValidateNtHeaders(m_reader, m_ntHeaderOffset, fileHeader, &err) != ValidationResult::Valid) {
                err.context = ParseStageToString(ParseStage::FileHeader);
                return false;
            }
            m_headers.fileHeader = fileHeader;
            m_headers.completed = ParseStage::FileHeader;

            // Step 3: optional header magic
            m_optionalHeaderOffset = m_ntHeaderOffset + NT_SIGNATURE_SIZE + sizeof(FileHeader);
            uint16_t magic = 0;
            bool is64Bit = false;
            if (ValidateOptionalMagic(m_reader, m_optionalHeaderOffset, magic, is64Bit, &err) != ValidationResult::Valid) {
                err.context = ParseStageToString(ParseStage::OptionalMagic);
                return false;
            }
            m_headers.magic = magic;
            m_headers.is64Bit = is64Bit;
            m_headers.completed = ParseStage::OptionalMagic;

            // Step 4: optional header body
            if (!ParseOptionalHeader(err)) {
                return false;
            }
            m_headers.completed = ParseStage::OptionalHeader;

            // Step 5: data directories
            ParseDataDirectories();
            m_headers.completed = ParseStage::DataDirectories;

            // Step 6: section table (RVA translation only)
            if (!ParseSections(fileHeader.NumberOfSections, fileHeader.SizeOfOptionalHeader, err)) {
                return false;
            }
            ResolveDirectoryOffsets();
            m_headers.completed = ParseStage::Sections;

            // Step 7: resource tree
            if (!ParseResources(err)) {
                return false;
            }
            m_headers.completed = ParseStage::Resources;
            return true;
        }
        catch (const std::bad_alloc&) {
            err.SetWithContext(ValidationResult::UnknownError, "Out of memory",
                               ParseStageToString(m_headers.completed));
            return false;
        }
    }

    void AddWarning(ValidationResult code, const char* msg, const char* ctx, uint64_t offset) {
        PEError w;
        w.SetWithContext(code, msg, ctx, offset);
        m_headers.warnings.push_back(std::move(w));
    }

    // ========================================================================
    // Optional Header Parsing
    // ========================================================================

    [[nodiscard]] bool ParseOptionalHeader(PEError& err) noexcept {
        const size_t fixedSize = m_headers.is64Bit ? sizeof(OptionalHeader64) : sizeof(OptionalHeader32);
        const size_t available = (m_reader.Size() > m_optionalHeaderOffset)
            ? m_reader.Size() - m_optionalHeaderOffset
            : 0;
        const size_t bytes = std::min(fixedSize, available);

        void* dest = m_headers.is64Bit
            ? static_cast<void*>(&m_headers.optional64)
            : static_cast<void*>(&m_headers.optional32);

        if (!m_reader.ReadBytes(m_optionalHeaderOffset, dest, bytes)) {
            err.SetWithContext(ValidationResult::NtHeadersOutOfBounds,
                               "Cannot read optional header",
                               ParseStageToString(ParseStage::OptionalHeader),
                               m_optionalHeaderOffset);
            return false;
        }
        m_headers.optionalHeaderBytes = bytes;

        if (bytes < fixedSize) {
            // Leading fields stay usable through HasOptionalBytes
            err.SetWithContext(ValidationResult::OptionalHeaderTruncated,
                               "Optional header is cut off by end of file",
                               ParseStageToString(ParseStage::OptionalHeader),
                               m_optionalHeaderOffset + bytes);
            return false;
        }

        m_sizeOfHeaders = m_headers.is64Bit ? m_headers.optional64.SizeOfHeaders
                                            : m_headers.optional32.SizeOfHeaders;
        return true;
    }

    // ========================================================================
    // Data Directory Parsing
    // ========================================================================

    void ParseDataDirectories() {
        const size_t fixedSize = m_headers.is64Bit ? sizeof(OptionalHeader64) : sizeof(OptionalHeader32);
        const uint32_t declared = m_headers.is64Bit ? m_headers.optional64.NumberOfRvaAndSizes
                                                    : m_headers.optional32.NumberOfRvaAndSizes;

        const size_t ddOffset = m_optionalHeaderOffset + fixedSize;
        size_t ddCount = std::min<size_t>(declared, DataDirectory::MAX_ENTRIES);

        const size_t inFile = (m_reader.Size() > ddOffset)
            ? (m_reader.Size() - ddOffset) / sizeof(DataDirectoryEntry)
            : 0;
        if (ddCount > inFile) {
            AddWarning(ValidationResult::DataDirectoryOutOfBounds,
                       "Data directory array is cut off by end of file",
                       ParseStageToString(ParseStage::DataDirectories),
                       ddOffset);
            ddCount = inFile;
        }

        for (size_t i = 0; i < ddCount; ++i) {
            DataDirectoryEntry entry;
            if (!m_reader.Read(ddOffset + i * sizeof(DataDirectoryEntry), entry)) {
                ddCount = i;
                break;
            }
            m_headers.dataDirectories[i].rva = entry.VirtualAddress;
            m_headers.dataDirectories[i].size = entry.Size;
        }
        m_headers.dataDirectoryCount = ddCount;
    }

    void ResolveDirectoryOffsets() noexcept {
        for (size_t i = 0; i < m_headers.dataDirectoryCount; ++i) {
            auto& dir = m_headers.dataDirectories[i];
            if (dir.rva != 0) {
                dir.fileOffset = RvaToOffsetInternal(dir.rva);
            }
        }
    }

    // ========================================================================
    // Section Parsing
    // ========================================================================

    [[nodiscard]] bool ParseSections(uint16_t numberOfSections, uint16_t sizeOfOptionalHeader,
                                     PEError& err) {
        size_t tableOffset;
        if (!SafeMath::SafeAdd(m_optionalHeaderOffset, static_cast<size_t>(sizeOfOptionalHeader), tableOffset)) {
            err.SetWithContext(ValidationResult::IntegerOverflow,
                               "Section table offset overflow",
                               ParseStageToString(ParseStage::Sections),
                               m_optionalHeaderOffset);
            return false;
        }

        size_t count = numberOfSections;
        if (count > Limits::MAX_SECTIONS) {
            AddWarning(ValidationResult::SectionTableOverflow,
                       "Section count exceeds limit, table truncated",
                       ParseStageToString(ParseStage::Sections),
                       tableOffset);
            count = Limits::MAX_SECTIONS;
        }

        m_rawSections.reserve(count);
        m_headers.sections.reserve(count);

        for (size_t i = 0; i < count; ++i) {
            const size_t offset = tableOffset + i * sizeof(SectionHeader);

            SectionHeader header;
            if (!m_reader.Read(offset, header)) {
                AddWarning(ValidationResult::SectionTableOutOfBounds,
                           "Section table extends beyond file",
                           ParseStageToString(ParseStage::Sections),
                           offset);
                break;
            }
            m_rawSections.push_back(header);

            SectionInfo info;
            std::string name;
            if (m_reader.ReadFixedString(offset, sizeof(header.Name), name)) {
                info.name = std::move(name);
            }
            info.virtualAddress = header.VirtualAddress;
            info.virtualSize = header.VirtualSize;
            info.rawAddress = header.PointerToRawData;
            info.rawSize = header.SizeOfRawData;
            m_headers.sections.push_back(std::move(info));
        }
        return true;
    }

    // ========================================================================
    // Address Translation
    // ========================================================================

    [[nodiscard]] std::optional<size_t> RvaToOffsetInternal(uint32_t rva) const noexcept {
        if (rva == 0) {
            return std::nullopt;
        }

        // Inside headers: identity mapping
        if (rva < m_sizeOfHeaders) {
            if (static_cast<size_t>(rva) < m_reader.Size()) {
                return static_cast<size_t>(rva);
            }
            return std::nullopt;
        }

        for (const auto& sec : m_rawSections) {
            const uint32_t secVa = sec.VirtualAddress;
            uint32_t secVSize = sec.VirtualSize;
            if (secVSize == 0) {
                secVSize = sec.SizeOfRawData;
            }

            uint32_t secEnd;
            if (!SafeMath::SafeAdd(secVa, secVSize, secEnd)) {
                secEnd = UINT32_MAX;
            }

            if (rva >= secVa && rva < secEnd) {
                const uint32_t sectionOffset = rva - secVa;

                // Virtual-only tail has no file bytes
                if (sectionOffset < sec.SizeOfRawData) {
                    size_t fileOffset;
                    if (SafeMath::SafeAdd(static_cast<size_t>(sec.PointerToRawData),
                                          static_cast<size_t>(sectionOffset), fileOffset) &&
                        fileOffset < m_reader.Size()) {
                        return fileOffset;
                    }
                }
                return std::nullopt;
            }
        }

        return std::nullopt;
    }

    // ========================================================================
    // Resource Parsing
    // ========================================================================

    struct ResourceWalk {
        size_t base = 0;                        ///< File offset of the root directory
        std::unordered_set<uint32_t> visited;   ///< Directory offsets already entered
        size_t visits = 0;                      ///< Entries examined so far
        bool done = false;
    };

    [[nodiscard]] bool ParseResources(PEError& err) {
        if (m_headers.dataDirectoryCount <= DataDirectory::RESOURCE) {
            return true;
        }
        const auto& dir = m_headers.dataDirectories[DataDirectory::RESOURCE];
        if (dir.rva == 0) {
            return true;
        }
        if (!dir.fileOffset) {
            err.SetWithContext(ValidationResult::ResourceDirectoryOutOfBounds,
                               "Resource directory RVA does not map into the file",
                               ParseStageToString(ParseStage::Resources),
                               dir.rva);
            return false;
        }
        if (m_options.maxResourceLeaves == 0) {
            return true;
        }

        ResourceWalk walk;
        walk.base = *dir.fileOffset;
        return WalkResourceDirectory(walk, 0, Resource::LEVEL_TYPE, ResourceEntry{}, err);
    }

    [[nodiscard]] bool WalkResourceDirectory(ResourceWalk& walk, uint32_t dirOffset, uint32_t level,
                                             const ResourceEntry& path, PEError& err) {
        const char* ctx = ParseStageToString(ParseStage::Resources);

        if (level > Limits::MAX_RESOURCE_DEPTH) {
            err.SetWithContext(ValidationResult::ResourceDepthExceeded,
                               "Resource directory nesting too deep", ctx, dirOffset);
            return false;
        }
        if (!walk.visited.insert(dirOffset).second) {
            AddWarning(ValidationResult::ResourceCircularReference,
                       "Resource directory visited twice, skipping", ctx, walk.base + dirOffset);
            return true;
        }

        size_t dirPos;
        ResourceDirectory rd;
        if (!SafeMath::SafeAdd(walk.base, static_cast<size_t>(dirOffset), dirPos) ||
            !m_reader.Read(dirPos, rd)) {
            err.SetWithContext(ValidationResult::ResourceDirectoryOutOfBounds,
                               "Resource directory beyond file", ctx, walk.base + dirOffset);
            return false;
        }

        // Named entries precede id entries on disk
        const size_t count = static_cast<size_t>(rd.NumberOfNamedEntries) + rd.NumberOfIdEntries;
        if (count > Limits::MAX_RESOURCE_ENTRIES) {
            err.SetWithContext(ValidationResult::ResourceEntryCountExceeded,
                               "Resource directory declares too many entries", ctx, dirPos);
            return false;
        }

        for (size_t i = 0; i < count && !walk.done; ++i) {
            if (++walk.visits > Limits::MAX_RESOURCE_VISITS) {
                AddWarning(ValidationResult::ResourceEntryCountExceeded,
                           "Resource entry budget exhausted", ctx, dirPos);
                walk.done = true;
                break;
            }

            const size_t entryPos = dirPos + sizeof(ResourceDirectory) + i * sizeof(ResourceDirectoryEntry);
            ResourceDirectoryEntry entry;
            if (!m_reader.Read(entryPos, entry)) {
                err.SetWithContext(ValidationResult::ResourceDirectoryOutOfBounds,
                                   "Resource directory entry beyond file", ctx, entryPos);
                return false;
            }

            ResourceEntry current = path;
            if (level == Resource::LEVEL_TYPE) {
                ResolveTypeName(walk, entry, current);
            }
            else if (level == Resource::LEVEL_LANGUAGE) {
                current.language = entry.Id();
            }

            if (entry.DataIsDirectory()) {
                if (!WalkResourceDirectory(walk, entry.TargetOffset(), level + 1, current, err)) {
                    return false;
                }
            }
            else {
                ReadResourceLeaf(walk, entry.TargetOffset(), std::move(current));
            }
        }
        return true;
    }

    void ResolveTypeName(const ResourceWalk& walk, const ResourceDirectoryEntry& entry,
                         ResourceEntry& current) {
        if (entry.NameIsString()) {
            current.typeIsString = true;
            current.typeId = 0;
            size_t namePos;
            if (!SafeMath::SafeAdd(walk.base, static_cast<size_t>(entry.NameOffset()), namePos) ||
                !m_reader.ReadLengthPrefixedUtf16(namePos, Limits::MAX_RESOURCE_NAME, current.typeName)) {
                AddWarning(ValidationResult::ResourceNameOutOfBounds,
                           "Resource type name unreadable",
                           ParseStageToString(ParseStage::Resources),
                           walk.base + entry.NameOffset());
                current.typeName.clear();
            }
            return;
        }

        current.typeIsString = false;
        current.typeId = entry.Id();
        const auto symbol = ResourceType::Name(current.typeId);
        current.typeName = symbol.empty() ? std::to_string(current.typeId) : std::string(symbol);
    }

    void ReadResourceLeaf(ResourceWalk& walk, uint32_t dataOffset, ResourceEntry current) {
        size_t pos;
        ResourceDataEntry data;
        if (!SafeMath::SafeAdd(walk.base, static_cast<size_t>(dataOffset), pos) ||
            !m_reader.Read(pos, data)) {
            AddWarning(ValidationResult::ResourceDataOutOfBounds,
                       "Resource data entry beyond file",
                       ParseStageToString(ParseStage::Resources),
                       walk.base + dataOffset);
            return;
        }

        current.dataRva = data.OffsetToData;
        current.size = data.Size;
        current.codePage = data.CodePage;

        CS_LOG_TRACE("PEParser", "Resource leaf %zu: type=%s lang=0x%04x size=%u",
                     m_headers.resources.size(), current.typeName.c_str(),
                     static_cast<unsigned>(current.language), current.size);

        m_headers.resources.push_back(std::move(current));
        if (m_headers.resources.size() >= m_options.maxResourceLeaves) {
            walk.done = true;
        }
    }
};

// ============================================================================
// PEParser Public Interface Implementation
// ============================================================================

PEParser::PEParser(const ParserOptions& options) noexcept
    : m_impl(std::make_unique<PEParserImpl>(options))
{}

PEParser::~PEParser() = default;

PEParser::PEParser(PEParser&&) noexcept = default;
PEParser& PEParser::operator=(PEParser&&) noexcept = default;

bool PEParser::ParseFile(const std::filesystem::path& path, PEHeaders& out, PEError* err) noexcept {
    m_impl->Reset();
    out = PEHeaders();

    PEError local;
    std::string mapError;
    if (!m_impl->m_mappedFile.mapReadOnly(path, &mapError)) {
        local.SetWithContext(ValidationResult::FileUnreadable,
                             mapError.empty() ? "Failed to open or map file" : mapError.c_str(),
                             "file");
        CS_LOG_DEBUG("PEParser", "Failed to map file %s: %s", path.c_str(), local.message.c_str());
        if (err) *err = std::move(local);
        return false;
    }

    // Handle empty files
    if (!m_impl->m_mappedFile.hasData()) {
        local.SetWithContext(ValidationResult::FileTooSmall, "File is empty", "file");
        if (err) *err = std::move(local);
        return false;
    }

    m_impl->m_reader = SafeReader(m_impl->m_mappedFile.data(), m_impl->m_mappedFile.size());

    const bool ok = m_impl->ParseInternal(local);
    if (!ok) {
        CS_LOG_DEBUG("PEParser", "%s stopped after %s: %s", path.c_str(),
                     ParseStageToString(m_impl->m_headers.completed), local.Describe().c_str());
    }
    out = std::move(m_impl->m_headers);
    m_impl->m_headers = PEHeaders();
    if (err) *err = std::move(local);
    return ok;
}

bool PEParser::ParseBuffer(const uint8_t* data, size_t size, PEHeaders& out, PEError* err) noexcept {
    m_impl->Reset();
    out = PEHeaders();

    PEError local;
    if (data == nullptr || size == 0) {
        local.SetWithContext(ValidationResult::NullPointer, "Null or empty buffer provided", "buffer");
        if (err) *err = std::move(local);
        return false;
    }

    m_impl->m_reader = SafeReader(data, size);

    const bool ok = m_impl->ParseInternal(local);
    out = std::move(m_impl->m_headers);
    m_impl->m_headers = PEHeaders();
    if (err) *err = std::move(local);
    return ok;
}

std::optional<size_t> PEParser::RvaToOffset(uint32_t rva) const noexcept {
    return m_impl->RvaToOffsetInternal(rva);
}

void PEParser::Reset() noexcept {
    m_impl->Reset();
}

} // namespace PEParser
} // namespace ClusterSig
