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
#include "FeatureCatalog.hpp"

#include <cctype>

namespace ClusterSig {
namespace Features {

namespace {

using G = FeatureGroup;

// Order must follow FeatureId
constexpr FeatureDescriptor kCatalog[kFeatureCount] = {
    { FeatureId::MachineType,          "machine type",             G::FileHeader, false, false },
    { FeatureId::NumberOfSections,     "number of sections",       G::FileHeader, false, false },
    { FeatureId::CompileDate,          "compile date",             G::FileHeader, false, false },
    { FeatureId::PointerToSymbolTable, "pointer to symbol table",  G::FileHeader, false, false },
    { FeatureId::NumberOfSymbols,      "number of symbols",        G::FileHeader, false, false },
    { FeatureId::SizeOfOptionalHeader, "size of optional header",  G::FileHeader, false, false },
    { FeatureId::Characteristics,      "characteristics",          G::FileHeader, false, true  },

    { FeatureId::Magic,                   "magic",                      G::OptionalHeader, false, true  },
    { FeatureId::MajorLinkerVersion,      "major linker version",       G::OptionalHeader, false, false },
    { FeatureId::MinorLinkerVersion,      "minor linker version",       G::OptionalHeader, false, false },
    { FeatureId::SizeOfCode,              "size of code",               G::OptionalHeader, false, false },
    { FeatureId::SizeOfInitializedData,   "size of initialized data",   G::OptionalHeader, false, false },
    { FeatureId::SizeOfUninitializedData, "size of uninitialized data", G::OptionalHeader, false, false },
    { FeatureId::EntryPointAddress,       "entry point address",        G::OptionalHeader, false, false },
    { FeatureId::BaseOfCode,              "base of code",               G::OptionalHeader, false, false },
    { FeatureId::BaseOfData,              "base of data",               G::OptionalHeader, false, false },
    { FeatureId::ImageBase,               "image base",                 G::OptionalHeader, true,  false },
    { FeatureId::SectionAlignment,        "section alignment",          G::OptionalHeader, false, false },
    { FeatureId::FileAlignment,           "file alignment",             G::OptionalHeader, false, false },
    { FeatureId::MajorOsVersion,          "major OS version",           G::OptionalHeader, false, false },
    { FeatureId::MinorOsVersion,          "minor OS version",           G::OptionalHeader, false, false },
    { FeatureId::MajorImageVersion,       "major image version",        G::OptionalHeader, false, false },
    { FeatureId::MinorImageVersion,       "minor image version",        G::OptionalHeader, false, false },
    { FeatureId::MajorSubsystemVersion,   "major subsystem version",    G::OptionalHeader, false, false },
    { FeatureId::MinorSubsystemVersion,   "minor subsystem version",    G::OptionalHeader, false, false },
    { FeatureId::SizeOfImage,             "size of image",              G::OptionalHeader, false, false },
    { FeatureId::SizeOfHeaders,           "size of headers",            G::OptionalHeader, false, false },
    { FeatureId::Checksum,                "checksum",                   G::OptionalHeader, false, true  },
    { FeatureId::Subsystem,               "subsystem",                  G::OptionalHeader, false, true  },
    { FeatureId::DllCharacteristics,      "DLL characteristics",        G::OptionalHeader, false, false },
    { FeatureId::SizeOfStackReserve,      "size of stack reserve",      G::OptionalHeader, true,  false },
    { FeatureId::SizeOfStackCommit,       "size of stack commit",       G::OptionalHeader, true,  false },
    { FeatureId::SizeOfHeapReserve,       "size of heap reserve",       G::OptionalHeader, true,  false },
    { FeatureId::SizeOfHeapCommit,        "size of heap commit",        G::OptionalHeader, true,  false },
    { FeatureId::LoaderFlags,             "loader flags",               G::OptionalHeader, false, false },
    { FeatureId::NumberOfRvaAndSizes,     "number of RVA and sizes",    G::OptionalHeader, false, false },

    { FeatureId::ExportTableSize,                   "export table size",                      G::DataDirectory, false, false },
    { FeatureId::ExportTableVirtualAddress,         "export table virtual address",           G::DataDirectory, false, false },
    { FeatureId::ImportTableSize,                   "import table size",                      G::DataDirectory, false, false },
    { FeatureId::ImportTableVirtualAddress,         "import table virtual address",           G::DataDirectory, false, false },
    { FeatureId::ResourceTableSize,                 "resource table size",                    G::DataDirectory, false, false },
    { FeatureId::ResourceTableVirtualAddress,       "resource table virtual address",         G::DataDirectory, false, false },
    { FeatureId::ExceptionTableSize,                "exception table size",                   G::DataDirectory, false, false },
    { FeatureId::ExceptionTableVirtualAddress,      "exception table virtual address",        G::DataDirectory, false, false },
    { FeatureId::BaseRelocationTableSize,           "base relocation table size",             G::DataDirectory, false, false },
    { FeatureId::BaseRelocationTableVirtualAddress, "base relocation table virtual address",  G::DataDirectory, false, false },
    { FeatureId::DebugSize,                         "debug size",                             G::DataDirectory, false, false },
    { FeatureId::DebugVirtualAddress,               "debug virtual address",                  G::DataDirectory, false, false },
    { FeatureId::TlsTableSize,                      "TLS table size",                         G::DataDirectory, false, false },
    { FeatureId::TlsTableVirtualAddress,            "TLS table virtual address",              G::DataDirectory, false, false },
    { FeatureId::ImportAddressTableSize,            "import address table size",              G::DataDirectory, false, false },
    { FeatureId::ImportAddressTableVirtualAddress,  "import address table virtual address",   G::DataDirectory, false, false },

    { FeatureId::Resource0Size,     "resource 0 size",     G::Resource, false, false },
    { FeatureId::Resource0Offset,   "resource 0 offset",   G::Resource, false, false },
    { FeatureId::Resource0Language, "resource 0 language", G::Resource, false, false },
    { FeatureId::Resource1Size,     "resource 1 size",     G::Resource, false, false },
    { FeatureId::Resource1Offset,   "resource 1 offset",   G::Resource, false, false },
    { FeatureId::Resource1Language, "resource 1 language", G::Resource, false, false },
};

constexpr bool CatalogIsOrdered() noexcept {
    for (size_t i = 0; i < kFeatureCount; ++i) {
        if (static_cast<size_t>(kCatalog[i].id) != i) return false;
    }
    return true;
}

static_assert(CatalogIsOrdered(), "Catalog entries must follow FeatureId order");

} // namespace

const FeatureDescriptor& Describe(FeatureId id) noexcept {
    const size_t index = ToIndex(id);
    return kCatalog[index < kFeatureCount ? index : 0];
}

const char* FeatureName(FeatureId id) noexcept {
    if (ToIndex(id) >= kFeatureCount) {
        return "unknown";
    }
    return kCatalog[ToIndex(id)].name;
}

std::optional<FeatureId> FindFeature(std::string_view name) noexcept {
    for (const auto& entry : kCatalog) {
        if (name == entry.name) {
            return entry.id;
        }
    }
    return std::nullopt;
}

std::string Identifier(FeatureId id) {
    std::string out = FeatureName(id);
    for (char& c : out) {
        if (c == ' ') {
            c = '_';
        }
        else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

bool IsFileHeaderField(FeatureId id) noexcept {
    return ToIndex(id) < kFeatureCount && Describe(id).group == FeatureGroup::FileHeader;
}

bool IsOptionalHeaderField(FeatureId id) noexcept {
    if (ToIndex(id) >= kFeatureCount) return false;
    const FeatureGroup group = Describe(id).group;
    return group == FeatureGroup::OptionalHeader || group == FeatureGroup::DataDirectory;
}

bool IsResourceField(FeatureId id) noexcept {
    return ToIndex(id) < kFeatureCount && Describe(id).group == FeatureGroup::Resource;
}

bool IsWideField(FeatureId id) noexcept {
    return ToIndex(id) < kFeatureCount && Describe(id).wide;
}

bool IsAlwaysMeaningful(FeatureId id) noexcept {
    return ToIndex(id) < kFeatureCount && Describe(id).alwaysMeaningful;
}

} // namespace Features
} // namespace ClusterSig
