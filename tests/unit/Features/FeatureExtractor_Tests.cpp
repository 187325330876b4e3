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
 * @file FeatureExtractor_Tests.cpp
 * @brief Catalog lookups and header-to-feature extraction.
 */

#include <gtest/gtest.h>
#include "../../../src/Features/FeatureCatalog.hpp"
#include "../../../src/Features/FeatureExtractor.hpp"
#include "../TestHelpers.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using namespace ClusterSig::Features;
using ClusterSigTest::PeImageBuilder;
using ClusterSigTest::ResourceLeaf;

// ============================================================================
// Test Fixture
// ============================================================================

class FeatureExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {}

    void TearDown() override {}

    static ParseResult Extract(const std::vector<uint8_t>& image, bool experimental = false) {
        ParseOptions options;
        options.experimental = experimental;
        FeatureExtractor extractor(options);
        return extractor.ParseBuffer("sample.exe", image.data(), image.size());
    }

    static uint64_t U(const FeatureRecord& record, FeatureId id) {
        const auto& value = record.Get(id);
        if (!value) {
            ADD_FAILURE() << "missing " << FeatureName(id);
            return 0;
        }
        uint64_t out = 0;
        EXPECT_TRUE(AsUnsigned(*value, out)) << FeatureName(id);
        return out;
    }
};

// ============================================================================
// Catalog
// ============================================================================

TEST_F(FeatureExtractorTest, Catalog_NamesRoundTrip) {
    for (size_t i = 0; i < kFeatureCount; ++i) {
        const FeatureId id = FromIndex(i);
        const auto found = FindFeature(FeatureName(id));
        ASSERT_TRUE(found.has_value()) << FeatureName(id);
        EXPECT_EQ(*found, id);
    }
    EXPECT_FALSE(FindFeature("no such field").has_value());
}

TEST_F(FeatureExtractorTest, Catalog_Identifiers) {
    EXPECT_EQ(Identifier(FeatureId::DllCharacteristics), "dll_characteristics");
    EXPECT_EQ(Identifier(FeatureId::EntryPointAddress), "entry_point_address");
    EXPECT_EQ(Identifier(FeatureId::TlsTableSize), "tls_table_size");
}

TEST_F(FeatureExtractorTest, Catalog_Groups) {
    EXPECT_TRUE(IsFileHeaderField(FeatureId::CompileDate));
    EXPECT_FALSE(IsFileHeaderField(FeatureId::Magic));
    EXPECT_TRUE(IsOptionalHeaderField(FeatureId::Magic));
    EXPECT_TRUE(IsOptionalHeaderField(FeatureId::ImportTableSize));
    EXPECT_TRUE(IsResourceField(FeatureId::Resource1Language));
    EXPECT_FALSE(IsOptionalHeaderField(FeatureId::Resource0Size));
    EXPECT_TRUE(IsWideField(FeatureId::ImageBase));
    EXPECT_TRUE(IsWideField(FeatureId::SizeOfHeapCommit));
    EXPECT_FALSE(IsWideField(FeatureId::SizeOfImage));

    EXPECT_TRUE(IsAlwaysMeaningful(FeatureId::Magic));
    EXPECT_TRUE(IsAlwaysMeaningful(FeatureId::Checksum));
    EXPECT_TRUE(IsAlwaysMeaningful(FeatureId::Subsystem));
    EXPECT_TRUE(IsAlwaysMeaningful(FeatureId::Characteristics));
    EXPECT_FALSE(IsAlwaysMeaningful(FeatureId::CompileDate));
}

// ============================================================================
// Values
// ============================================================================

TEST_F(FeatureExtractorTest, Values_SignedAndUnsignedCompareByValue) {
    EXPECT_TRUE(ValuesEqual(FeatureValue{int64_t{5}}, FeatureValue{uint64_t{5}}));
    EXPECT_FALSE(ValuesEqual(FeatureValue{kSentinel}, FeatureValue{uint64_t{0xFFFFFFFFFFFFFFFFULL}}));
    EXPECT_FALSE(ValuesEqual(FeatureValue{uint64_t{1}}, FeatureValue{std::string("1")}));
    EXPECT_TRUE(ValueLess(FeatureValue{kSentinel}, FeatureValue{uint64_t{0}}));
    EXPECT_TRUE(ValueLess(FeatureValue{uint64_t{99}}, FeatureValue{std::string("a")}));
    EXPECT_TRUE(IsSentinelValue(FeatureValue{kSentinel}));
    EXPECT_EQ(FormatValue(FeatureValue{kSentinel}), "-1");
}

// ============================================================================
// Extraction
// ============================================================================

TEST_F(FeatureExtractorTest, Pe32_FullCatalogSubset) {
    const ParseResult result = Extract(PeImageBuilder().Build());
    EXPECT_TRUE(result.Complete());
    EXPECT_TRUE(result.warnings.empty());

    const FeatureRecord& r = result.record;
    EXPECT_EQ(r.Filename(), "sample.exe");
    EXPECT_EQ(r.PresentCount(), kFeatureCount - 3);

    EXPECT_EQ(U(r, FeatureId::MachineType), 0x14Cu);
    EXPECT_EQ(U(r, FeatureId::CompileDate), 0x5F000000u);
    EXPECT_EQ(U(r, FeatureId::Magic), 0x10Bu);
    EXPECT_EQ(U(r, FeatureId::BaseOfData), 0x3000u);
    EXPECT_EQ(U(r, FeatureId::ImageBase), 0x400000u);
    EXPECT_EQ(U(r, FeatureId::Subsystem), 2u);
    EXPECT_EQ(U(r, FeatureId::NumberOfRvaAndSizes), 16u);
    EXPECT_EQ(U(r, FeatureId::ImportTableVirtualAddress), 0x2000u);
    EXPECT_EQ(U(r, FeatureId::ImportAddressTableSize), 0x20u);
    EXPECT_EQ(U(r, FeatureId::ExportTableSize), 0u);

    EXPECT_EQ(U(r, FeatureId::Resource0Size), 0x2E8u);
    EXPECT_EQ(U(r, FeatureId::Resource0Offset), 0x1060u);
    EXPECT_EQ(U(r, FeatureId::Resource0Language), 0x09u);
    EXPECT_FALSE(r.Has(FeatureId::Resource1Size));
}

TEST_F(FeatureExtractorTest, Pe64_HasNoBaseOfData) {
    const ParseResult result = Extract(PeImageBuilder(true).Build());
    const FeatureRecord& r = result.record;
    EXPECT_FALSE(r.Has(FeatureId::BaseOfData));
    EXPECT_EQ(U(r, FeatureId::Magic), 0x20Bu);
    EXPECT_EQ(U(r, FeatureId::ImageBase), 0x140000000ULL);
    EXPECT_EQ(r.PresentCount(), kFeatureCount - 4);
}

TEST_F(FeatureExtractorTest, Resources_SecondLeafRecorded) {
    std::vector<ResourceLeaf> leaves(2);
    leaves[1].language = 0x0807;
    leaves[1].dataRva = 0x1100;
    leaves[1].size = 0x40;
    const FeatureRecord r = Extract(PeImageBuilder().Leaves(leaves).Build()).record;
    EXPECT_EQ(U(r, FeatureId::Resource1Size), 0x40u);
    EXPECT_EQ(U(r, FeatureId::Resource1Offset), 0x1100u);
    EXPECT_EQ(U(r, FeatureId::Resource1Language), 0x07u);
}

TEST_F(FeatureExtractorTest, Directories_OnlyDeclaredOnesExtracted) {
    const FeatureRecord r = Extract(PeImageBuilder().RvaAndSizes(2).Build()).record;
    EXPECT_TRUE(r.Has(FeatureId::ExportTableSize));
    EXPECT_TRUE(r.Has(FeatureId::ImportTableVirtualAddress));
    EXPECT_FALSE(r.Has(FeatureId::ResourceTableSize));
    EXPECT_FALSE(r.Has(FeatureId::ImportAddressTableSize));
    EXPECT_FALSE(r.Has(FeatureId::Resource0Size));
}

TEST_F(FeatureExtractorTest, Truncated_KeepsFieldsInsideFile) {
    const size_t cut = PeImageBuilder::OptionalHeaderOffset() + 40;
    const ParseResult result = Extract(PeImageBuilder().TruncateAt(cut).Build());
    EXPECT_FALSE(result.Complete());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, ClusterSig::PEParser::ValidationResult::OptionalHeaderTruncated);

    const FeatureRecord& r = result.record;
    EXPECT_TRUE(r.Has(FeatureId::Characteristics));
    EXPECT_TRUE(r.Has(FeatureId::FileAlignment));
    EXPECT_FALSE(r.Has(FeatureId::MajorOsVersion));
    EXPECT_FALSE(r.Has(FeatureId::Checksum));
    EXPECT_FALSE(r.Has(FeatureId::ImportTableSize));
    EXPECT_EQ(r.PresentCount(), 7u + 12u);
}

TEST_F(FeatureExtractorTest, Garbage_YieldsEmptyRecordAndWarning) {
    const std::vector<uint8_t> junk(512, 0xCC);
    const ParseResult result = Extract(junk);
    EXPECT_TRUE(result.record.Empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, ClusterSig::PEParser::ValidationResult::InvalidDosSignature);
}

// ============================================================================
// Experimental mode
// ============================================================================

TEST_F(FeatureExtractorTest, Experimental_TinyPeYieldsHeaderPrefix) {
    const auto tiny = ClusterSigTest::BuildTinyPe();

    EXPECT_TRUE(Extract(tiny, false).record.Empty());

    const ParseResult result = Extract(tiny, true);
    const FeatureRecord& r = result.record;
    EXPECT_EQ(U(r, FeatureId::MachineType), 0x14Cu);
    EXPECT_EQ(U(r, FeatureId::SectionAlignment), 4u);
    EXPECT_EQ(U(r, FeatureId::Checksum), 0x1234u);
    EXPECT_FALSE(r.Has(FeatureId::Subsystem));
    EXPECT_EQ(r.PresentCount(), 7u + 21u);
}

TEST_F(FeatureExtractorTest, MakeParserOptions_RelaxesOnlyInExperimentalMode) {
    const auto strict = MakeParserOptions(ParseOptions{ false });
    EXPECT_EQ(strict.validation.minFileSize, ClusterSig::PEParser::Limits::MIN_PE_FILE_SIZE);
    EXPECT_FALSE(strict.validation.allowOverlappingHeaders);

    const auto relaxed = MakeParserOptions(ParseOptions{ true });
    EXPECT_EQ(relaxed.validation.minFileSize, ClusterSig::PEParser::Limits::MIN_TINY_PE_FILE_SIZE);
    EXPECT_TRUE(relaxed.validation.allowOverlappingHeaders);
}

TEST_F(FeatureExtractorTest, File_FilenameIsBaseName) {
    ClusterSigTest::ScratchDir dir;
    const auto path = dir / "payload.dll";
    ClusterSigTest::WriteBytes(path, PeImageBuilder().Build());

    FeatureExtractor extractor;
    const ParseResult result = extractor.Parse(path);
    EXPECT_EQ(result.record.Filename(), "payload.dll");
    EXPECT_TRUE(result.Complete());
}
