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
 * @file YaraRuleWriter_Tests.cpp
 * @brief Rule rendering, libyara validation and file output.
 */

#include <gtest/gtest.h>
#include "../../../src/SignatureStore/YaraRuleWriter.hpp"
#include "../../../src/SignatureStore/YaraCompiler.hpp"
#include "../TestHelpers.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace ClusterSig::SignatureStore;
using ClusterSig::Features::FeatureId;

// ============================================================================
// Test Fixture
// ============================================================================

class YaraRuleWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_sig.clusterId = 3;
        m_sig.clusterType = "dbscan";
        m_sig.meta = { { "author", "analyst" }, { "cluster", "3" }, { "sample_0", "a.exe" } };
        m_sig.fileHeader.push_back(FileHeaderAssertion{ FeatureId::MachineType, 0x14C });
        m_sig.optionalHeader.push_back(OptionalHeaderPattern{ FeatureId::EntryPointAddress, "0?100000", true });
    }

    void TearDown() override {
    }

    RuleOutputOptions OutputTo(const std::filesystem::path& dir, bool validate) {
        RuleOutputOptions options;
        options.directory = dir;
        options.validate = validate;
        return options;
    }

    Signature m_sig;
};

// ============================================================================
// Rendering
// ============================================================================

TEST_F(YaraRuleWriterTest, Render_FullRuleText) {
    const std::string expected =
        "import \"pe\"\n"
        "\n"
        "rule dbscan_cluster_3\n"
        "{\n"
        "    meta:\n"
        "        author = \"analyst\"\n"
        "        cluster = \"3\"\n"
        "        sample_0 = \"a.exe\"\n"
        "    strings:\n"
        "        $entry_point_address = { 0? 10 00 00 }\n"
        "    condition:\n"
        "        uint16(0) == 0x5A4D and\n"
        "        pe.machine == 0x14C and\n"
        "        all of them\n"
        "}\n";
    EXPECT_EQ(YaraRuleWriter::Render(m_sig), expected);
}

TEST_F(YaraRuleWriterTest, Render_ExperimentalHeaderAnchor) {
    m_sig.fileHeaderPattern = "4c01" + std::string(36, '?');
    const std::string text = YaraRuleWriter::Render(m_sig);
    EXPECT_NE(text.find("$file_header = { 4c 01 ?? ??"), std::string::npos);
    EXPECT_NE(text.find("$file_header at uint32(0x3C) + 4 and\n"), std::string::npos);
}

TEST_F(YaraRuleWriterTest, Render_AssertionsUseUppercaseHex) {
    m_sig.fileHeader.push_back(FileHeaderAssertion{ FeatureId::Characteristics, 0x2102 });
    m_sig.fileHeader.push_back(FileHeaderAssertion{ FeatureId::CompileDate, 0x5f000000 });
    const std::string text = YaraRuleWriter::Render(m_sig);
    EXPECT_NE(text.find("pe.characteristics == 0x2102"), std::string::npos);
    EXPECT_NE(text.find("pe.timestamp == 0x5F000000"), std::string::npos);
}

TEST_F(YaraRuleWriterTest, Render_EscapesMetaValues) {
    EXPECT_EQ(YaraRuleWriter::EscapeString("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(YaraRuleWriter::EscapeString(std::string(1, '\x01')), "\\x01");
}

TEST_F(YaraRuleWriterTest, Names_RuleAndOutputPath) {
    m_sig.clusterType = "kmeans";
    m_sig.clusterId = 12;
    EXPECT_EQ(YaraRuleWriter::RuleName(m_sig), "kmeans_cluster_12");

    RuleOutputOptions options;
    options.directory = "out";
    options.extension = "";
    const YaraRuleWriter writer(options);
    EXPECT_EQ(writer.OutputPath(m_sig), std::filesystem::path("out") / "kmeans_cluster_12.yar");
}

TEST_F(YaraRuleWriterTest, Names_PeModuleFieldsCoverFileHeaderOnly) {
    EXPECT_STREQ(YaraRuleWriter::PeModuleField(FeatureId::MachineType), "machine");
    EXPECT_STREQ(YaraRuleWriter::PeModuleField(FeatureId::NumberOfSections), "number_of_sections");
    EXPECT_EQ(YaraRuleWriter::PeModuleField(FeatureId::Magic), nullptr);
}

// ============================================================================
// Writing
// ============================================================================

TEST_F(YaraRuleWriterTest, Write_ValidatedRuleLandsOnDisk) {
    ClusterSigTest::ScratchDir dir;
    const YaraRuleWriter writer(OutputTo(dir / "rules", true));

    std::filesystem::path written;
    const StoreError err = writer.Write(m_sig, &written);
    ASSERT_TRUE(err.IsSuccess()) << err.message;
    EXPECT_EQ(written, dir / "rules" / "dbscan_cluster_3.yar");
    EXPECT_EQ(ClusterSigTest::ReadText(written), YaraRuleWriter::Render(m_sig));
}

TEST_F(YaraRuleWriterTest, Write_RefusesSignatureWithoutPatterns) {
    ClusterSigTest::ScratchDir dir;
    m_sig.optionalHeader.clear();
    const YaraRuleWriter writer(OutputTo(dir.Path(), false));

    const StoreError err = writer.Write(m_sig);
    EXPECT_EQ(err.code, SignatureStoreError::InvalidSignature);
    EXPECT_FALSE(std::filesystem::exists(writer.OutputPath(m_sig)));
}

TEST_F(YaraRuleWriterTest, Write_RejectsRuleYaraCannotCompile) {
    ClusterSigTest::ScratchDir dir;
    m_sig.meta.emplace_back("not an identifier", "x");
    const YaraRuleWriter writer(OutputTo(dir.Path(), true));

    const StoreError err = writer.Write(m_sig);
    EXPECT_EQ(err.code, SignatureStoreError::CompilationFailed);
    EXPECT_FALSE(err.message.empty());
    EXPECT_FALSE(std::filesystem::exists(writer.OutputPath(m_sig)));
}

TEST_F(YaraRuleWriterTest, Write_ReportsUnwritableDirectory) {
    ClusterSigTest::ScratchDir dir;
    ClusterSigTest::WriteText(dir / "blocker", "file, not a directory");
    const YaraRuleWriter writer(OutputTo(dir / "blocker" / "rules", false));

    const StoreError err = writer.Write(m_sig);
    EXPECT_EQ(err.code, SignatureStoreError::WriteFailed);
}

// ============================================================================
// Matching
// ============================================================================

TEST_F(YaraRuleWriterTest, Match_RuleHitsItsOwnSample) {
    const auto image = ClusterSigTest::PeImageBuilder().EntryPoint(0x1004).Build();

    size_t matches = 0;
    std::vector<std::string> errors;
    ASSERT_TRUE(YaraUtils::CountMatches(YaraRuleWriter::Render(m_sig), image.data(), image.size(),
                                        matches, &errors))
        << (errors.empty() ? "" : errors.front());
    EXPECT_EQ(matches, 1u);
}

TEST_F(YaraRuleWriterTest, Match_OtherMachineIsRejected) {
    const auto image = ClusterSigTest::PeImageBuilder(true).Build();

    size_t matches = 0;
    ASSERT_TRUE(YaraUtils::CountMatches(YaraRuleWriter::Render(m_sig), image.data(), image.size(), matches));
    EXPECT_EQ(matches, 0u);
}

TEST_F(YaraRuleWriterTest, Validate_ReportsSyntaxErrors) {
    std::vector<std::string> errors;
    EXPECT_TRUE(YaraUtils::ValidateRuleSyntax(YaraRuleWriter::Render(m_sig), errors));
    EXPECT_FALSE(YaraUtils::ValidateRuleSyntax("rule broken {", errors));
    EXPECT_FALSE(errors.empty());
}
