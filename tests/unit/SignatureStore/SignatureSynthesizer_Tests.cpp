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
 * @file SignatureSynthesizer_Tests.cpp
 * @brief Column classification, consensus patterns and representative choice.
 */

#include <gtest/gtest.h>
#include "../../../src/SignatureStore/SignatureSynthesizer.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace ClusterSig::SignatureStore;
using namespace ClusterSig::Features;

// ============================================================================
// Test Fixture
// ============================================================================

class SignatureSynthesizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_options.author = "analyst";
        m_options.contact = "analyst@example.org";
        m_options.clusterType = "dbscan";
    }

    void TearDown() override {
        m_records.clear();
    }

    /// Appends a PE32 record with a few common header fields
    FeatureRecord& AddSample(const std::string& name, uint64_t compileDate, uint64_t entryPoint) {
        FeatureRecord record(name);
        record.SetUnsigned(FeatureId::MachineType, 0x14C);
        record.SetUnsigned(FeatureId::CompileDate, compileDate);
        record.SetUnsigned(FeatureId::Magic, 0x10B);
        record.SetUnsigned(FeatureId::EntryPointAddress, entryPoint);
        m_records.push_back(record);
        return m_records.back();
    }

    FeatureTable Table() {
        FeatureTable table;
        EXPECT_TRUE(FeatureTable::Build(m_records, table));
        table.FillSentinels();
        return table;
    }

    Signature Run(bool experimental = false) {
        SynthesisOptions options = m_options;
        options.experimental = experimental;
        return SignatureSynthesizer(options).Synthesize(7, Table());
    }

    static const CandidateField* Candidate(const Signature& sig, FeatureId id) {
        const auto it = std::find_if(sig.candidates.begin(), sig.candidates.end(),
                                     [id](const CandidateField& f) { return f.id == id; });
        return it == sig.candidates.end() ? nullptr : &*it;
    }

    static const OptionalHeaderPattern* Pattern(const Signature& sig, FeatureId id) {
        const auto it = std::find_if(sig.optionalHeader.begin(), sig.optionalHeader.end(),
                                     [id](const OptionalHeaderPattern& p) { return p.id == id; });
        return it == sig.optionalHeader.end() ? nullptr : &*it;
    }

    SynthesisOptions m_options;
    std::vector<FeatureRecord> m_records;
};

// ============================================================================
// Metadata
// ============================================================================

TEST_F(SignatureSynthesizerTest, Meta_OrderAndSamples) {
    AddSample("one.exe", 1, 0x1000);
    AddSample("two.exe", 2, 0x1000);
    const Signature sig = Run();

    ASSERT_EQ(sig.meta.size(), 5u);
    EXPECT_EQ(sig.meta[0].first, "author");
    EXPECT_EQ(sig.meta[0].second, "analyst");
    EXPECT_EQ(sig.meta[1].first, "contact");
    EXPECT_EQ(sig.meta[2].first, "cluster");
    EXPECT_EQ(sig.meta[2].second, "7");
    EXPECT_EQ(sig.meta[3].first, "sample_0");
    EXPECT_EQ(sig.meta[3].second, "one.exe");
    EXPECT_EQ(sig.meta[4].second, "two.exe");
    EXPECT_EQ(sig.clusterId, 7);
    EXPECT_EQ(sig.clusterType, "dbscan");
}

// ============================================================================
// Classification
// ============================================================================

TEST_F(SignatureSynthesizerTest, Classify_VariableFileHeaderFieldOmitted) {
    AddSample("a.exe", 0x5F000000, 0x1000);
    AddSample("b.exe", 0x5F000100, 0x1000);
    const Signature sig = Run();

    ASSERT_EQ(sig.fileHeader.size(), 1u);
    EXPECT_EQ(sig.fileHeader[0].id, FeatureId::MachineType);
    EXPECT_EQ(sig.fileHeader[0].value, 0x14Cu);

    const CandidateField* date = Candidate(sig, FeatureId::CompileDate);
    ASSERT_NE(date, nullptr);
    EXPECT_EQ(date->classification, CandidateClass::VariableUnconvertible);
    EXPECT_EQ(date->distinctValues, 2u);

    const OptionalHeaderPattern* magic = Pattern(sig, FeatureId::Magic);
    ASSERT_NE(magic, nullptr);
    EXPECT_EQ(magic->hex, "0b010000");
    EXPECT_FALSE(magic->wildcarded);

    const OptionalHeaderPattern* entry = Pattern(sig, FeatureId::EntryPointAddress);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->hex, "00100000");
    EXPECT_TRUE(sig.IsEmitable());
}

TEST_F(SignatureSynthesizerTest, Classify_NibbleConsensus) {
    AddSample("a.exe", 1, 0x1000);
    AddSample("b.exe", 1, 0x1004);
    const Signature sig = Run();

    const OptionalHeaderPattern* entry = Pattern(sig, FeatureId::EntryPointAddress);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->hex, "0?100000");
    EXPECT_TRUE(entry->wildcarded);
    EXPECT_EQ(Candidate(sig, FeatureId::EntryPointAddress)->classification,
              CandidateClass::VariableConvertible);
    EXPECT_EQ(sig.CountOf(CandidateClass::VariableConvertible), 1u);
}

TEST_F(SignatureSynthesizerTest, Classify_TooManyDistinctValues) {
    for (uint64_t i = 0; i < 10; ++i) {
        AddSample("s" + std::to_string(i), 1, 0x1000 + i);
    }
    const Signature sig = Run();

    EXPECT_EQ(Pattern(sig, FeatureId::EntryPointAddress), nullptr);
    const CandidateField* entry = Candidate(sig, FeatureId::EntryPointAddress);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->classification, CandidateClass::VariableUnconvertible);
    EXPECT_EQ(entry->distinctValues, 10u);
}

TEST_F(SignatureSynthesizerTest, Classify_NineDistinctValuesStillConvert) {
    for (uint64_t i = 0; i < 9; ++i) {
        AddSample("s" + std::to_string(i), 1, 0x1000 + i);
    }
    const Signature sig = Run();

    const OptionalHeaderPattern* entry = Pattern(sig, FeatureId::EntryPointAddress);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->hex, "0?100000");
}

TEST_F(SignatureSynthesizerTest, Classify_NoCommonNibbleIsDropped) {
    AddSample("a.exe", 1, 0x11111111);
    AddSample("b.exe", 1, 0x22222222);
    const Signature sig = Run();

    EXPECT_EQ(Pattern(sig, FeatureId::EntryPointAddress), nullptr);
    EXPECT_EQ(Candidate(sig, FeatureId::EntryPointAddress)->classification,
              CandidateClass::VariableUnconvertible);
}

TEST_F(SignatureSynthesizerTest, Classify_ValuesOutside32BitsNotConverted) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::ImageBase, 0x140000000ULL);
    AddSample("b.exe", 1, 0x1000).SetUnsigned(FeatureId::ImageBase, 0x150000000ULL);
    const Signature sig = Run();

    EXPECT_EQ(Pattern(sig, FeatureId::ImageBase), nullptr);
    EXPECT_EQ(Candidate(sig, FeatureId::ImageBase)->classification,
              CandidateClass::VariableUnconvertible);
}

TEST_F(SignatureSynthesizerTest, Classify_PartiallyPresentColumnVaries) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::ExportTableSize, 0x40);
    AddSample("b.exe", 1, 0x1000);
    AddSample("c.exe", 1, 0x1000);
    const Signature sig = Run();

    // {0x40, -1} contains a sentinel, so no consensus is attempted
    const CandidateField* exports = Candidate(sig, FeatureId::ExportTableSize);
    ASSERT_NE(exports, nullptr);
    EXPECT_EQ(exports->classification, CandidateClass::VariableUnconvertible);
    EXPECT_EQ(exports->distinctValues, 2u);
    EXPECT_EQ(exports->reason, "sentinel value");
    EXPECT_EQ(Pattern(sig, FeatureId::ExportTableSize), nullptr);
}

TEST_F(SignatureSynthesizerTest, Classify_VariableColumnReasons) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::ImageBase, 0x140000000ULL);
    AddSample("b.exe", 2, 0x1000).SetUnsigned(FeatureId::ImageBase, 0x150000000ULL);
    const Signature sig = Run();

    EXPECT_EQ(Candidate(sig, FeatureId::ImageBase)->reason, "value outside 32 bits");
    EXPECT_EQ(Candidate(sig, FeatureId::CompileDate)->reason, "not an optional header field");
}

TEST_F(SignatureSynthesizerTest, Classify_MeaningfulOptionalHeaderSentinelNotPacked) {
    std::vector<TableRow> rows(2);
    rows[0].filename = "a.exe";
    rows[1].filename = "b.exe";
    for (auto& row : rows) {
        row.cells.resize(4);
        row.cells[0] = FeatureCell{ CellState::Sentinel, FeatureValue{ kSentinel } };
        row.cells[1] = FeatureCell{ CellState::Sentinel, FeatureValue{ kSentinel } };
        row.cells[2] = FeatureCell{ CellState::Sentinel, FeatureValue{ kSentinel } };
        row.cells[3] = FeatureCell{ CellState::Present, FeatureValue{ uint64_t{0x1000} } };
    }
    FeatureTable table;
    ASSERT_TRUE(table.Assign({ FeatureId::Magic, FeatureId::Checksum,
                               FeatureId::Subsystem, FeatureId::EntryPointAddress },
                             rows));

    const Signature sig = SignatureSynthesizer(m_options).Synthesize(1, table);

    for (const FeatureId id : { FeatureId::Magic, FeatureId::Checksum, FeatureId::Subsystem }) {
        const CandidateField* field = Candidate(sig, id);
        ASSERT_NE(field, nullptr);
        EXPECT_EQ(field->classification, CandidateClass::ConstantSuppressed);
        EXPECT_EQ(field->reason, "sentinel cannot be packed");
        EXPECT_EQ(Pattern(sig, id), nullptr);
    }
    ASSERT_NE(Pattern(sig, FeatureId::EntryPointAddress), nullptr);
    EXPECT_EQ(Pattern(sig, FeatureId::EntryPointAddress)->hex, "00100000");
}

TEST_F(SignatureSynthesizerTest, Classify_AllSentinelColumn) {
    std::vector<TableRow> rows(2);
    rows[0].filename = "a.exe";
    rows[1].filename = "b.exe";
    for (auto& row : rows) {
        row.cells.resize(4);
        row.cells[0] = FeatureCell{ CellState::Present, FeatureValue{ uint64_t{0x14C} } };
        row.cells[1] = FeatureCell{ CellState::Sentinel, FeatureValue{ kSentinel } };
        row.cells[2] = FeatureCell{ CellState::Sentinel, FeatureValue{ kSentinel } };
        row.cells[3] = FeatureCell{ CellState::Present, FeatureValue{ uint64_t{0x10B} } };
    }
    FeatureTable table;
    ASSERT_TRUE(table.Assign({ FeatureId::MachineType, FeatureId::NumberOfSymbols,
                               FeatureId::Characteristics, FeatureId::Magic },
                             rows));

    const Signature sig = SignatureSynthesizer(m_options).Synthesize(1, table);

    EXPECT_EQ(Candidate(sig, FeatureId::NumberOfSymbols)->classification,
              CandidateClass::ConstantSuppressed);
    // Characteristics stays meaningful, but a sentinel is never asserted
    EXPECT_EQ(Candidate(sig, FeatureId::Characteristics)->classification,
              CandidateClass::ConstantUseful);
    ASSERT_EQ(sig.fileHeader.size(), 1u);
    EXPECT_EQ(sig.fileHeader[0].id, FeatureId::MachineType);
}

TEST_F(SignatureSynthesizerTest, Classify_ResourceColumnsProduceNoPattern) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::Resource0Size, 0x2E8);
    AddSample("b.exe", 1, 0x1000).SetUnsigned(FeatureId::Resource0Size, 0x2E8);
    const Signature sig = Run();

    const CandidateField* res = Candidate(sig, FeatureId::Resource0Size);
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(res->region, HeaderRegion::None);
    EXPECT_EQ(res->classification, CandidateClass::ConstantUseful);
    EXPECT_EQ(Pattern(sig, FeatureId::Resource0Size), nullptr);
}

TEST_F(SignatureSynthesizerTest, Classify_FileHeaderOnlyIsNotEmitable) {
    FeatureRecord record("a.exe");
    record.SetUnsigned(FeatureId::MachineType, 0x14C);
    m_records.push_back(record);
    const Signature sig = Run();

    EXPECT_EQ(sig.fileHeader.size(), 1u);
    EXPECT_FALSE(sig.IsEmitable());
}

// ============================================================================
// Packing width
// ============================================================================

TEST_F(SignatureSynthesizerTest, Width_WideFieldsPackAtEightBytesForPe64) {
    for (const char* name : { "a.exe", "b.exe" }) {
        FeatureRecord& r = AddSample(name, 1, 0x1000);
        r.SetUnsigned(FeatureId::Magic, 0x20B);
        r.SetUnsigned(FeatureId::ImageBase, 0x140000000ULL);
        r.SetUnsigned(FeatureId::SizeOfStackReserve, 0x100000);
    }
    const Signature sig = Run();

    ASSERT_NE(Pattern(sig, FeatureId::ImageBase), nullptr);
    EXPECT_EQ(Pattern(sig, FeatureId::ImageBase)->hex, "0000004001000000");
    EXPECT_EQ(Pattern(sig, FeatureId::SizeOfStackReserve)->hex, "0000100000000000");
    EXPECT_EQ(Pattern(sig, FeatureId::Magic)->hex, "0b020000");
}

TEST_F(SignatureSynthesizerTest, Width_WideFieldsPackAtFourBytesForPe32) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::ImageBase, 0x400000);
    const Signature sig = Run();

    ASSERT_NE(Pattern(sig, FeatureId::ImageBase), nullptr);
    EXPECT_EQ(Pattern(sig, FeatureId::ImageBase)->hex, "00004000");
}

TEST_F(SignatureSynthesizerTest, Width_OversizedConstantIsSuppressed) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::ImageBase, 0x140000000ULL);
    const Signature sig = Run();

    EXPECT_EQ(Pattern(sig, FeatureId::ImageBase), nullptr);
    EXPECT_EQ(Candidate(sig, FeatureId::ImageBase)->classification,
              CandidateClass::ConstantSuppressed);
}

// ============================================================================
// Representative
// ============================================================================

TEST_F(SignatureSynthesizerTest, Representative_MostFrequentFilename) {
    AddSample("x.exe", 1, 0x1000);
    AddSample("y.exe", 2, 0x1000);
    AddSample("y.exe", 3, 0x1000);
    EXPECT_EQ(SignatureSynthesizer::SelectRepresentative(Table()), 1u);
}

TEST_F(SignatureSynthesizerTest, Representative_TieGoesToEarliestRow) {
    AddSample("b.exe", 1, 0x1000);
    AddSample("a.exe", 2, 0x1000);
    AddSample("a.exe", 3, 0x1000);
    AddSample("b.exe", 4, 0x1000);
    EXPECT_EQ(SignatureSynthesizer::SelectRepresentative(Table()), 0u);

    const Signature sig = Run();
    EXPECT_EQ(sig.representative, "b.exe");
    EXPECT_EQ(sig.representativeRow, 0u);
}

// ============================================================================
// Experimental file header pattern
// ============================================================================

TEST_F(SignatureSynthesizerTest, Experimental_CoffPatternWildcardsMissingFields) {
    AddSample("a.exe", 1, 0x1000).SetUnsigned(FeatureId::NumberOfSections, 3);
    AddSample("b.exe", 2, 0x1000).SetUnsigned(FeatureId::NumberOfSections, 3);
    const Signature sig = Run(true);

    ASSERT_TRUE(sig.fileHeaderPattern.has_value());
    EXPECT_EQ(sig.fileHeaderPattern->size(), 40u);
    EXPECT_EQ(*sig.fileHeaderPattern, "4c010300" + std::string(32, '?'));
}

TEST_F(SignatureSynthesizerTest, Experimental_OffByDefault) {
    AddSample("a.exe", 1, 0x1000);
    EXPECT_FALSE(Run().fileHeaderPattern.has_value());
}
