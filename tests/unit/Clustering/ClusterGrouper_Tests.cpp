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
 * @file ClusterGrouper_Tests.cpp
 * @brief Label parsing and grouping of table rows into clusters.
 */

#include <gtest/gtest.h>
#include "../../../src/Clustering/ClusterGrouper.hpp"
#include "../../../src/Clustering/LabelFileSource.hpp"
#include "../TestHelpers.hpp"

#include <map>
#include <string>
#include <vector>

using namespace ClusterSig::Clustering;
using namespace ClusterSig::Features;
using ClusterSig::Utils::JSON::Json;

// ============================================================================
// Test Fixture
// ============================================================================

class ClusterGrouperTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<FeatureRecord> records;
        for (int i = 0; i < 5; ++i) {
            FeatureRecord record("sample" + std::to_string(i) + ".exe");
            record.SetUnsigned(FeatureId::MachineType, 0x14C);
            record.SetUnsigned(FeatureId::EntryPointAddress, 0x1000 + static_cast<uint64_t>(i));
            records.push_back(record);
        }
        ASSERT_TRUE(FeatureTable::Build(records, m_table));
        m_table.FillSentinels();
    }

    void TearDown() override {
        m_clusters.clear();
    }

    FeatureTable m_table;
    std::map<int64_t, Cluster> m_clusters;
};

// ============================================================================
// Grouping
// ============================================================================

TEST_F(ClusterGrouperTest, Group_SplitsRowsByLabel) {
    GroupingStats stats;
    ASSERT_TRUE(ClusterGrouper::Group(m_table, { 0, 1, 0, -1, 1 }, m_clusters, &stats));
    ASSERT_EQ(m_clusters.size(), 2u);
    EXPECT_EQ(m_clusters.at(0).sourceRows, (std::vector<size_t>{ 0, 2 }));
    EXPECT_EQ(m_clusters.at(1).sourceRows, (std::vector<size_t>{ 1, 4 }));
    EXPECT_EQ(m_clusters.at(1).rows.Filename(1), "sample4.exe");
    EXPECT_EQ(m_clusters.at(1).rows.ColumnCount(), m_table.ColumnCount());
    EXPECT_EQ(stats.labelled, 4u);
    EXPECT_EQ(stats.noise, 1u);
    EXPECT_EQ(stats.clusters, 2u);
}

TEST_F(ClusterGrouperTest, Group_LabelsBelowMinusOneAreNoise) {
    GroupingStats stats;
    ASSERT_TRUE(ClusterGrouper::Group(m_table, { -5, -2, 3, 3, -1 }, m_clusters, &stats));
    ASSERT_EQ(m_clusters.size(), 1u);
    EXPECT_EQ(m_clusters.begin()->first, 3);
    EXPECT_EQ(stats.noise, 3u);
}

TEST_F(ClusterGrouperTest, Group_AllNoiseGivesNoClusters) {
    GroupingStats stats;
    ASSERT_TRUE(ClusterGrouper::Group(m_table, { -1, -1, -1, -1, -1 }, m_clusters, &stats));
    EXPECT_TRUE(m_clusters.empty());
    EXPECT_EQ(stats.clusters, 0u);
}

TEST_F(ClusterGrouperTest, Group_LabelCountMismatchFails) {
    ClusterError err;
    EXPECT_FALSE(ClusterGrouper::Group(m_table, { 0, 0 }, m_clusters, nullptr, &err));
    EXPECT_TRUE(err.hasError());
}

TEST_F(ClusterGrouperTest, Group_UsesAttachedLabels) {
    ClusterError err;
    EXPECT_FALSE(ClusterGrouper::Group(m_table, m_clusters, nullptr, &err));
    EXPECT_TRUE(err.hasError());

    ASSERT_TRUE(m_table.AttachLabels({ 2, 2, 2, 2, 2 }));
    ASSERT_TRUE(ClusterGrouper::Group(m_table, m_clusters));
    ASSERT_EQ(m_clusters.size(), 1u);
    EXPECT_EQ(m_clusters.at(2).rows.RowCount(), 5u);
}

// ============================================================================
// Label documents
// ============================================================================

TEST_F(ClusterGrouperTest, ParseLabels_AcceptsBareArray) {
    std::vector<int64_t> labels;
    ASSERT_TRUE(ParseLabels(Json::parse("[0, 1, -1]"), labels));
    EXPECT_EQ(labels, (std::vector<int64_t>{ 0, 1, -1 }));
}

TEST_F(ClusterGrouperTest, ParseLabels_AcceptsLabelsObject) {
    std::vector<int64_t> labels;
    ASSERT_TRUE(ParseLabels(Json::parse(R"({"labels": [4, 4]})"), labels));
    EXPECT_EQ(labels.size(), 2u);
}

TEST_F(ClusterGrouperTest, ParseLabels_RejectsNonIntegers) {
    std::vector<int64_t> labels;
    ClusterError err;
    EXPECT_FALSE(ParseLabels(Json::parse("[0, 1.5]"), labels, &err));
    EXPECT_TRUE(labels.empty());
    EXPECT_TRUE(err.hasError());

    EXPECT_FALSE(ParseLabels(Json::parse(R"({"clusters": [0]})"), labels));
    EXPECT_FALSE(ParseLabels(Json::parse(R"(["0"])"), labels));
}

TEST_F(ClusterGrouperTest, LabelFile_AssignsMatchingCount) {
    ClusterSigTest::ScratchDir dir;
    ClusterSigTest::WriteText(dir / "labels.json", "[0, 0, 1, 1, -1]");
    LabelFileSource source(dir / "labels.json");

    std::vector<int64_t> labels;
    ClusterError err;
    ASSERT_TRUE(source.Assign(m_table, labels, &err)) << err.message;
    EXPECT_EQ(labels.size(), 5u);
    EXPECT_FALSE(source.Describe().empty());
}

TEST_F(ClusterGrouperTest, LabelFile_RejectsWrongCount) {
    ClusterSigTest::ScratchDir dir;
    ClusterSigTest::WriteText(dir / "labels.json", "[0, 0, 1]");
    LabelFileSource source(dir / "labels.json");

    std::vector<int64_t> labels;
    ClusterError err;
    EXPECT_FALSE(source.Assign(m_table, labels, &err));
    EXPECT_TRUE(err.hasError());
}

TEST_F(ClusterGrouperTest, LabelFile_MissingFileFails) {
    ClusterSigTest::ScratchDir dir;
    LabelFileSource source(dir / "absent.json");
    std::vector<int64_t> labels;
    ClusterError err;
    EXPECT_FALSE(source.Assign(m_table, labels, &err));
    EXPECT_NE(err.message.find("absent.json"), std::string::npos);
}
