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
 * @file HexPattern_Tests.cpp
 * @brief Little-endian packing and nibble consensus.
 */

#include <gtest/gtest.h>
#include "../../../src/SignatureStore/HexPattern.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace ClusterSig::SignatureStore;

// ============================================================================
// Test Fixture
// ============================================================================

class HexPatternTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_out.clear();
    }

    void TearDown() override {
    }

    std::string m_out;
};

// ============================================================================
// Packing
// ============================================================================

TEST_F(HexPatternTest, Pack_LittleEndianLowercase) {
    ASSERT_TRUE(PackLittleEndianHex(0x14C, 2, m_out));
    EXPECT_EQ(m_out, "4c01");
    ASSERT_TRUE(PackLittleEndianHex(0x1000, 4, m_out));
    EXPECT_EQ(m_out, "00100000");
    ASSERT_TRUE(PackLittleEndianHex(0x140000000ULL, 8, m_out));
    EXPECT_EQ(m_out, "0000004001000000");
}

TEST_F(HexPatternTest, Pack_ZeroIsAllZeroDigits) {
    ASSERT_TRUE(PackLittleEndianHex(0, 4, m_out));
    EXPECT_EQ(m_out, "00000000");
}

TEST_F(HexPatternTest, Pack_FullWidth64) {
    ASSERT_TRUE(PackLittleEndianHex(UINT64_MAX, 8, m_out));
    EXPECT_EQ(m_out, std::string(16, 'f'));
}

TEST_F(HexPatternTest, Pack_RejectsOverflowAndBadWidth) {
    EXPECT_FALSE(PackLittleEndianHex(0x100000000ULL, 4, m_out));
    EXPECT_FALSE(PackLittleEndianHex(0x100, 1, m_out));
    EXPECT_FALSE(PackLittleEndianHex(1, 0, m_out));
    EXPECT_FALSE(PackLittleEndianHex(1, 9, m_out));
}

TEST_F(HexPatternTest, Unpack_ReversesPacking) {
    uint64_t value = 0;
    ASSERT_TRUE(UnpackLittleEndianHex("4c01", value));
    EXPECT_EQ(value, 0x14Cu);
    ASSERT_TRUE(UnpackLittleEndianHex("0B02", value));
    EXPECT_EQ(value, 0x20Bu);
}

TEST_F(HexPatternTest, Pack_RoundTripBoundaries32And64) {
    const std::vector<uint64_t> narrow = { 0, 1, 0x7FFFFFFFULL, 0x80000000ULL, 0xFFFFFFFFULL };
    for (const uint64_t v : narrow) {
        uint64_t back = 0;
        ASSERT_TRUE(PackLittleEndianHex(v, 4, m_out)) << v;
        EXPECT_EQ(m_out.size(), 8u);
        ASSERT_TRUE(UnpackLittleEndianHex(m_out, back));
        EXPECT_EQ(back, v);
    }

    const std::vector<uint64_t> wide = { 0, 0x140000000ULL, 0x100000000ULL,
                                         0x8000000000000000ULL, UINT64_MAX };
    for (const uint64_t v : wide) {
        uint64_t back = 0;
        ASSERT_TRUE(PackLittleEndianHex(v, 8, m_out)) << v;
        EXPECT_EQ(m_out.size(), 16u);
        ASSERT_TRUE(UnpackLittleEndianHex(m_out, back));
        EXPECT_EQ(back, v);
    }
}

TEST_F(HexPatternTest, Unpack_RejectsMalformed) {
    uint64_t value = 7;
    EXPECT_FALSE(UnpackLittleEndianHex("", value));
    EXPECT_FALSE(UnpackLittleEndianHex("abc", value));
    EXPECT_FALSE(UnpackLittleEndianHex("0?", value));
    EXPECT_FALSE(UnpackLittleEndianHex(std::string(18, '0'), value));
    EXPECT_EQ(value, 7u);
}

// ============================================================================
// Consensus
// ============================================================================

TEST_F(HexPatternTest, Consensus_WildcardsDifferingNibbles) {
    ASSERT_TRUE(BuildValueConsensus({ 0x1000, 0x1004 }, 4, m_out));
    EXPECT_EQ(m_out, "0?100000");
    EXPECT_EQ(CountWildcards(m_out), 1u);
    EXPECT_FALSE(IsFullyWildcarded(m_out));
}

TEST_F(HexPatternTest, Consensus_SingleValueIsExact) {
    ASSERT_TRUE(BuildValueConsensus({ 0x400000 }, 4, m_out));
    EXPECT_EQ(m_out, "00004000");
}

TEST_F(HexPatternTest, Consensus_WildcardIsSticky) {
    ASSERT_TRUE(BuildConsensus({ "a?", "ab", "ab" }, m_out));
    EXPECT_EQ(m_out, "a?");
}

TEST_F(HexPatternTest, Consensus_OrderIndependent) {
    std::vector<uint64_t> values = { 0x1000, 0x1004, 0x1F00, 0x2000 };
    std::string expected;
    ASSERT_TRUE(BuildValueConsensus(values, 4, expected));
    EXPECT_EQ(expected, "0???0000");

    size_t orderings = 0;
    do {
        ASSERT_TRUE(BuildValueConsensus(values, 4, m_out));
        EXPECT_EQ(m_out, expected);
        ++orderings;
    } while (std::next_permutation(values.begin(), values.end()));
    EXPECT_EQ(orderings, 24u);
}

TEST_F(HexPatternTest, Consensus_AddingValueIsMonotone) {
    const std::vector<uint64_t> all = { 0x1000, 0x1004, 0x1F00, 0x2000, 0x1000 };
    std::string previous;
    for (size_t n = 1; n <= all.size(); ++n) {
        const std::vector<uint64_t> prefix(all.begin(), all.begin() + n);
        ASSERT_TRUE(BuildValueConsensus(prefix, 4, m_out));
        if (!previous.empty()) {
            ASSERT_EQ(m_out.size(), previous.size());
            for (size_t i = 0; i < previous.size(); ++i) {
                if (previous[i] == WILDCARD_NIBBLE) {
                    EXPECT_EQ(m_out[i], WILDCARD_NIBBLE) << "position " << i << " after " << n << " values";
                }
            }
            EXPECT_GE(CountWildcards(m_out), CountWildcards(previous));
        }
        previous = m_out;
    }
    EXPECT_EQ(previous, "0???0000");
}

TEST_F(HexPatternTest, Consensus_FullyWildcarded) {
    ASSERT_TRUE(BuildValueConsensus({ 0x11111111, 0x22222222 }, 4, m_out));
    EXPECT_TRUE(IsFullyWildcarded(m_out));
    EXPECT_EQ(CountWildcards(m_out), 8u);
}

TEST_F(HexPatternTest, Consensus_RejectsEmptyAndUnevenInput) {
    EXPECT_FALSE(BuildConsensus({}, m_out));
    EXPECT_FALSE(BuildConsensus({ "00", "0000" }, m_out));
    EXPECT_FALSE(BuildValueConsensus({ 0x1, 0x100000000ULL }, 4, m_out));
    EXPECT_FALSE(IsFullyWildcarded(""));
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(HexPatternTest, Yara_SpacesEveryByte) {
    EXPECT_EQ(ToYaraHexString("0?100000"), "0? 10 00 00");
    EXPECT_EQ(ToYaraHexString("4c01"), "4c 01");
    EXPECT_EQ(ToYaraHexString(""), "");
}
