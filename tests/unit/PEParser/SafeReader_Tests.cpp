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
 * @file SafeReader_Tests.cpp
 * @brief Bounds checking, little-endian decoding and overflow guards.
 */

#include <gtest/gtest.h>
#include "../../../src/PEParser/SafeReader.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace ClusterSig::PEParser;

// ============================================================================
// Test Fixture
// ============================================================================

class SafeReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_data = { 0x4D, 0x5A, 0x90, 0x00, 0x78, 0x56, 0x34, 0x12,
                   0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 };
    }

    void TearDown() override {
        m_data.clear();
    }

    SafeReader Reader() const { return SafeReader(m_data.data(), m_data.size()); }

    std::vector<uint8_t> m_data;
};

// ============================================================================
// SafeMath
// ============================================================================

TEST_F(SafeReaderTest, SafeMath_AddDetectsOverflow) {
    size_t out = 0;
    EXPECT_TRUE(SafeMath::SafeAdd<size_t>(1, 2, out));
    EXPECT_EQ(out, 3u);
    EXPECT_FALSE(SafeMath::SafeAdd<size_t>(std::numeric_limits<size_t>::max(), 1, out));
}

TEST_F(SafeReaderTest, SafeMath_MulDetectsOverflow) {
    uint32_t out = 0;
    EXPECT_TRUE(SafeMath::SafeMul<uint32_t>(0x10000, 0xFFFF, out));
    EXPECT_FALSE(SafeMath::SafeMul<uint32_t>(0x10000, 0x10000, out));
}

// ============================================================================
// Reads
// ============================================================================

TEST_F(SafeReaderTest, Read_LittleEndianIntegers) {
    const SafeReader reader = Reader();
    uint16_t u16 = 0;
    uint32_t u32 = 0;
    uint8_t tail[8] = {};

    ASSERT_TRUE(reader.ReadU16LE(0, u16));
    EXPECT_EQ(u16, 0x5A4Du);
    ASSERT_TRUE(reader.ReadU32LE(4, u32));
    EXPECT_EQ(u32, 0x12345678u);
    ASSERT_TRUE(reader.ReadBytes(8, tail, sizeof(tail)));
    EXPECT_EQ(tail[0], 0x01);
    EXPECT_EQ(tail[7], 0x08);
}

TEST_F(SafeReaderTest, Read_RejectsOutOfRange) {
    const SafeReader reader = Reader();
    uint32_t u32 = 0xDEADBEEF;
    EXPECT_FALSE(reader.ReadU32LE(13, u32));
    EXPECT_EQ(u32, 0xDEADBEEFu);
    EXPECT_FALSE(reader.ValidateRange(std::numeric_limits<size_t>::max(), 2));
    EXPECT_TRUE(reader.ValidateRange(16, 0));
    EXPECT_FALSE(reader.ValidateRange(17, 0));
}

TEST_F(SafeReaderTest, Read_NullBufferHasNoData) {
    const SafeReader reader(nullptr, 100);
    EXPECT_FALSE(reader.HasData());
    EXPECT_EQ(reader.Size(), 0u);
    uint16_t v = 0;
    EXPECT_FALSE(reader.ReadU16LE(0, v));
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(SafeReaderTest, FixedString_StopsAtNul) {
    const std::vector<uint8_t> bytes = { '.', 't', 'e', 'x', 't', 0, 0, 0 };
    const SafeReader reader(bytes.data(), bytes.size());
    std::string name;
    ASSERT_TRUE(reader.ReadFixedString(0, 8, name));
    EXPECT_EQ(name, ".text");
}

TEST_F(SafeReaderTest, FixedString_FullWidthWithoutNul) {
    const std::vector<uint8_t> bytes = { 'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H' };
    const SafeReader reader(bytes.data(), bytes.size());
    std::string name;
    ASSERT_TRUE(reader.ReadFixedString(0, 8, name));
    EXPECT_EQ(name, "ABCDEFGH");
}

TEST_F(SafeReaderTest, Utf16_DecodesLengthPrefixedName) {
    // "Hi" followed by U+00E9
    const std::vector<uint8_t> bytes = { 3, 0, 'H', 0, 'i', 0, 0xE9, 0x00 };
    const SafeReader reader(bytes.data(), bytes.size());
    std::string text;
    ASSERT_TRUE(reader.ReadLengthPrefixedUtf16(0, 16, text));
    EXPECT_EQ(text, "Hi\xC3\xA9");
}

TEST_F(SafeReaderTest, Utf16_RejectsOverlongAndTruncated) {
    const std::vector<uint8_t> bytes = { 5, 0, 'a', 0, 'b', 0 };
    const SafeReader reader(bytes.data(), bytes.size());
    std::string text;
    EXPECT_FALSE(reader.ReadLengthPrefixedUtf16(0, 16, text));
    EXPECT_FALSE(reader.ReadLengthPrefixedUtf16(0, 4, text));
}

TEST_F(SafeReaderTest, Utf16_UnpairedSurrogateBecomesReplacement) {
    const std::vector<uint8_t> bytes = { 1, 0, 0x00, 0xD8 };
    const SafeReader reader(bytes.data(), bytes.size());
    std::string text;
    ASSERT_TRUE(reader.ReadLengthPrefixedUtf16(0, 4, text));
    EXPECT_EQ(text, "\xEF\xBF\xBD");
}
