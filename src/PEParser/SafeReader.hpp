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
#pragma once
/**
 * @file SafeReader.hpp
 * @brief Bounds-checked byte reader for header extraction.
 *
 * Every byte the parser looks at goes through this class:
 * - All reads bounds-checked before access
 * - Offset arithmetic checked for overflow
 * - Multi-byte integers decoded little-endian regardless of host order
 */

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <limits>
#include <type_traits>

namespace ClusterSig {
namespace PEParser {

/**
 * @brief Safe arithmetic operations with overflow detection.
 */
class SafeMath {
public:
    template<typename T>
    [[nodiscard]] static constexpr bool SafeAdd(T a, T b, T& result) noexcept {
        static_assert(std::is_unsigned_v<T>, "SafeAdd requires unsigned types");
        if (a > std::numeric_limits<T>::max() - b) {
            return false;
        }
        result = a + b;
        return true;
    }

    template<typename T>
    [[nodiscard]] static constexpr bool SafeMul(T a, T b, T& result) noexcept {
        static_assert(std::is_unsigned_v<T>, "SafeMul requires unsigned types");
        if (a != 0 && b > std::numeric_limits<T>::max() / a) {
            return false;
        }
        result = a * b;
        return true;
    }
};

/**
 * @brief Bounds-checked reader over an immutable byte buffer.
 *
 * Usage:
 * @code
 *   SafeReader reader(data, size);
 *   FileHeader fh;
 *   if (reader.Read(offset, fh)) {
 *       // Use fh safely
 *   }
 * @endcode
 */
class SafeReader {
public:
    SafeReader(const uint8_t* data, size_t size) noexcept
        : m_data(data)
        , m_size(data ? size : 0)
    {}

    SafeReader() noexcept : m_data(nullptr), m_size(0) {}

    SafeReader(const SafeReader&) = default;
    SafeReader& operator=(const SafeReader&) = default;

    // ========================================================================
    // Basic Properties
    // ========================================================================

    [[nodiscard]] size_t Size() const noexcept { return m_size; }

    [[nodiscard]] bool HasData() const noexcept { return m_size > 0; }

    // ========================================================================
    // Range Validation
    // ========================================================================

    /**
     * @brief Validate that [offset, offset+size) lies inside the buffer.
     */
    [[nodiscard]] bool ValidateRange(size_t offset, size_t size) const noexcept {
        size_t end;
        if (!SafeMath::SafeAdd(offset, size, end)) {
            return false;
        }
        return end <= m_size;
    }

    // ========================================================================
    // Reading Primitives
    // ========================================================================

    /**
     * @brief Copy a packed structure out of the buffer.
     * @tparam T Trivially copyable on-disk structure.
     */
    template<typename T>
    [[nodiscard]] bool Read(size_t offset, T& out) const noexcept {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

        if (!ValidateRange(offset, sizeof(T))) {
            return false;
        }

        std::memcpy(&out, m_data + offset, sizeof(T));
        return true;
    }

    [[nodiscard]] bool ReadU16LE(size_t offset, uint16_t& out) const noexcept {
        uint64_t v = 0;
        if (!ReadLittleEndian(offset, 2, v)) return false;
        out = static_cast<uint16_t>(v);
        return true;
    }

    [[nodiscard]] bool ReadU32LE(size_t offset, uint32_t& out) const noexcept {
        uint64_t v = 0;
        if (!ReadLittleEndian(offset, 4, v)) return false;
        out = static_cast<uint32_t>(v);
        return true;
    }

    [[nodiscard]] bool ReadBytes(size_t offset, void* dest, size_t count) const noexcept {
        if (!dest || !ValidateRange(offset, count)) {
            return false;
        }
        std::memcpy(dest, m_data + offset, count);
        return true;
    }

    // ========================================================================
    // String Reading
    // ========================================================================

    /**
     * @brief Read a fixed-length string, trimmed at the first NUL.
     */
    [[nodiscard]] bool ReadFixedString(size_t offset, size_t length,
                                       std::string& out) const noexcept {
        if (!ValidateRange(offset, length)) {
            return false;
        }
        try {
            const char* start = reinterpret_cast<const char*>(m_data + offset);
            const char* nullPos = static_cast<const char*>(std::memchr(start, '\0', length));
            out.assign(start, nullPos ? static_cast<size_t>(nullPos - start) : length);
            return true;
        }
        catch (const std::bad_alloc&) {
            return false;
        }
    }

    /**
     * @brief Read a length-prefixed UTF-16LE string and convert it to UTF-8.
     *
     * Layout is a 16-bit character count followed by that many UTF-16 code
     * units, as used for resource directory names. Unpaired surrogates are
     * replaced with U+FFFD.
     *
     * @param maxChars Longer strings are rejected
     */
    [[nodiscard]] bool ReadLengthPrefixedUtf16(size_t offset, size_t maxChars,
                                               std::string& out) const noexcept {
        uint16_t count = 0;
        if (!ReadU16LE(offset, count) || count > maxChars) {
            return false;
        }
        size_t bytes = 0;
        size_t start = 0;
        if (!SafeMath::SafeMul(static_cast<size_t>(count), size_t{2}, bytes) ||
            !SafeMath::SafeAdd(offset, size_t{2}, start) ||
            !ValidateRange(start, bytes)) {
            return false;
        }

        try {
            out.clear();
            out.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                uint32_t cp = LoadU16(start + i * 2);
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < count) {
                    const uint32_t lo = LoadU16(start + (i + 1) * 2);
                    if (lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        ++i;
                    }
                    else {
                        cp = 0xFFFD;
                    }
                }
                else if (cp >= 0xD800 && cp <= 0xDFFF) {
                    cp = 0xFFFD;
                }
                AppendUtf8(out, cp);
            }
            return true;
        }
        catch (const std::bad_alloc&) {
            out.clear();
            return false;
        }
    }

private:
    [[nodiscard]] bool ReadLittleEndian(size_t offset, size_t width, uint64_t& out) const noexcept {
        if (!ValidateRange(offset, width)) {
            return false;
        }
        uint64_t v = 0;
        for (size_t i = 0; i < width; ++i) {
            v |= static_cast<uint64_t>(m_data[offset + i]) << (8 * i);
        }
        out = v;
        return true;
    }

    // Caller has validated the range
    [[nodiscard]] uint32_t LoadU16(size_t offset) const noexcept {
        return static_cast<uint32_t>(m_data[offset]) |
               (static_cast<uint32_t>(m_data[offset + 1]) << 8);
    }

    static void AppendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    const uint8_t* m_data;  ///< Pointer to data buffer
    size_t m_size;          ///< Size of data buffer
};

} // namespace PEParser
} // namespace ClusterSig
