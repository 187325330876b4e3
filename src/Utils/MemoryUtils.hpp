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
 * @file MemoryUtils.hpp
 * @brief Memory-mapped file I/O with RAII semantics.
 *
 * POSIX implementation (open/fstat/mmap). Only read-only mappings are
 * needed: executables are inspected, never modified.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ClusterSig {

	namespace Utils {

		namespace MemoryUtils {

			// ============================================================================
			// Memory-Mapped File View
			// ============================================================================

			/**
			 * @brief RAII wrapper for a read-only memory-mapped file.
			 *
			 * Automatically unmaps and closes the descriptor on destruction.
			 */
			class MappedView {
			public:
				MappedView() = default;
				~MappedView() { close(); }

				// Non-copyable, movable
				MappedView(const MappedView&) = delete;
				MappedView& operator=(const MappedView&) = delete;
				MappedView(MappedView&& other) noexcept { moveFrom(std::move(other)); }
				MappedView& operator=(MappedView&& other) noexcept {
					if (this != &other) {
						close();
						moveFrom(std::move(other));
					}
					return *this;
				}

				/**
				 * @brief Map a file for read-only access.
				 * @param path File path.
				 * @param errorOut Optional reason on failure.
				 * @return true on success (including an empty file, which has no view).
				 */
				bool mapReadOnly(const std::filesystem::path& path, std::string* errorOut = nullptr) noexcept;

				/**
				 * @brief Close the mapping and release resources.
				 */
				void close() noexcept;

				[[nodiscard]] const uint8_t* data() const noexcept { return static_cast<const uint8_t*>(m_view); }

				[[nodiscard]] size_t size() const noexcept { return m_size; }

				/**
				 * @brief Check if mapping is valid.
				 *
				 * @note A valid mapping has no view when the file is empty (0 bytes).
				 */
				[[nodiscard]] bool valid() const noexcept {
					if (m_fd < 0) {
						return false;
					}
					return (m_view != nullptr) || (m_size == 0);
				}

				[[nodiscard]] bool hasData() const noexcept {
					return (m_view != nullptr) && (m_size > 0);
				}

			private:
				void moveFrom(MappedView&& other) noexcept;

				int m_fd = -1;
				void* m_view = nullptr;
				size_t m_size = 0;
			};

		}//namespace MemoryUtils
	}//namespace Utils
}//namespace ClusterSig
