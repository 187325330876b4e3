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
 * @file FileUtils.hpp
 * @brief File system helpers: whole-file text I/O, atomic writes, directory walking.
 *
 * All functions are noexcept; failures are reported through the optional
 * Error out-parameter (errno value plus a readable message).
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ClusterSig {

	namespace Utils {

		namespace FileUtils {

			/// Maximum file size for whole-file reads (1GB default)
			inline constexpr uint64_t MAX_READ_FILE_SIZE = 1ULL * 1024 * 1024 * 1024;

			/**
			 * @brief Error information for file operations.
			 */
			struct Error {
				int errnoValue = 0;         ///< errno / std::error_code value
				std::string message;        ///< Human-readable error description

				[[nodiscard]] bool hasError() const noexcept { return !message.empty(); }

				void clear() noexcept { errnoValue = 0; message.clear(); }
			};

			// ============================================================================
			// Queries
			// ============================================================================

			[[nodiscard]] bool Exists(const std::filesystem::path& path, Error* err = nullptr) noexcept;

			[[nodiscard]] bool IsDirectory(const std::filesystem::path& path, Error* err = nullptr) noexcept;

			// ============================================================================
			// Read / Write
			// ============================================================================

			/**
			 * @brief Read a whole file into a string.
			 * @param maxBytes Files larger than this are rejected
			 */
			[[nodiscard]] bool ReadAllText(const std::filesystem::path& path, std::string& out,
			                               Error* err = nullptr,
			                               uint64_t maxBytes = MAX_READ_FILE_SIZE) noexcept;

			/**
			 * @brief Write text, truncating any existing file.
			 */
			[[nodiscard]] bool WriteAllText(const std::filesystem::path& path, std::string_view text,
			                                Error* err = nullptr) noexcept;

			/**
			 * @brief Write text to a sibling temp file, then rename over the target.
			 *
			 * Readers never observe a partially written file. Parent directories
			 * are created as needed.
			 */
			[[nodiscard]] bool WriteAllTextAtomic(const std::filesystem::path& path, std::string_view text,
			                                      Error* err = nullptr) noexcept;

			[[nodiscard]] bool CreateDirectories(const std::filesystem::path& dir, Error* err = nullptr) noexcept;

			// ============================================================================
			// Directory Listing
			// ============================================================================

			/**
			 * @brief Collect the regular files directly inside a directory, sorted by path.
			 */
			[[nodiscard]] bool ListRegularFiles(const std::filesystem::path& dir,
			                                    std::vector<std::filesystem::path>& out,
			                                    Error* err = nullptr) noexcept;

		}//namespace FileUtils
	}//namespace Utils
}//namespace ClusterSig
