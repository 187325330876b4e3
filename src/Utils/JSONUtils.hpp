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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and file utilities for ClusterSig.
 *
 * Provides:
 * - Safe parsing with depth limits
 * - File I/O with size limits and atomic write support
 * - JSON Pointer and dot/bracket path navigation with typed getters
 *
 * Implementation uses nlohmann/json with hardened wrappers.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ClusterSig {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			// ============================================================================
			// Limits
			// ============================================================================

			/// Maximum nesting depth accepted by Parse
			inline constexpr size_t MAX_JSON_DEPTH = 1000;

			/// Default file size limit for LoadFromFile (256MB, feature tables can be large)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 256ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			// ============================================================================
			// Options
			// ============================================================================

			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing
				int indentSpaces = 2;              ///< Spaces per indent level
				bool ensureAscii = false;          ///< Escape non-ASCII characters
			};

			struct SaveOptions : StringifyOptions {
				bool atomicReplace = true;         ///< Write to a temp file and rename
			};

			// ============================================================================
			// Text Parsing
			// ============================================================================

			/**
			 * @brief Parse JSON text into a Json object.
			 *
			 * @param jsonText Input JSON text
			 * @param out Output Json object (cleared on failure)
			 * @param err Optional error output
			 * @param opt Parse options
			 * @return true on success
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Serialize Json object to string.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			// ============================================================================
			// File I/O
			// ============================================================================

			/**
			 * @brief Load JSON from file.
			 *
			 * Reads and parses a JSON file with size and depth limits.
			 * Strips a UTF-8 BOM if present.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Save JSON to file.
			 *
			 * Creates parent directories if they don't exist.
			 */
			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr, const SaveOptions& opt = {}) noexcept;

			// ============================================================================
			// Path Helpers
			// ============================================================================

			/**
			 * @brief Convert path-like string to JSON Pointer.
			 *
			 * Accepts either JSON Pointer ("/a/b/0") or dot/bracket notation ("a.b[0].c").
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			/**
			 * @brief Check if a path exists in a Json object.
			 */
			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			// ============================================================================
			// Typed Getters
			// ============================================================================

			/**
			 * @brief Get typed value from Json using path.
			 *
			 * @return true if path exists and conversion succeeded; out is unchanged otherwise
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const nlohmann::json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

			/**
			 * @brief Get typed value or return default.
			 */
			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

			/**
			 * @brief Validate that required keys exist in an object.
			 *
			 * @param objectPathLike Path to the object ("/" for root)
			 */
			[[nodiscard]] bool RequireKeys(const Json& j, std::string_view objectPathLike,
			                               const std::vector<std::string>& requiredKeys,
			                               Error* err = nullptr) noexcept;

		}  // namespace JSON
	}  // namespace Utils
}  // namespace ClusterSig
