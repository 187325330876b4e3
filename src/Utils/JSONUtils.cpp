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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"

#include <algorithm>

namespace ClusterSig {
	namespace Utils {
		namespace JSON {

			namespace {

				void FillPosition(std::string_view text, size_t byteOffset, Error* err) noexcept {
					if (!err) return;
					err->byteOffset = byteOffset;
					size_t line = 1;
					size_t column = 1;
					const size_t limit = (byteOffset == 0) ? 0 : std::min(byteOffset - 1, text.size());
					for (size_t i = 0; i < limit; ++i) {
						if (text[i] == '\n') {
							++line;
							column = 1;
						}
						else {
							++column;
						}
					}
					err->line = line;
					err->column = column;
				}

				std::string EscapePointerToken(std::string_view token) {
					std::string out;
					out.reserve(token.size());
					for (char c : token) {
						if (c == '~') out += "~0";
						else if (c == '/') out += "~1";
						else out += c;
					}
					return out;
				}

			}  // namespace

			// ============================================================================
			// Text Parsing
			// ============================================================================

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				out = Json();
				if (err) err->clear();

				bool tooDeep = false;
				const size_t maxDepth = opt.maxDepth;
				Json::parser_callback_t depthGuard =
					[&tooDeep, maxDepth](int depth, Json::parse_event_t /*event*/, Json& /*parsed*/) {
						if (depth >= 0 && static_cast<size_t>(depth) > maxDepth) {
							tooDeep = true;
						}
						return true;
					};

				try {
					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), depthGuard,
						/*allow_exceptions*/ true, /*ignore_comments*/ opt.allowComments);
					if (tooDeep) {
						if (err) err->message = "JSON nesting depth exceeds limit";
						return false;
					}
					out = std::move(parsed);
					return true;
				}
				catch (const nlohmann::json::parse_error& e) {
					if (err) {
						err->message = e.what();
						FillPosition(jsonText, e.byte, err);
					}
				}
				catch (const nlohmann::json::exception& e) {
					if (err) err->message = e.what();
				}
				catch (const std::bad_alloc&) {
					if (err) err->message = "Out of memory while parsing JSON";
				}
				return false;
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					const int indent = opt.pretty ? opt.indentSpaces : -1;
					out = j.dump(indent, ' ', opt.ensureAscii, Json::error_handler_t::replace);
					return true;
				}
				catch (const nlohmann::json::exception&) {
					out.clear();
					return false;
				}
				catch (const std::bad_alloc&) {
					out.clear();
					return false;
				}
			}

			// ============================================================================
			// File I/O
			// ============================================================================

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				out = Json();
				if (err) err->clear();

				std::string text;
				FileUtils::Error fileErr;
				if (!FileUtils::ReadAllText(path, text, &fileErr, maxBytes)) {
					if (err) {
						err->message = fileErr.message;
						err->path = path;
					}
					return false;
				}

				// UTF-8 BOM
				std::string_view view(text);
				if (view.size() >= 3 &&
					static_cast<unsigned char>(view[0]) == 0xEF &&
					static_cast<unsigned char>(view[1]) == 0xBB &&
					static_cast<unsigned char>(view[2]) == 0xBF) {
					view.remove_prefix(3);
				}

				if (!Parse(view, out, err, opt)) {
					if (err) err->path = path;
					return false;
				}
				return true;
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err,
			                const SaveOptions& opt) noexcept {
				if (err) err->clear();

				std::string text;
				if (!Stringify(j, text, opt)) {
					if (err) {
						err->message = "Failed to serialize JSON";
						err->path = path;
					}
					return false;
				}
				text.push_back('\n');

				FileUtils::Error fileErr;
				const bool ok = opt.atomicReplace
					? FileUtils::WriteAllTextAtomic(path, text, &fileErr)
					: FileUtils::WriteAllText(path, text, &fileErr);
				if (!ok) {
					if (err) {
						err->message = fileErr.message;
						err->path = path;
					}
					return false;
				}
				return true;
			}

			// ============================================================================
			// Path Helpers
			// ============================================================================

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty() || pathLike == "/") {
						return "/";
					}
					if (pathLike.front() == '/') {
						return std::string(pathLike);
					}

					std::string out;
					std::string token;
					auto flush = [&]() {
						if (!token.empty()) {
							out += '/';
							out += EscapePointerToken(token);
							token.clear();
						}
					};

					for (char c : pathLike) {
						if (c == '.' || c == '[') {
							flush();
						}
						else if (c == ']') {
							flush();
						}
						else {
							token.push_back(c);
						}
					}
					flush();
					return out.empty() ? std::string("/") : out;
				}
				catch (const std::bad_alloc&) {
					return "/";
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

			bool RequireKeys(const Json& j, std::string_view objectPathLike,
			                 const std::vector<std::string>& requiredKeys, Error* err) noexcept {
				try {
					const auto jp = ToJsonPointer(objectPathLike);
					const Json* obj = &j;
					if (jp != "/") {
						const nlohmann::json::json_pointer ptr(jp);
						if (!j.contains(ptr)) {
							if (err) err->message = "Missing object at path: " + jp;
							return false;
						}
						obj = &j.at(ptr);
					}

					if (!obj->is_object()) {
						if (err) err->message = "Value at path is not an object: " + jp;
						return false;
					}

					for (const auto& key : requiredKeys) {
						if (!obj->contains(key)) {
							if (err) err->message = "Missing required key: " + key;
							return false;
						}
					}
					return true;
				}
				catch (const nlohmann::json::exception& e) {
					if (err) err->message = e.what();
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace ClusterSig
