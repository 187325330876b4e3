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
#include "FileUtils.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>

#include <unistd.h>

namespace ClusterSig {
	namespace Utils {
		namespace FileUtils {

			namespace {

				void SetError(Error* err, int code, const std::string& what, const std::filesystem::path& path) {
					if (!err) return;
					err->errnoValue = code;
					err->message = what + ": " + path.string();
					if (code != 0) {
						err->message += " (";
						err->message += std::strerror(code);
						err->message += ")";
					}
				}

				void SetError(Error* err, const std::error_code& ec, const std::string& what,
				              const std::filesystem::path& path) {
					if (!err) return;
					err->errnoValue = ec.value();
					err->message = what + ": " + path.string() + " (" + ec.message() + ")";
				}

				// RAII for stdio handles
				struct FileCloser {
					void operator()(std::FILE* f) const noexcept {
						if (f) std::fclose(f);
					}
				};
				using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

				bool WriteAndSync(const std::filesystem::path& path, std::string_view text, Error* err) {
					FilePtr f(std::fopen(path.c_str(), "wb"));
					if (!f) {
						SetError(err, errno, "Failed to open file for writing", path);
						return false;
					}
					if (!text.empty() && std::fwrite(text.data(), 1, text.size(), f.get()) != text.size()) {
						SetError(err, errno, "Short write", path);
						return false;
					}
					if (std::fflush(f.get()) != 0) {
						SetError(err, errno, "Failed to flush file", path);
						return false;
					}
					::fsync(::fileno(f.get()));
					return true;
				}

			}  // namespace

			// ============================================================================
			// Queries
			// ============================================================================

			bool Exists(const std::filesystem::path& path, Error* err) noexcept {
				std::error_code ec;
				const bool exists = std::filesystem::exists(path, ec);
				if (ec) {
					SetError(err, ec, "Failed to query path", path);
					return false;
				}
				return exists;
			}

			bool IsDirectory(const std::filesystem::path& path, Error* err) noexcept {
				std::error_code ec;
				const bool isDir = std::filesystem::is_directory(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetError(err, ec, "Failed to query path", path);
					return false;
				}
				return isDir;
			}

			// ============================================================================
			// Read / Write
			// ============================================================================

			bool ReadAllText(const std::filesystem::path& path, std::string& out, Error* err,
			                 uint64_t maxBytes) noexcept {
				out.clear();
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						SetError(err, ec, "Failed to stat file", path);
						return false;
					}
					if (size > maxBytes) {
						SetError(err, EFBIG, "File exceeds size limit", path);
						return false;
					}

					FilePtr f(std::fopen(path.c_str(), "rb"));
					if (!f) {
						SetError(err, errno, "Failed to open file", path);
						return false;
					}

					out.resize(static_cast<size_t>(size));
					const size_t read = out.empty() ? 0 : std::fread(out.data(), 1, out.size(), f.get());
					if (read != out.size()) {
						SetError(err, errno, "Short read", path);
						out.clear();
						return false;
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					SetError(err, ENOMEM, "Out of memory reading file", path);
					out.clear();
					return false;
				}
			}

			bool WriteAllText(const std::filesystem::path& path, std::string_view text, Error* err) noexcept {
				try {
					if (path.has_parent_path() && !CreateDirectories(path.parent_path(), err)) {
						return false;
					}
					return WriteAndSync(path, text, err);
				}
				catch (const std::bad_alloc&) {
					SetError(err, ENOMEM, "Out of memory writing file", path);
					return false;
				}
			}

			bool WriteAllTextAtomic(const std::filesystem::path& path, std::string_view text, Error* err) noexcept {
				try {
					if (path.has_parent_path() && !CreateDirectories(path.parent_path(), err)) {
						return false;
					}

					std::filesystem::path tmp = path;
					tmp += ".tmp." + std::to_string(::getpid());

					if (!WriteAndSync(tmp, text, err)) {
						std::error_code ignored;
						std::filesystem::remove(tmp, ignored);
						return false;
					}

					std::error_code ec;
					std::filesystem::rename(tmp, path, ec);
					if (ec) {
						SetError(err, ec, "Failed to replace file", path);
						std::error_code ignored;
						std::filesystem::remove(tmp, ignored);
						return false;
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					SetError(err, ENOMEM, "Out of memory writing file", path);
					return false;
				}
			}

			bool CreateDirectories(const std::filesystem::path& dir, Error* err) noexcept {
				if (dir.empty()) return true;
				std::error_code ec;
				std::filesystem::create_directories(dir, ec);
				if (ec) {
					SetError(err, ec, "Failed to create directory", dir);
					return false;
				}
				return true;
			}

			// ============================================================================
			// Directory Listing
			// ============================================================================

			bool ListRegularFiles(const std::filesystem::path& dir,
			                      std::vector<std::filesystem::path>& out, Error* err) noexcept {
				out.clear();
				try {
					std::error_code ec;
					if (!std::filesystem::is_directory(dir, ec)) {
						SetError(err, ec ? ec.value() : ENOTDIR, "Not a directory", dir);
						return false;
					}

					std::filesystem::directory_iterator it(dir,
						std::filesystem::directory_options::skip_permission_denied, ec);
					if (ec) {
						SetError(err, ec, "Failed to open directory", dir);
						return false;
					}

					for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
						if (ec) {
							CS_LOG_WARN("FileUtils", "Directory iteration error under %s: %s",
								dir.c_str(), ec.message().c_str());
							ec.clear();
							continue;
						}

						// Sockets, FIFOs, devices, subdirectories and dangling links are skipped
						std::error_code stEc;
						if (!it->is_regular_file(stEc) || stEc) {
							continue;
						}
						out.push_back(it->path());
					}

					std::sort(out.begin(), out.end());
					return true;
				}
				catch (const std::filesystem::filesystem_error& e) {
					SetError(err, e.code(), "Directory listing failed", dir);
					out.clear();
					return false;
				}
				catch (const std::bad_alloc&) {
					SetError(err, ENOMEM, "Out of memory listing directory", dir);
					out.clear();
					return false;
				}
			}

		}//namespace FileUtils
	}//namespace Utils
}//namespace ClusterSig
