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
#include "MemoryUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ClusterSig {
	namespace Utils {
		namespace MemoryUtils {

			bool MappedView::mapReadOnly(const std::filesystem::path& path, std::string* errorOut) noexcept {
				close();

				auto fail = [&](const char* what) {
					const int code = errno;
					if (errorOut) {
						*errorOut = std::string(what) + ": " + std::strerror(code);
					}
					CS_LOG_DEBUG("MemoryUtils", "%s for %s: %s", what, path.c_str(), std::strerror(code));
					close();
					return false;
				};

				m_fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
				if (m_fd < 0) {
					return fail("open failed");
				}

				struct stat st {};
				if (::fstat(m_fd, &st) != 0) {
					return fail("fstat failed");
				}
				if (!S_ISREG(st.st_mode)) {
					errno = EINVAL;
					return fail("not a regular file");
				}

				m_size = static_cast<size_t>(st.st_size);
				if (m_size == 0) {
					// Empty file: valid, no view
					return true;
				}

				void* view = ::mmap(nullptr, m_size, PROT_READ, MAP_PRIVATE, m_fd, 0);
				if (view == MAP_FAILED) {
					m_size = 0;
					return fail("mmap failed");
				}
				m_view = view;
				return true;
			}

			void MappedView::close() noexcept {
				if (m_view != nullptr) {
					::munmap(m_view, m_size);
					m_view = nullptr;
				}
				if (m_fd >= 0) {
					::close(m_fd);
					m_fd = -1;
				}
				m_size = 0;
			}

			void MappedView::moveFrom(MappedView&& other) noexcept {
				m_fd = other.m_fd;
				m_view = other.m_view;
				m_size = other.m_size;

				other.m_fd = -1;
				other.m_view = nullptr;
				other.m_size = 0;
			}

		}//namespace MemoryUtils
	}//namespace Utils
}//namespace ClusterSig
