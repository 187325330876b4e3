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
 * @file Logger.hpp
 * @brief Thread-safe logging facility for ClusterSig.
 *
 * Provides:
 * - Synchronous or asynchronous delivery with configurable back-pressure
 * - Console (stderr) and rotating file sinks
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 *
 * @note Thread-safe for all public methods.
 * @warning Call Initialize() before logging, otherwise the logger
 *          auto-initializes with console-only defaults.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace ClusterSig {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/**
		 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal").
		 * @param name Level name, case-insensitive
		 * @param out Parsed level
		 * @return true if the name is recognized
		 */
		[[nodiscard]] bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept;

		/**
		 * @brief Upper-case level tag used in formatted output.
		 */
		[[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = false;             ///< Deliver on a background worker
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = false;///< Include source file/line/function
			bool includeThreadId = false;   ///< Include thread id

			std::string logDirectory = "logs";            ///< Log file directory
			std::string baseFileName = "clustersig";      ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 5;                      ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;       ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;        ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with optional async delivery.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   CS_LOG_INFO("Pipeline", "Parsed %zu files", count);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 */
		class Logger {
		public:
			/**
			 * @brief Get the singleton Logger instance.
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize (or reconfigure) the logger.
			 * @param cfg Logger configuration
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Stop the worker, drain pending messages and close the file sink.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			/**
			 * @brief Flush pending messages and the file sink.
			 */
			void Flush();

			/**
			 * @brief Format a message with va_list.
			 */
			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void EnsureInitialized();
			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void Dispatch(const LogItem& item);

			void WriteConsole(const LogItem& item);
			void WriteFile(const LogItem& item);

			[[nodiscard]] std::string FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);
			[[nodiscard]] static std::string FormatIso8601UTC(std::chrono::system_clock::time_point ts);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			void CloseLogFile() noexcept;
			[[nodiscard]] std::string BaseLogPath() const;

			// ========================================================================
			// Member Variables
			// ========================================================================

			std::atomic<bool> m_accepting{ false };
			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			/// Serializes writes to the sinks
			std::mutex m_sinkMutex;

			std::deque<LogItem> m_queue;
			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };

			std::FILE* m_file = nullptr;
			uint64_t m_currentSize = 0;
		};

	}  // namespace Utils
}  // namespace ClusterSig

// ============================================================================
// LOGGING MACROS
// ============================================================================
//
// Usage:
//   CS_LOG_INFO("Category", "Message with %d format", value);
//   CS_LOG_SCOPE("Category");  // Logs entry/exit with timing
//
// ============================================================================

#define CS_LOG_AT(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::ClusterSig::Utils::Logger::Instance(); \
        if (_lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while (0)

/// @brief Log at TRACE level
#define CS_LOG_TRACE(category, fmt, ...) CS_LOG_AT(::ClusterSig::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)
/// @brief Log at DEBUG level
#define CS_LOG_DEBUG(category, fmt, ...) CS_LOG_AT(::ClusterSig::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)
/// @brief Log at INFO level
#define CS_LOG_INFO(category, fmt, ...)  CS_LOG_AT(::ClusterSig::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)
/// @brief Log at WARN level
#define CS_LOG_WARN(category, fmt, ...)  CS_LOG_AT(::ClusterSig::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)
/// @brief Log at ERROR level
#define CS_LOG_ERROR(category, fmt, ...) CS_LOG_AT(::ClusterSig::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)
/// @brief Log at FATAL level
#define CS_LOG_FATAL(category, fmt, ...) CS_LOG_AT(::ClusterSig::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define CS_LOG_CONCAT_INNER(a, b) a##b
#define CS_LOG_CONCAT(a, b) CS_LOG_CONCAT_INNER(a, b)

/// @brief RAII scope logger - logs entry and exit with timing
#define CS_LOG_SCOPE(category) \
    ::ClusterSig::Utils::Logger::Scope CS_LOG_CONCAT(_cs_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
