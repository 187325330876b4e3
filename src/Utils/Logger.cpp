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
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <functional>
#include <system_error>

namespace ClusterSig {

	namespace Utils {

		const char* LogLevelToString(LogLevel lv) noexcept {
			switch (lv) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept {
			std::string lower(name);
			std::transform(lower.begin(), lower.end(), lower.begin(),
				[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

			if (lower == "trace") { out = LogLevel::Trace; return true; }
			if (lower == "debug") { out = LogLevel::Debug; return true; }
			if (lower == "info")  { out = LogLevel::Info;  return true; }
			if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
			if (lower == "error") { out = LogLevel::Error; return true; }
			if (lower == "fatal") { out = LogLevel::Fatal; return true; }
			return false;
		}

		Logger& Logger::Instance()
		{
			static Logger g_instance;
			g_instance.EnsureInitialized();
			return g_instance;
		}

		Logger::Logger() = default;

		Logger::~Logger()
		{
			ShutDown();
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			const LogLevel minLevel = m_minLevel.load(std::memory_order_acquire);
			return static_cast<int>(level) >= static_cast<int>(minLevel);
		}

		bool Logger::IsInitialized() const noexcept
		{
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::EnsureInitialized() {
			if (!IsInitialized()) {
				LoggerConfig def{};
				Initialize(def);
			}
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			bool expected = false;

			if (!m_initialized.compare_exchange_strong(expected, true)) {
				// Reconfiguration: restart the worker if the delivery mode changes
				bool wasAsync;
				{
					std::lock_guard<std::mutex> lk(m_cfgMutex);
					wasAsync = m_cfg.async;
				}
				if (wasAsync != cfg.async) {
					ShutDown();
					Initialize(cfg);
					return;
				}

				std::lock_guard<std::mutex> sinkLock(m_sinkMutex);
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				if (m_cfg.logDirectory != cfg.logDirectory || m_cfg.baseFileName != cfg.baseFileName ||
					!cfg.toFile) {
					CloseLogFile();
				}
				m_cfg = cfg;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				m_accepting.store(true, std::memory_order_release);
				return;
			}

			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				m_cfg = cfg;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			}

			m_stop.store(false, std::memory_order_release);

			// Start the worker before accepting messages
			if (cfg.async) {
				try {
					m_worker = std::thread([this]() { WorkerLoop(); });
				}
				catch (const std::system_error&) {
					std::lock_guard<std::mutex> lk(m_cfgMutex);
					m_cfg.async = false;
				}
			}

			m_accepting.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			bool expected = true;
			if (!m_initialized.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
				return;
			}

			m_accepting.store(false, std::memory_order_release);
			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			LogItem item;
			while (Dequeue(item)) {
				Dispatch(item);
			}

			std::lock_guard<std::mutex> sinkLock(m_sinkMutex);
			CloseLogFile();
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		void Logger::Enqueue(LogItem&& item) {
			if (!m_accepting.load(std::memory_order_acquire)) return;
			if (!IsEnabled(item.level)) return;

			bool async;
			size_t maxQueue;
			LoggerConfig::BackPressurePolicy policy;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				async = m_cfg.async;
				maxQueue = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			if (!async) {
				Dispatch(item);
				return;
			}

			std::unique_lock<std::mutex> lk(m_queueMutex);
			if (m_queue.size() >= maxQueue) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lk, [this, maxQueue]() {
						return m_stop.load(std::memory_order_acquire) || m_queue.size() < maxQueue;
					});
					if (m_stop.load(std::memory_order_acquire)) return;
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.emplace_back(std::move(item));
			m_queueCv.notify_one();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lk(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			m_spaceCv.notify_one();
			return true;
		}

		void Logger::Dispatch(const LogItem& item) {
			bool toConsole;
			bool toFile;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				toConsole = m_cfg.toConsole;
				toFile = m_cfg.toFile;
			}

			std::lock_guard<std::mutex> sinkLock(m_sinkMutex);
			if (toConsole) WriteConsole(item);
			if (toFile) WriteFile(item);
		}

		void Logger::WorkerLoop() {
			while (true) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lk(m_queueMutex);
					m_queueCv.wait_for(lk, std::chrono::seconds(1), [this]() {
						return m_stop.load(std::memory_order_acquire) || !m_queue.empty();
					});

					if (m_stop.load(std::memory_order_acquire) && m_queue.empty()) break;
					if (m_queue.empty()) continue;

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_one();

				// Sinks are written outside the queue lock
				Dispatch(item);
			}
		}

		void Logger::LogEx(LogLevel level,
			const char* category,
			const char* file,
			int line,
			const char* function,
			const char* format, ...) {

			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string msg = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, msg, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
			const char* category,
			const std::string& message,
			const char* file,
			int line,
			const char* function) {

			LogItem item{};
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();

			Enqueue(std::move(item));

			LogLevel flushLevel;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				flushLevel = m_cfg.flushLevel;
			}
			if (static_cast<int>(level) >= static_cast<int>(flushLevel))
				Flush();
		}

		void Logger::Flush()
		{
			bool async;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async) {
				auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
				while (std::chrono::steady_clock::now() < deadline) {
					{
						std::lock_guard<std::mutex> lk(m_queueMutex);
						if (m_queue.empty()) break;
					}
					m_queueCv.notify_all();
					std::this_thread::sleep_for(std::chrono::milliseconds(5));
				}
			}

			std::lock_guard<std::mutex> sinkLock(m_sinkMutex);
			std::fflush(stderr);
			if (m_file) std::fflush(m_file);
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return "";

			va_list argsCopy;
			va_copy(argsCopy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, argsCopy);
			va_end(argsCopy);

			if (needed < 0) {
				return "[Logger] formatting error";
			}
			// Cap at 1MB
			if (static_cast<size_t>(needed) > (1u << 20)) {
				return "[Logger] message too large";
			}

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			va_copy(argsCopy, args);
			std::vsnprintf(out.data(), out.size(), fmt, argsCopy);
			va_end(argsCopy);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point ts) {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ts);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(secs);

			std::tm tmUtc{};
			if (gmtime_r(&t, &tmUtc) == nullptr) {
				return "[Invalid timestamp]";
			}

			char buf[40] = { 0 };
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
				tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(millis));
			return std::string(buf);
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 16);

			for (char c : s)
			{
				switch (c)
				{
				case '\\': out += "\\\\"; break;
				case '"':  out += "\\\""; break;
				case '\b': out += "\\b";  break;
				case '\f': out += "\\f";  break;
				case '\n': out += "\\n";  break;
				case '\r': out += "\\r";  break;
				case '\t': out += "\\t";  break;
				default:
					if (static_cast<unsigned char>(c) < 0x20)
					{
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
						out += buf;
					}
					else
					{
						out += c;
					}
				}
			}
			return out;
		}

		std::string Logger::FormatPrefix(const LogItem& item) const {
			std::string s;
			s.reserve(128);
			s += FormatIso8601UTC(item.ts);
			s += " [";
			s += LogLevelToString(item.level);
			s += "]";

			if (!item.category.empty())
			{
				s += " [";
				s += item.category;
				s += "]";
			}

			if (m_cfg.includeThreadId)
			{
				s += " (";
				s += std::to_string(item.tid);
				s += ")";
			}

			if (m_cfg.includeSrcLocation && !item.file.empty())
			{
				s += " ";
				s += item.file;
				s += ":";
				s += std::to_string(item.line);

				if (!item.function.empty())
				{
					s += " ";
					s += item.function;
				}
			}

			s += " - ";
			return s;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string s;
			s.reserve(128 + item.message.size());
			s += "{\"ts\":\"";
			s += EscapeJson(FormatIso8601UTC(item.ts));
			s += "\",\"lvl\":\"";
			s += LogLevelToString(item.level);
			s += "\"";

			if (!item.category.empty())
			{
				s += ",\"cat\":\"";
				s += EscapeJson(item.category);
				s += "\"";
			}

			if (m_cfg.includeThreadId)
			{
				s += ",\"tid\":";
				s += std::to_string(item.tid);
			}

			if (m_cfg.includeSrcLocation && !item.file.empty())
			{
				s += ",\"file\":\"";
				s += EscapeJson(item.file);
				s += "\",\"line\":";
				s += std::to_string(item.line);

				if (!item.function.empty())
				{
					s += ",\"func\":\"";
					s += EscapeJson(item.function);
					s += "\"";
				}
			}

			s += ",\"msg\":\"";
			s += EscapeJson(item.message);
			s += "\"}";
			return s;
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::WriteConsole(const LogItem& item) {
			std::string line;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);
			}
			line += '\n';
			std::fwrite(line.data(), 1, line.size(), stderr);
		}

		std::string Logger::BaseLogPath() const
		{
			std::filesystem::path path(m_cfg.logDirectory);
			path /= m_cfg.baseFileName + ".log";
			return path.string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			std::string path;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				if (!m_cfg.logDirectory.empty()) {
					std::error_code ec;
					std::filesystem::create_directories(m_cfg.logDirectory, ec);
				}
				path = BaseLogPath();
			}

			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[Logger] Failed to open log file %s\n", path.c_str());
				return;
			}

			std::error_code ec;
			const auto size = std::filesystem::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::CloseLogFile() noexcept {
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			uint64_t maxBytes;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				maxBytes = m_cfg.maxFileSizeBytes;
			}
			if (!m_file) return;
			if (m_currentSize + nextWriteBytes <= maxBytes) return;

			PerformRotation();
			OpenLogFileIfNeeded();
		}

		void Logger::PerformRotation()
		{
			CloseLogFile();

			std::string base;
			size_t maxCount;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				base = BaseLogPath();
				maxCount = m_cfg.maxFileCount;
			}

			std::error_code ec;
			if (maxCount <= 1) {
				std::filesystem::remove(base, ec);
				return;
			}

			// base.log -> base.log.1 -> ... -> base.log.N (oldest dropped)
			std::filesystem::remove(base + "." + std::to_string(maxCount), ec);
			for (size_t idx = maxCount - 1; idx >= 1; --idx) {
				const std::string src = base + "." + std::to_string(idx);
				const std::string dst = base + "." + std::to_string(idx + 1);
				if (std::filesystem::exists(src, ec)) {
					std::filesystem::rename(src, dst, ec);
				}
				if (idx == 1) break;
			}
			std::filesystem::rename(base, base + ".1", ec);
		}

		void Logger::WriteFile(const LogItem& item)
		{
			OpenLogFileIfNeeded();
			if (!m_file) return;

			std::string line;
			LogLevel flushLevel;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);
				flushLevel = m_cfg.flushLevel;
			}
			line += '\n';

			RotateIfNeeded(line.size());
			if (!m_file) return;

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;

			if (static_cast<int>(item.level) >= static_cast<int>(flushLevel))
				std::fflush(m_file);
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
			const char* file,
			int line,
			const char* function,
			const char* messageOnEnter,
			LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level)
		{
			auto& lg = Logger::Instance();
			if (lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
					m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope()
		{
			auto& lg = Logger::Instance();
			if (!lg.IsEnabled(m_level)) return;

			const auto elapsedUs = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();

			char buf[96];
			std::snprintf(buf, sizeof(buf), "Leave (%.3f ms)", static_cast<double>(elapsedUs) / 1000.0);
			lg.LogMessage(m_level, m_category, buf, m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace ClusterSig
