#pragma once

#include <cstdarg>
#include <functional>
#include <string>

namespace X32Sync
{
	/**
	 * @brief Log levels
	 */
	enum class LogLevel
	{
		Error = 0,	 // Critical errors (always logged)
		Warning = 1, // Warnings (always logged)
		Info = 2,	 // Informational messages (logged if verbose)
		Debug = 3	 // Debug messages (logged if debug enabled)
	};

	using LogCallback = std::function<void(LogLevel, const std::string &)>;

	/**
	 * @brief Initialize the logging system
	 *
	 * @param filename Path to log file (empty for stderr only)
	 * @param verbose Whether to log Info-level messages
	 * @param debug Whether to log Debug-level messages
	 * @return true on success, false if the log file could not be opened
	 */
	bool logInit(const std::string &filename, bool verbose, bool debug = false);

	/**
	 * @brief Close the log file and drop the callback
	 */
	void logCleanup();

	/**
	 * @brief Set the maximum level to log
	 */
	void logSetLevel(LogLevel level);

	LogLevel logGetLevel();

	/**
	 * @brief Install a callback receiving every emitted line (nullptr to remove)
	 */
	void logSetCallback(LogCallback callback);

	/**
	 * @brief Log a message
	 *
	 * @param level The log level
	 * @param fmt Printf-style format string
	 * @param ... Format arguments
	 */
	void logMessage(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__)
		__attribute__((format(printf, 2, 3)))
#endif
		;

	void logMessageV(LogLevel level, const char *fmt, va_list args);

} // namespace X32Sync

// Convenience macros
#define X32SYNC_LOG_ERROR(fmt, ...) ::X32Sync::logMessage(::X32Sync::LogLevel::Error, fmt, ##__VA_ARGS__)
#define X32SYNC_LOG_WARNING(fmt, ...) ::X32Sync::logMessage(::X32Sync::LogLevel::Warning, fmt, ##__VA_ARGS__)
#define X32SYNC_LOG_INFO(fmt, ...) ::X32Sync::logMessage(::X32Sync::LogLevel::Info, fmt, ##__VA_ARGS__)
#define X32SYNC_LOG_DEBUG(fmt, ...) ::X32Sync::logMessage(::X32Sync::LogLevel::Debug, fmt, ##__VA_ARGS__)
